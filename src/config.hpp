#pragma once

/*build-time defaults; every one of them can be overridden from the rc file*/

#ifndef IEA_DEFAULT_CHAR_LIMIT
#define IEA_DEFAULT_CHAR_LIMIT 500
#endif

#ifndef IEA_DEFAULT_TICK_MS
#define IEA_DEFAULT_TICK_MS 500
#endif

#define IEA_MAX_CHAR_LIMIT 100000
#define IEA_MIN_TICK_MS 50
#define IEA_MAX_TICK_MS 10000

#define IEA_RC_NAME ".ieassistrc"
#define IEA_TITLE "Innovation Engine Assistant"
#define IEA_INPUT_ROWS 3
