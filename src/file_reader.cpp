#include "file_reader.hpp"
#include "posix_fd.hpp"
#include <fcntl.h>

bool read_lines(const std::filesystem::path& path,
                std::vector<std::string>& out_lines,
                std::string& msg) {
  out_lines.clear();
  UniqueFd fd(::open(path.string().c_str(), O_RDONLY));
  if (!fd.valid()) { msg = std::string("can not open file: ") + path.string(); return false; }
  std::string data;
  if (!fd.read_all(data)) { msg = std::string("can not read file: ") + path.string(); return false; }
  size_t start = 0;
  for (size_t i = 0; i < data.size(); ++i) {
    if (data[i] == '\n') {
      size_t end = i;
      if (end > start && data[end - 1] == '\r') end--;
      out_lines.emplace_back(data, start, end - start);
      start = i + 1;
    }
  }
  if (start < data.size()) {
    size_t end = data.size();
    if (end > start && data[end - 1] == '\r') end--;
    out_lines.emplace_back(data, start, end - start);
  }
  msg = std::string("read file: ") + path.string();
  return true;
}
