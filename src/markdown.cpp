#include "markdown.hpp"
#include "posix_fd.hpp"
#include <fcntl.h>
#include <sys/stat.h>
#include <algorithm>
#include <cctype>
#include <sstream>

static const char* const kFence = "```";

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return s.substr(i, j - i);
}

std::vector<Fence> collect_fences(const std::string& doc) {
  std::vector<Fence> out;
  std::istringstream iss(doc);
  std::string line;
  int row = 0;
  bool open = false;
  while (std::getline(iss, line)) {
    std::string t = trim(line);
    if (t.rfind(kFence, 0) == 0) {
      if (!open) {
        out.push_back(Fence{row, -1, trim(t.substr(3))});
        open = true;
      } else if (t == kFence) {
        out.back().close_line = row;
        open = false;
      }
    }
    row++;
  }
  return out;
}

bool fences_well_formed(const std::string& doc) {
  static const std::vector<std::string> langs = {"bash", "sh", "yaml", "json"};
  for (const auto& f : collect_fences(doc)) {
    if (f.close_line < 0) return false;
    if (std::find(langs.begin(), langs.end(), f.lang) == langs.end()) return false;
  }
  return true;
}

std::string first_heading(const std::string& doc) {
  std::istringstream iss(doc);
  std::string line;
  bool in_fence = false;
  while (std::getline(iss, line)) {
    std::string t = trim(line);
    if (t.rfind(kFence, 0) == 0) { in_fence = !in_fence; continue; }
    if (in_fence || t.empty() || t[0] != '#') continue;
    size_t i = 0; while (i < t.size() && t[i] == '#') i++;
    return trim(t.substr(i));
  }
  return std::string();
}

std::string slugify(const std::string& text) {
  std::string out;
  bool dash = false;
  for (unsigned char c : text) {
    if (std::isalnum(c)) {
      if (dash && !out.empty()) out.push_back('-');
      out.push_back(static_cast<char>(std::tolower(c)));
      dash = false;
    } else {
      dash = true;
    }
  }
  return out.empty() ? std::string("document") : out;
}

std::filesystem::path export_path_for(const std::filesystem::path& dir, const std::string& doc) {
  std::string base = slugify(first_heading(doc));
  std::filesystem::path p = dir / (base + ".md");
  std::error_code ec;
  for (int n = 2; std::filesystem::exists(p, ec); ++n) {
    p = dir / (base + "-" + std::to_string(n) + ".md");
  }
  return p;
}

// Conversational preamble before the first heading is not part of the document.
static std::string document_body(const std::string& doc) {
  if (doc.rfind("#", 0) == 0) return doc;
  size_t pos = doc.find("\n#");
  return pos == std::string::npos ? doc : doc.substr(pos + 1);
}

bool write_document(const std::filesystem::path& path, const std::string& doc, std::string& msg) {
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  UniqueFd ufd(::open(tmp.string().c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
  if (!ufd.valid()) {
    msg = std::string("save failed: ") + tmp.string();
    return false;
  }
  std::string body = document_body(doc);
  if (body.empty() || body.back() != '\n') body.push_back('\n');
  if (!ufd.write_all(body.data(), body.size())) { msg = std::string("save failed: ") + tmp.string(); return false; }
  if (!ufd.sync()) { msg = std::string("save failed: ") + tmp.string(); return false; }
  ufd.reset();
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    msg = std::string("save failed: ") + path.string();
    return false;
  }
  msg = std::string("saved document: ") + path.string();
  return true;
}
