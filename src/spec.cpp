#include "envcache/spec.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

namespace envcache {

namespace {

std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r");
  if (b == std::string::npos)
    return {};
  const auto e = s.find_last_not_of(" \t\r");
  return s.substr(b, e - b + 1);
}

std::string strip_comment(const std::string& line) {
  // A '#' starts a comment only at line start or after whitespace, so
  // "pkg=1.0#build" survives.
  for (size_t i = 0; i < line.size(); ++i) {
    if (line[i] == '#' && (i == 0 || line[i - 1] == ' ' || line[i - 1] == '\t'))
      return line.substr(0, i);
  }
  return line;
}

std::string unquote(const std::string& s) {
  if (s.size() >= 2 && ((s.front() == '"' && s.back() == '"') ||
                        (s.front() == '\'' && s.back() == '\'')))
    return s.substr(1, s.size() - 2);
  return s;
}

size_t indent_of(const std::string& line) {
  size_t n = 0;
  while (n < line.size() && (line[n] == ' ' || line[n] == '\t'))
    ++n;
  return n;
}

}  // namespace

bool read_file_bytes(const std::string& path, std::string* out) {
  FILE* f = std::fopen(path.c_str(), "rb");
  if (!f)
    return false;
  std::string data;
  char buf[65536];
  size_t n = 0;
  while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0)
    data.append(buf, n);
  const bool failed = std::ferror(f) != 0;
  const int saved = errno;
  std::fclose(f);
  if (failed) {
    errno = saved == 0 ? EIO : saved;
    return false;
  }
  *out = std::move(data);
  return true;
}

SpecLoadResult parse_environment_spec(const std::string& content, const std::string& path) {
  SpecLoadResult r;
  r.spec.path = path;
  r.spec.content = content;

  enum class Section { none, channels, dependencies, pip, other };
  Section section = Section::none;
  size_t pip_indent = 0;

  std::istringstream in(content);
  std::string raw;
  while (std::getline(in, raw)) {
    const std::string line = strip_comment(raw);
    const std::string t = trim(line);
    if (t.empty())
      continue;
    const size_t indent = indent_of(line);

    if (indent == 0 && t[0] != '-') {
      const auto colon = t.find(':');
      if (colon == std::string::npos) {
        section = Section::other;
        continue;
      }
      const std::string key = trim(t.substr(0, colon));
      const std::string value = unquote(trim(t.substr(colon + 1)));
      if (key == "name") {
        r.spec.name = value;
        section = Section::none;
      } else if (key == "channels") {
        section = Section::channels;
      } else if (key == "dependencies") {
        section = Section::dependencies;
      } else {
        section = Section::other;
      }
      continue;
    }

    if (t[0] != '-')
      continue;
    std::string item = unquote(trim(t.substr(1)));

    if (section == Section::pip && indent <= pip_indent)
      section = Section::dependencies;

    switch (section) {
      case Section::channels:
        if (!item.empty())
          r.spec.channels.push_back(item);
        break;
      case Section::dependencies:
        if (item == "pip:" || item.rfind("pip:", 0) == 0) {
          section = Section::pip;
          pip_indent = indent;
        } else if (!item.empty()) {
          r.spec.dependencies.push_back(item);
        }
        break;
      case Section::pip:
        if (!item.empty())
          r.spec.pip_dependencies.push_back(item);
        break;
      default:
        break;
    }
  }

  if (r.spec.name.empty())
    r.error = make_error(ErrorCode::spec_unavailable, "fingerprint", "spec has no name");
  return r;
}

SpecLoadResult load_environment_spec(const std::string& path) {
  SpecLoadResult r;
  if (path.empty()) {
    r.error = make_error(ErrorCode::spec_unavailable, "fingerprint", "no spec path configured");
    return r;
  }
  std::error_code ec;
  fs::path canonical = fs::weakly_canonical(fs::absolute(path, ec), ec);
  const std::string resolved = ec ? path : canonical.string();

  if (fs::is_directory(resolved, ec)) {
    r.spec.path = resolved;
    r.error = make_error(ErrorCode::spec_unavailable, "fingerprint",
                         resolved + ": is a directory");
    return r;
  }

  std::string content;
  if (!read_file_bytes(resolved, &content)) {
    r.spec.path = resolved;
    r.error = make_error(ErrorCode::spec_unavailable, "fingerprint",
                         resolved + ": " + std::strerror(errno));
    return r;
  }
  return parse_environment_spec(content, resolved);
}

}  // namespace envcache
