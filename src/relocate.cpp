#include "envcache/relocate.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <vector>

#include "envcache/spec.hpp"

namespace fs = std::filesystem;

namespace envcache {

namespace {

ProvisionError relocation_error(const std::string& detail) {
  return make_error(ErrorCode::relocation_failed, "restore", detail);
}

bool write_back(const fs::path& p, const std::string& data) {
  std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
  if (!ofs)
    return false;
  ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
  ofs.close();
  return static_cast<bool>(ofs);
}

}  // namespace

long replace_text_prefix(std::string& data, const std::string& old_prefix,
                         const std::string& new_prefix) {
  if (old_prefix.empty())
    return 0;
  long count = 0;
  std::string out;
  size_t pos = 0;
  while (true) {
    const size_t hit = data.find(old_prefix, pos);
    if (hit == std::string::npos)
      break;
    if (count == 0)
      out.reserve(data.size());
    out.append(data, pos, hit - pos);
    out += new_prefix;
    pos = hit + old_prefix.size();
    ++count;
  }
  if (count == 0)
    return 0;
  out.append(data, pos, std::string::npos);
  data = std::move(out);
  return count;
}

long replace_binary_prefix(std::string& data, const std::string& old_prefix,
                           const std::string& new_prefix) {
  if (old_prefix.empty())
    return 0;
  long count = 0;
  size_t pos = 0;
  while (true) {
    const size_t hit = data.find(old_prefix, pos);
    if (hit == std::string::npos)
      break;
    const size_t nul = data.find('\0', hit);
    if (nul == std::string::npos)
      break;  // not a C string; leave it alone

    // The string may grow into the NUL run that follows it, keeping one
    // terminator.
    size_t pad_end = data.find_first_not_of('\0', nul);
    if (pad_end == std::string::npos)
      pad_end = data.size();
    const size_t room = pad_end - hit;

    std::string segment = data.substr(hit, nul - hit);
    const long n = replace_text_prefix(segment, old_prefix, new_prefix);
    if (segment.size() + 1 > room)
      return -1;
    const size_t written = segment.size();
    segment.resize(room, '\0');
    data.replace(hit, room, segment);
    count += n;
    pos = hit + written + 1;
  }
  return count;
}

RelocationReport relocate_prefix(const std::string& root, const std::string& old_prefix,
                                 const std::string& new_prefix) {
  RelocationReport rep;
  if (old_prefix.empty() || old_prefix == new_prefix)
    return rep;

  std::error_code ec;
  std::vector<fs::path> paths;
  for (fs::recursive_directory_iterator it(root, fs::directory_options::none, ec), end;
       it != end; it.increment(ec)) {
    if (ec)
      break;
    paths.push_back(it->path());
  }
  if (ec) {
    rep.error = relocation_error(root + ": " + ec.message());
    return rep;
  }

  for (const auto& p : paths) {
    const auto st = fs::symlink_status(p, ec);
    if (ec) {
      rep.error = relocation_error(p.string() + ": " + ec.message());
      return rep;
    }

    if (fs::is_symlink(st)) {
      const std::string target = fs::read_symlink(p, ec).string();
      if (ec) {
        rep.error = relocation_error(p.string() + ": " + ec.message());
        return rep;
      }
      const bool under = target == old_prefix ||
          (target.size() > old_prefix.size() &&
           target.compare(0, old_prefix.size(), old_prefix) == 0 &&
           target[old_prefix.size()] == '/');
      if (!under)
        continue;
      const std::string repointed = new_prefix + target.substr(old_prefix.size());
      fs::remove(p, ec);
      if (!ec)
        fs::create_symlink(repointed, p, ec);
      if (ec) {
        rep.error = relocation_error(p.string() + ": " + ec.message());
        return rep;
      }
      ++rep.symlinks;
      continue;
    }

    if (!fs::is_regular_file(st))
      continue;

    std::string data;
    if (!read_file_bytes(p.string(), &data)) {
      rep.error = relocation_error(p.string() + ": " + std::strerror(errno));
      return rep;
    }
    if (data.find(old_prefix) == std::string::npos)
      continue;

    const bool binary = data.find('\0') != std::string::npos;
    const long n = binary ? replace_binary_prefix(data, old_prefix, new_prefix)
                          : replace_text_prefix(data, old_prefix, new_prefix);
    if (n < 0) {
      rep.error = relocation_error(p.string() + ": new prefix " + new_prefix +
                                   " does not fit in the padding after " + old_prefix +
                                   " in a binary file");
      return rep;
    }
    if (n == 0)
      continue;
    if (!write_back(p, data)) {
      rep.error = relocation_error(p.string() + ": rewrite failed");
      return rep;
    }
    if (binary)
      ++rep.binary_files;
    else
      ++rep.text_files;
  }
  return rep;
}

}  // namespace envcache
