#pragma once

// envcache/relocate.hpp: Prefix rewrite for a restored environment.
//
// Installed environments embed their absolute install prefix in scripts,
// config files, shebangs and compiled binaries. After extraction under a new
// directory every such occurrence is rewritten:
//
//   text files (no NUL byte)   every occurrence of old_prefix is replaced.
//   binary files               each NUL-terminated string containing
//                              old_prefix is rewritten in place. It may grow
//                              into the NUL run that follows it (installers
//                              pad prefixes out to a placeholder length), and
//                              the rest of that run is refilled with NULs so
//                              offsets do not move. A rewrite that needs more
//                              than the string plus its padding, minus one
//                              terminator, fails.
//   symlinks                   absolute targets under old_prefix are re-pointed.

#include <cstdint>
#include <string>

#include "envcache/types.hpp"

namespace envcache {

struct RelocationReport {
  std::uint64_t text_files{0};
  std::uint64_t binary_files{0};
  std::uint64_t symlinks{0};
  ProvisionError error;  // relocation_failed

  bool ok() const { return error.ok(); }
};

RelocationReport relocate_prefix(const std::string& root,
                                 const std::string& old_prefix,
                                 const std::string& new_prefix);

// In-memory forms, exposed for tests. Return the number of replacements, or
// -1 when a binary rewrite cannot fit.
long replace_text_prefix(std::string& data, const std::string& old_prefix,
                         const std::string& new_prefix);
long replace_binary_prefix(std::string& data, const std::string& old_prefix,
                           const std::string& new_prefix);

}  // namespace envcache
