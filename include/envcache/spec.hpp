#pragma once

// envcache/spec.hpp: Environment specification loading.
//
// Reads the subset of the conda environment.yml format the provisioner needs:
//
//   name: tf-gpu
//   channels:
//     - conda-forge
//   dependencies:
//     - python=3.11
//     - pip:
//       - tensorflow==2.16
//
// The parsed fields are informational (spec key, logging, build arguments).
// Identity is always the fingerprint of the raw bytes, never of the parsed view.

#include <string>

#include "envcache/types.hpp"

namespace envcache {

struct SpecLoadResult {
  EnvironmentSpec spec;
  ProvisionError error;

  bool ok() const { return error.ok(); }
};

// Parse spec content. `path` is recorded as-is.
SpecLoadResult parse_environment_spec(const std::string& content, const std::string& path = "");

// Read and parse a spec file. Missing or unreadable file, or a spec without a
// name, gives spec_unavailable.
SpecLoadResult load_environment_spec(const std::string& path);

// Reads a whole file into *out. Returns false (and sets errno) on failure.
bool read_file_bytes(const std::string& path, std::string* out);

}  // namespace envcache
