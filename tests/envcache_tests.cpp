#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <atomic>
#include <memory>
#include <mutex>
#include <random>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <zstd.h>

#include "envcache/archive.hpp"
#include "envcache/audit.hpp"
#include "envcache/builder.hpp"
#include "envcache/cache_store.hpp"
#include "envcache/config.hpp"
#include "envcache/fingerprint.hpp"
#include "envcache/hash.hpp"
#include "envcache/job.hpp"
#include "envcache/jsonlite.hpp"
#include "envcache/observability.hpp"
#include "envcache/packer.hpp"
#include "envcache/process.hpp"
#include "envcache/provisioner.hpp"
#include "envcache/relocate.hpp"
#include "envcache/spec.hpp"
#include "envcache/unpacker.hpp"
#include "envcache/version.hpp"

namespace fs = std::filesystem;
using namespace envcache;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

std::mutex g_log_lines_mu;
std::vector<std::string> g_log_lines;
void capture_log(const std::string& line) {
  std::lock_guard<std::mutex> lk(g_log_lines_mu);
  g_log_lines.push_back(line);
}

std::vector<ProvisionEvent> g_events;
void capture_event(const ProvisionEvent& ev) { g_events.push_back(ev); }

fs::path make_temp_dir(const std::string& name) {
  const fs::path p = fs::temp_directory_path() /
                     ("envcache_test_" + name + "_" + std::to_string(::getpid()));
  fs::remove_all(p);
  fs::create_directories(p);
  return p;
}

void write_file(const fs::path& p, const std::string& data) {
  fs::create_directories(p.parent_path());
  std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
  ofs << data;
}

std::string read_file(const fs::path& p) {
  std::string out;
  read_file_bytes(p.string(), &out);
  return out;
}

bool contains(const std::string& hay, const std::string& needle) {
  return hay.find(needle) != std::string::npos;
}

bool has_transition(const ProvisionResult& r, ProvisionState s) {
  for (auto t : r.transitions)
    if (t == s) return true;
  return false;
}

bool has_warning(const ProvisionResult& r, ErrorCode code) {
  for (const auto& w : r.warnings)
    if (w.code == code) return true;
  return false;
}

const char* kSpecV1 =
    "name: tf-gpu\n"
    "channels:\n"
    "  - conda-forge\n"
    "dependencies:\n"
    "  - python=3.11\n"
    "  - numpy\n"
    "  - pip\n"
    "  - pip:\n"
    "    - tensorflow==2.16.1\n";

const char* kSpecV2 =
    "name: tf-gpu\n"
    "channels:\n"
    "  - conda-forge\n"
    "dependencies:\n"
    "  - python=3.11\n"
    "  - numpy\n"
    "  - scipy\n"
    "  - pip\n"
    "  - pip:\n"
    "    - tensorflow==2.16.1\n";

// ---------------------------------------------------------------------------
// Fakes
// ---------------------------------------------------------------------------

class CountingHasher : public IHasher {
 public:
  std::string hex_digest(std::string_view payload) const override {
    ++calls;
    return spec_content_hash(payload);
  }
  std::string algorithm() const override { return "blake3-counting"; }
  mutable int calls{0};
};

class FakeCacheStore : public ICacheStore {
 public:
  bool has(const std::string& spec_key, const std::string& fingerprint) const override {
    ++has_calls;
    auto it = records.find(spec_key);
    return it != records.end() && it->second.fingerprint == fingerprint;
  }
  std::optional<CacheRecord> record(const std::string& spec_key) const override {
    auto it = records.find(spec_key);
    if (it == records.end()) return std::nullopt;
    return it->second;
  }
  FetchResult fetch(const std::string& fingerprint) const override {
    ++fetch_calls;
    FetchResult r;
    if (!fetch_error.ok()) {
      r.error = fetch_error;
      return r;
    }
    auto it = blobs.find(fingerprint);
    if (it == blobs.end()) {
      r.error = make_error(ErrorCode::cache_miss, "restore", "no blob");
      return r;
    }
    r.blob = it->second;
    return r;
  }
  ProvisionError put(const std::string& fingerprint, const std::string& blob) override {
    ops.push_back("put:" + fingerprint);
    if (fail_put) return make_error(ErrorCode::cache_commit_failed, "pack", "disk quota exceeded");
    blobs[fingerprint] = blob;
    return {};
  }
  ProvisionError publish_record(const CacheRecord& rec) override {
    ops.push_back("publish:" + rec.spec_key);
    if (fail_publish) return make_error(ErrorCode::cache_commit_failed, "pack", "read-only fs");
    // A record may only point at a blob that is already stored.
    if (!blobs.contains(rec.fingerprint)) dangling_publish = true;
    records[rec.spec_key] = rec;
    return {};
  }
  std::string backend_id() const override { return "fake"; }

  std::map<std::string, CacheRecord> records;
  std::map<std::string, std::string> blobs;
  std::vector<std::string> ops;
  ProvisionError fetch_error;
  bool fail_put{false};
  bool fail_publish{false};
  bool dangling_publish{false};
  mutable int has_calls{0};
  mutable int fetch_calls{0};
};

// Creates a small prefix that embeds its own path in a script, a binary and
// a symlink.
class FakeInstaller : public IInstaller {
 public:
  ProvisionError install_base_runtime(const InstallContext&) override {
    ++base_calls;
    return base_error;
  }
  ProvisionError install_environment(const EnvironmentSpec& spec, const InstallContext& ctx) override {
    ++env_calls;
    if (!env_error.ok()) {
      fs::create_directories(fs::path(ctx.prefix) / "partial");
      return env_error;
    }
    const fs::path prefix(ctx.prefix);
    write_file(prefix / "bin" / "tool", "#!/bin/sh\n# installed into " + ctx.prefix + "\necho " + spec.name + "\n");
    fs::permissions(prefix / "bin" / "tool", fs::perms::owner_all | fs::perms::group_read | fs::perms::others_read);
    std::string bin = std::string("\x7f" "ELF", 4);
    bin += std::string(8, '\0');
    bin += ctx.prefix + "/lib";
    bin.push_back('\0');
    bin += "tail";
    write_file(prefix / "lib" / "libfake.so", bin);
    write_file(prefix / "conda-meta" / "history", "# cmd: create --prefix " + ctx.prefix + "\n");
    fs::create_symlink(prefix / "bin" / "tool", prefix / "bin" / "python");
    return {};
  }
  int base_calls{0};
  int env_calls{0};
  ProvisionError base_error;
  ProvisionError env_error;
};

class FakeArchiver : public IArchiver {
 public:
  PackResult pack(const std::string& root) const override {
    ++pack_calls;
    PackResult r;
    if (fail_pack) {
      r.error = make_error(ErrorCode::pack_failed, "pack", "archiver out of space");
      return r;
    }
    r.blob = "FAKEPACK:" + root;
    return r;
  }
  UnpackResult unpack(const std::string& blob, const std::string& target) const override {
    ++unpack_calls;
    UnpackResult r;
    if (fail_unpack || blob.rfind("FAKEPACK:", 0) != 0) {
      r.error = make_error(ErrorCode::unpack_failed, "restore", "truncated archive");
      fs::create_directories(fs::path(target) / "half");
      return r;
    }
    fs::create_directories(fs::path(target) / "bin");
    r.build_prefix = blob.substr(9);
    return r;
  }
  std::string format_id() const override { return "fake"; }
  bool fail_pack{false};
  bool fail_unpack{false};
  mutable int pack_calls{0};
  mutable int unpack_calls{0};
};

struct Harness {
  fs::path root;
  std::shared_ptr<CountingHasher> hasher = std::make_shared<CountingHasher>();
  std::shared_ptr<FakeCacheStore> store = std::make_shared<FakeCacheStore>();
  std::shared_ptr<FakeInstaller> installer = std::make_shared<FakeInstaller>();
  std::shared_ptr<FakeArchiver> archiver = std::make_shared<FakeArchiver>();
  ProvisionerConfig config;

  explicit Harness(const std::string& name) : root(make_temp_dir(name)) {
    write_file(root / "environment.yml", kSpecV1);
    config.spec_path = (root / "environment.yml").string();
    config.scratch_dir = (root / "scratch").string();
    config.cache_root = (root / "cache").string();
    config.identity.job_id = "1001";
    config.identity.node_id = "node01";
  }

  ProvisionResult run() {
    EnvironmentProvisioner p(config, ProvisionerDeps{hasher, store, installer, archiver});
    return p.run();
  }

  std::string fingerprint_of(const std::string& content) const {
    return spec_content_hash(content);
  }
};

// ============================================================================
// Fingerprinting
// ============================================================================

void test_blake3_known_vectors() {
  expect(blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_fingerprint_determinism() {
  SpecFingerprinter a(std::make_shared<Blake3Hasher>());
  SpecFingerprinter b(std::make_shared<Blake3Hasher>());
  const std::string f1 = a.fingerprint(kSpecV1);
  expect(f1 == a.fingerprint(kSpecV1), "same instance must be deterministic");
  expect(f1 == b.fingerprint(kSpecV1), "separate instances must agree");
  expect(valid_digest(f1), "fingerprint must be 64 lowercase hex chars");
  expect(f1 != blake3_hex(kSpecV1), "fingerprint must be domain-separated");

  const fs::path dir = make_temp_dir("fp_det");
  write_file(dir / "env.yml", kSpecV1);
  const auto r = a.fingerprint_file((dir / "env.yml").string());
  expect(r.ok(), "fingerprint_file must succeed");
  expect(r.fingerprint == f1, "file fingerprint must equal byte fingerprint");
  expect(r.spec.name == "tf-gpu", "spec name parsed");
  fs::remove_all(dir);
}

void test_fingerprint_mutation_sensitivity() {
  SpecFingerprinter fp(std::make_shared<Blake3Hasher>());
  const std::string base = kSpecV1;
  const std::string f0 = fp.fingerprint(base);
  std::mt19937 rng(20240521);
  std::uniform_int_distribution<size_t> pos(0, base.size() - 1);
  std::uniform_int_distribution<int> delta(1, 255);
  for (int i = 0; i < 500; ++i) {
    std::string mutated = base;
    const size_t p = pos(rng);
    mutated[p] = static_cast<char>(static_cast<unsigned char>(mutated[p]) + delta(rng));
    expect(mutated != base, "mutation must change the bytes");
    expect(fp.fingerprint(mutated) != f0, "one-byte mutation must change the fingerprint");
  }
  expect(fp.fingerprint(base + "\n") != f0, "trailing newline must change the fingerprint");
  expect(fp.fingerprint(base.substr(0, base.size() - 1)) != f0, "truncation must change the fingerprint");
}

void test_fingerprint_spec_unavailable() {
  SpecFingerprinter fp(std::make_shared<Blake3Hasher>());
  const auto missing = fp.fingerprint_file("/nonexistent/envcache/environment.yml");
  expect(!missing.ok(), "missing spec must fail");
  expect(missing.error.code == ErrorCode::spec_unavailable, "missing spec is spec_unavailable");

  const fs::path dir = make_temp_dir("fp_noname");
  write_file(dir / "env.yml", "dependencies:\n  - python\n");
  const auto noname = fp.fingerprint_file((dir / "env.yml").string());
  expect(noname.error.code == ErrorCode::spec_unavailable, "spec without name is spec_unavailable");
  expect(noname.error.detail == "spec has no name", "detail names the missing field");

  const auto directory = fp.fingerprint_file(dir.string());
  expect(directory.error.code == ErrorCode::spec_unavailable, "directory is spec_unavailable");
  fs::remove_all(dir);
}

void test_injected_hasher_is_used() {
  auto hasher = std::make_shared<CountingHasher>();
  SpecFingerprinter fp(hasher);
  fp.fingerprint("name: x\n");
  fp.fingerprint("name: y\n");
  expect(hasher->calls == 2, "fingerprinter must hash through the injected capability");
  expect(fp.hasher().algorithm() == "blake3-counting", "hasher accessor returns the injected one");
}

// ============================================================================
// Spec parsing
// ============================================================================

void test_spec_parse_fields() {
  const auto r = parse_environment_spec(
      "# training env\n"
      "name: \"tf-gpu\"   # quoted\n"
      "channels:\n"
      "  - conda-forge\n"
      "  - nvidia\n"
      "\n"
      "dependencies:\n"
      "  - python=3.11\n"
      "  - cudatoolkit=11.8#h123\n"
      "  - pip:\n"
      "    - tensorflow==2.16.1\n"
      "    - keras\n"
      "  - numpy\n"
      "prefix: /opt/old\n");
  expect(r.ok(), "spec must parse");
  expect(r.spec.name == "tf-gpu", "quoted name with comment");
  expect(r.spec.channels.size() == 2 && r.spec.channels[1] == "nvidia", "channels");
  expect(r.spec.dependencies.size() == 3, "conda dependencies incl. one after pip block");
  expect(r.spec.dependencies[1] == "cudatoolkit=11.8#h123", "inline '#' without space is not a comment");
  expect(r.spec.dependencies[2] == "numpy", "pip block ends at outer indentation");
  expect(r.spec.pip_dependencies.size() == 2 && r.spec.pip_dependencies[0] == "tensorflow==2.16.1",
         "pip dependencies");
}

// ============================================================================
// Archive + relocation
// ============================================================================

void test_archive_roundtrip_preserves_tree() {
  const fs::path dir = make_temp_dir("archive_rt");
  const fs::path src = dir / "build" / "env";
  write_file(src / "bin" / "run", "#!/bin/sh\necho ok\n");
  fs::permissions(src / "bin" / "run", fs::perms::owner_all);
  write_file(src / "share" / "empty.txt", "");
  fs::create_directories(src / "include");
  fs::create_symlink("run", src / "bin" / "run-link");

  EnvPackArchiver arch;
  const auto packed = arch.pack(src.string());
  expect(packed.ok(), "pack must succeed: " + packed.error.detail);
  expect(packed.blob.compare(0, 8, "ENVPACK1") == 0, "archive starts with magic");
  expect(arch.pack(src.string()).blob == packed.blob, "packing twice yields identical bytes");

  const fs::path dst = dir / "restore" / "env";
  const auto un = arch.unpack(packed.blob, dst.string());
  expect(un.ok(), "unpack must succeed: " + un.error.detail);
  expect(un.build_prefix == src.string(), "build prefix recorded");
  expect(un.entries == packed.entries, "entry counts agree");
  expect(read_file(dst / "bin" / "run") == "#!/bin/sh\necho ok\n", "file content restored");
  expect((fs::status(dst / "bin" / "run").permissions() & fs::perms::owner_exec) != fs::perms::none,
         "exec bit restored");
  expect(fs::is_directory(dst / "include"), "empty directory restored");
  expect(fs::is_symlink(dst / "bin" / "run-link") && fs::read_symlink(dst / "bin" / "run-link") == "run",
         "relative symlink restored");
  expect(fs::exists(dst / "share" / "empty.txt") && fs::file_size(dst / "share" / "empty.txt") == 0,
         "empty file restored");
  fs::remove_all(dir);
}

void test_archive_rejects_garbage_and_escapes() {
  const fs::path dir = make_temp_dir("archive_bad");
  EnvPackArchiver arch;
  expect(arch.unpack("not an archive", (dir / "a").string()).error.code == ErrorCode::unpack_failed,
         "bad magic is unpack_failed");
  expect(arch.unpack(std::string("ENVPACK1") + "garbage", (dir / "b").string()).error.code ==
             ErrorCode::unpack_failed,
         "bad zstd frame is unpack_failed");

  // Hand-built payload with a "../" entry.
  std::string payload;
  auto u32 = [&](uint32_t v) { for (int i = 0; i < 4; ++i) payload.push_back(static_cast<char>((v >> (8 * i)) & 0xff)); };
  auto u64 = [&](uint64_t v) { for (int i = 0; i < 8; ++i) payload.push_back(static_cast<char>((v >> (8 * i)) & 0xff)); };
  u32(version::ARCHIVE_FORMAT_VERSION);
  const std::string prefix = "/old/env";
  u32(static_cast<uint32_t>(prefix.size()));
  payload += prefix;
  u64(1);
  payload.push_back(1);  // file
  u32(0644);
  const std::string evil = "../escaped.txt";
  u32(static_cast<uint32_t>(evil.size()));
  payload += evil;
  u64(4);
  payload += "evil";
  std::string frame(ZSTD_compressBound(payload.size()), '\0');
  frame.resize(ZSTD_compress(frame.data(), frame.size(), payload.data(), payload.size(), 1));
  const auto r = arch.unpack("ENVPACK1" + frame, (dir / "c").string());
  expect(r.error.code == ErrorCode::unpack_failed, "path escape is unpack_failed");
  expect(!fs::exists(dir / "escaped.txt"), "nothing written outside the target");

  expect(!safe_relative_path("/etc/passwd"), "absolute path unsafe");
  expect(!safe_relative_path("a/../b"), "dot-dot unsafe");
  expect(safe_relative_path("lib/python3.11/site.py"), "plain path safe");
  fs::remove_all(dir);
}

void test_relocation_text_binary_symlink() {
  std::string text = "prefix=/scratch/a/envs/x\nPATH=/scratch/a/envs/x/bin\n";
  expect(replace_text_prefix(text, "/scratch/a/envs/x", "/scratch/bb/envs/x") == 2, "two text hits");
  expect(text == "prefix=/scratch/bb/envs/x\nPATH=/scratch/bb/envs/x/bin\n", "text rewritten");

  std::string bin = std::string("AB") + "/old/prefix/lib" + '\0' + "Z";
  const size_t len = bin.size();
  expect(replace_binary_prefix(bin, "/old/prefix", "/new/pfx") == 1, "one binary hit");
  expect(bin.size() == len, "binary length preserved");
  expect(bin == std::string("AB") + "/new/pfx/lib" + std::string(4, '\0') + "Z", "binary NUL-padded");

  std::string unpadded = std::string("/old") + '\0' + "Z";
  expect(replace_binary_prefix(unpadded, "/old", "/much/longer") == -1, "longer prefix without padding cannot fit");

  // A longer job id still fits in the padding the installer left behind.
  const std::string built = "/scratch/u/job_9999999/envs/tf";
  const std::string moved = "/scratch/u/job_10000000/envs/tf";
  std::string padded = "\x7f" "ELF" + built + "/lib" + std::string(200, '\0') + "tail";
  const size_t padded_len = padded.size();
  expect(replace_binary_prefix(padded, built, moved) == 1, "longer prefix fits in padding");
  expect(padded.size() == padded_len, "padded binary length preserved");
  expect(padded == "\x7f" "ELF" + moved + "/lib" + std::string(199, '\0') + "tail",
         "padding shrinks by the growth");

  std::string tight = built + "/lib" + std::string(1, '\0') + "tail";
  expect(replace_binary_prefix(tight, built, moved) == -1, "growth past the padding fails");

  const fs::path dir = make_temp_dir("reloc");
  const fs::path env = dir / "env";
  const std::string old_prefix = "/b/env";
  const std::string new_prefix = env.string();
  expect(new_prefix.size() > old_prefix.size(), "fixture relocates into a longer prefix");
  write_file(env / "bin" / "script", "#!" + old_prefix + "/bin/python\n");
  write_file(env / "lib" / "lib.so",
             std::string("\x01\x02", 2) + old_prefix + "/lib" + std::string(256, '\0') + "end");
  fs::create_symlink(old_prefix + "/bin/script", env / "bin" / "python");
  fs::create_symlink("/usr/bin/env", env / "bin" / "sysenv");
  fs::create_symlink("script", env / "bin" / "relative");

  const auto rep = relocate_prefix(env.string(), old_prefix, new_prefix);
  expect(rep.ok(), "relocation succeeds: " + rep.error.detail);
  expect(rep.text_files == 1 && rep.binary_files == 1 && rep.symlinks == 1, "one of each rewritten");
  expect(read_file(env / "bin" / "script") == "#!" + new_prefix + "/bin/python\n", "shebang rewritten");
  const std::string lib = read_file(env / "lib" / "lib.so");
  expect(lib.size() == 2 + old_prefix.size() + 4 + 256 + 3, "binary length preserved on disk");
  expect(lib.compare(2, new_prefix.size() + 5, new_prefix + "/lib" + '\0') == 0, "binary points at new prefix");
  expect(lib.compare(lib.size() - 3, 3, "end") == 0, "bytes after the padding untouched");
  expect(fs::read_symlink(env / "bin" / "python").string() == new_prefix + "/bin/script",
         "absolute symlink re-pointed");
  expect(fs::read_symlink(env / "bin" / "sysenv").string() == "/usr/bin/env",
         "symlink outside the prefix untouched");
  expect(fs::read_symlink(env / "bin" / "relative").string() == "script", "relative symlink untouched");

  const fs::path cramped = dir / "cramped";
  write_file(cramped / "lib" / "lib.so", old_prefix + "/lib" + '\0' + "end");
  const auto fail = relocate_prefix(cramped.string(), old_prefix, new_prefix);
  expect(fail.error.code == ErrorCode::relocation_failed, "binary without room is relocation_failed");
  fs::remove_all(dir);
}

void test_unpacker_relocates_and_cleans_up() {
  const fs::path dir = make_temp_dir("unpacker");
  const fs::path build = dir / "s1" / "envs" / "demo";
  write_file(build / "etc" / "conf", "home=" + build.string() + "\n");
  auto arch = std::make_shared<EnvPackArchiver>();
  const auto packed = arch->pack(build.string());
  expect(packed.ok(), "pack");

  EnvironmentUnpacker unpacker(arch);
  const fs::path target = dir / "s2" / "envs" / "demo";
  const auto r = unpacker.unpack(packed.blob, target.string(), "demo", "ff");
  expect(r.ok(), "restore must succeed: " + r.error.detail);
  expect(r.environment.origin == "restored", "origin restored");
  expect(read_file(target / "etc" / "conf") == "home=" + target.string() + "\n", "text relocated");

  const auto bad = unpacker.unpack("ENVPACK1broken", (dir / "s3").string(), "demo", "ff");
  expect(bad.error.code == ErrorCode::unpack_failed, "broken archive is unpack_failed");
  expect(!fs::exists(dir / "s3"), "partial restore removed");
  fs::remove_all(dir);
}

// ============================================================================
// CacheStore
// ============================================================================

void test_cache_store_put_publish_fetch() {
  const fs::path dir = make_temp_dir("store");
  LocalCacheStore store(dir.string());
  const std::string fp = spec_content_hash(kSpecV1);
  expect(!store.has("tf-gpu", fp), "empty store has nothing");
  expect(store.fetch(fp).miss(), "empty store fetch is a miss");

  const std::string blob = "archive-bytes-\x01\x02\x03";
  expect(store.put(fp, blob).ok(), "put succeeds");
  expect(fs::exists(store.archive_path(fp)), "archive written");
  expect(read_file(store.archive_path(fp)).rfind("ENVCACHE-ARCHIVE1 {", 0) == 0, "archive file carries its header");
  expect(contains(store.archive_path(fp), "/archives/" + fp.substr(0, 2) + "/"), "archives sharded by prefix");
  expect(!store.has("tf-gpu", fp), "no record yet means no hit");

  CacheRecord rec;
  rec.spec_key = "tf-gpu";
  rec.fingerprint = fp;
  rec.archive_hash = archive_content_hash(blob);
  rec.archive_size = blob.size();
  rec.record_format = version::RECORD_FORMAT_VERSION;
  rec.hash_algorithm = version::HASH_ALGORITHM_VERSION;
  expect(store.publish_record(rec).ok(), "publish succeeds");
  expect(store.has("tf-gpu", fp), "record names the fingerprint");
  expect(!store.has("tf-gpu", spec_content_hash(kSpecV2)), "other fingerprint is not a hit");
  expect(!store.has("other", fp), "other key is not a hit");

  const auto fr = store.fetch(fp);
  expect(fr.ok() && fr.blob == blob, "fetch returns verified bytes");

  rec.record_format = version::RECORD_FORMAT_VERSION + 1;
  expect(store.publish_record(rec).ok(), "republish");
  expect(!store.has("tf-gpu", fp), "record from another format generation is a miss");

  std::vector<std::string> leftovers;
  for (const auto& e : fs::recursive_directory_iterator(dir))
    if (e.path().filename().string().rfind(".tmp_", 0) == 0) leftovers.push_back(e.path().string());
  expect(leftovers.empty(), "no temp files left behind");
  fs::remove_all(dir);
}

void test_cache_store_detects_corruption() {
  const fs::path dir = make_temp_dir("store_corrupt");
  LocalCacheStore store(dir.string());
  const std::string fp = spec_content_hash("name: a\n");
  expect(store.put(fp, "original archive").ok(), "put");
  std::string stored = read_file(store.archive_path(fp));
  stored.back() = 'X';
  write_file(store.archive_path(fp), stored);
  const auto fr = store.fetch(fp);
  expect(fr.error.code == ErrorCode::cache_read_error, "hash mismatch is cache_read_error");
  expect(!fr.error.transient, "hash mismatch is permanent");
  expect(fr.blob.empty(), "no bytes returned on mismatch");

  write_file(store.archive_path(fp), "original archive");
  expect(store.fetch(fp).error.code == ErrorCode::cache_read_error, "headerless archive is cache_read_error");
  write_file(store.archive_path(fp), "ENVCACHE-ARCHIVE1 {not json\noriginal archive");
  expect(store.fetch(fp).error.code == ErrorCode::cache_read_error, "malformed header is cache_read_error");

  const std::string other_fp = spec_content_hash("name: b\n");
  expect(store.put(other_fp, "original archive").ok(), "put under another fingerprint");
  fs::copy_file(store.archive_path(other_fp), store.archive_path(fp), fs::copy_options::overwrite_existing);
  expect(store.fetch(fp).error.code == ErrorCode::cache_read_error, "header naming another fingerprint rejected");

  expect(store.fetch("../../etc/passwd").error.code == ErrorCode::cache_read_error, "malformed fingerprint rejected");
  expect(store.put("XYZ", "x").code == ErrorCode::cache_commit_failed, "malformed fingerprint put rejected");
  CacheRecord rec;
  rec.spec_key = "../escape";
  rec.fingerprint = fp;
  expect(store.publish_record(rec).code == ErrorCode::cache_commit_failed, "unsafe spec key rejected");
  fs::remove_all(dir);
}

void test_transient_errno_classification() {
  for (int e : {EIO, EAGAIN, EINTR, ESTALE, ETIMEDOUT, EBUSY, ENOLCK})
    expect(is_transient_io_errno(e), "errno " + std::to_string(e) + " is transient");
  for (int e : {EACCES, ENOENT, EISDIR, EINVAL})
    expect(!is_transient_io_errno(e), "errno " + std::to_string(e) + " is permanent");
  expect(valid_spec_key("tf-gpu_2.16"), "ordinary key");
  expect(!valid_spec_key("") && !valid_spec_key("a/b") && !valid_spec_key("..") && !valid_spec_key(".hidden"),
         "unsafe keys rejected");
}

void test_cache_store_prune_and_verify() {
  const fs::path dir = make_temp_dir("store_prune");
  LocalCacheStore store(dir.string());
  const std::string kept_fp = spec_content_hash("name: kept\n");
  const std::string old_fp = spec_content_hash("name: old\n");
  expect(store.put(kept_fp, "kept").ok() && store.put(old_fp, "old").ok(), "puts");
  CacheRecord rec;
  rec.spec_key = "kept";
  rec.fingerprint = kept_fp;
  rec.archive_hash = archive_content_hash("kept");
  rec.record_format = version::RECORD_FORMAT_VERSION;
  rec.hash_algorithm = version::HASH_ALGORITHM_VERSION;
  expect(store.publish_record(rec).ok(), "publish");

  expect(store.list_records().size() == 1, "one record listed");
  expect(store.list_archives().size() == 2, "two archives listed");

  const auto young = store.prune(std::chrono::hours(24 * 30), false);
  expect(young.removed.empty() && young.kept == 2, "young archives kept");

  const auto dry = store.prune(std::chrono::seconds(0), true);
  expect(dry.removed.size() == 1 && dry.removed[0] == old_fp, "dry run reports the unreferenced archive");
  expect(fs::exists(store.archive_path(old_fp)), "dry run removes nothing");

  const auto real = store.prune(std::chrono::seconds(0), false);
  expect(real.removed.size() == 1, "unreferenced archive pruned");
  expect(!fs::exists(store.archive_path(old_fp)), "archive deleted");
  expect(fs::exists(store.archive_path(kept_fp)), "referenced archive survives");

  const auto ok = store.verify("kept", kept_fp);
  expect(ok.record_present && ok.fingerprint_current && ok.archive_intact && ok.archive_matches_record,
         "verify ok");
  const auto stale = store.verify("kept", old_fp);
  expect(!stale.fingerprint_current, "verify reports stale fingerprint");
  expect(store.verify("nothing", "").error.code == ErrorCode::cache_miss, "verify of unknown key");
  fs::remove_all(dir);
}

// ============================================================================
// Builder + installer
// ============================================================================

void test_command_installer_failure_mapping() {
  const fs::path dir = make_temp_dir("installer");
  InstallContext ctx;
  ctx.scratch_dir = dir.string();
  ctx.base_dir = (dir / "base").string();
  ctx.prefix = (dir / "envs" / "demo").string();
  ctx.spec_path = (dir / "env.yml").string();
  ctx.name = "demo";
  ctx.env = {{"PATH", "/usr/bin:/bin"}};

  InstallerConfig cfg;
  cfg.download_command = "exit 4";
  CommandInstaller dl(cfg);
  expect(dl.install_base_runtime(ctx).code == ErrorCode::download_failed, "download failure mapped");

  cfg.download_command = "true";
  cfg.install_command = "echo broken >&2; exit 1";
  CommandInstaller inst(cfg);
  expect(inst.install_base_runtime(ctx).code == ErrorCode::install_failed, "installer failure mapped");

  cfg.install_command = "mkdir -p {base}/bin";
  cfg.bootstrap_command = "test -d {base}/bin";
  cfg.create_command = "echo 'PackagesNotFoundError: nosuchpkg' >&2; exit 1";
  CommandInstaller solver(cfg);
  expect(solver.install_base_runtime(ctx).ok(), "base install succeeds");
  EnvironmentSpec spec;
  spec.name = "demo";
  const auto e = solver.install_environment(spec, ctx);
  expect(e.code == ErrorCode::dependency_resolution_failed, "solver failure mapped");
  expect(contains(e.detail, "PackagesNotFoundError"), "detail carries the solver output");

  cfg.create_command = "mkdir -p {prefix}/bin && echo {name} > {prefix}/bin/name";
  CommandInstaller good(cfg);
  expect(good.install_environment(spec, ctx).ok(), "create succeeds");
  expect(read_file(fs::path(ctx.prefix) / "bin" / "name") == "demo\n", "placeholders substituted");

  expect(expand_command_template("ls {prefix}", InstallContext{"", "", "/a b/it's", "", "", {}}) ==
             "ls '/a b/it'\\''s'",
         "placeholders are shell-quoted");
  expect(classify_install_failure("Could not solve for environment specs") ==
             ErrorCode::dependency_resolution_failed,
         "mamba solver message");
  expect(classify_install_failure("Permission denied") == ErrorCode::install_failed, "other failure");
  fs::remove_all(dir);
}

void test_builder_removes_partial_prefix() {
  const fs::path dir = make_temp_dir("builder");
  auto installer = std::make_shared<FakeInstaller>();
  installer->env_error = make_error(ErrorCode::dependency_resolution_failed, "build", "UnsatisfiableError");
  EnvironmentBuilder builder(installer);
  InstallContext ctx;
  ctx.scratch_dir = dir.string();
  ctx.prefix = (dir / "envs" / "demo").string();
  EnvironmentSpec spec;
  spec.name = "demo";
  const auto r = builder.build(spec, "fp", ctx);
  expect(r.error.code == ErrorCode::dependency_resolution_failed, "error propagated");
  expect(!fs::exists(ctx.prefix), "partial prefix removed");

  installer->env_error = {};
  const auto ok = builder.build(spec, "fp", ctx);
  expect(ok.ok() && ok.environment.origin == "built", "build succeeds");
  expect(fs::exists(fs::path(ctx.prefix) / "bin" / "tool"), "prefix populated");
  fs::remove_all(dir);
}

// ============================================================================
// Provisioner properties
// ============================================================================

void test_hit_restores_never_builds() {
  Harness h("prop_hit");
  const std::string fp = h.fingerprint_of(kSpecV1);
  CacheRecord rec;
  rec.spec_key = "tf-gpu";
  rec.fingerprint = fp;
  h.store->records["tf-gpu"] = rec;
  h.store->blobs[fp] = "FAKEPACK:/old/scratch/envs/tf-gpu";

  const auto r = h.run();
  expect(r.ok(), "hit must be READY");
  expect(r.path_taken == "restore" && r.cache_hit, "path is restore");
  expect(has_transition(r, ProvisionState::restore), "RESTORE visited");
  expect(!has_transition(r, ProvisionState::build) && !has_transition(r, ProvisionState::pack), "BUILD never visited");
  expect(h.installer->base_calls == 0 && h.installer->env_calls == 0, "installer untouched");
  expect(h.store->ops.empty(), "a hit writes nothing to the cache");
  expect(r.environment.origin == "restored" && r.environment.fingerprint == fp, "environment from archive");
  expect(r.environment.prefix == (fs::path(h.config.scratch_dir) / "envs" / "tf-gpu").string(),
         "restored under <scratch>/envs/<name>");
  fs::remove_all(h.root);
}

void test_miss_builds_packs_never_restores() {
  Harness h("prop_miss");
  const auto r = h.run();
  expect(r.ok(), "miss must be READY: " + r.error.detail);
  expect(r.path_taken == "build" && !r.cache_hit, "path is build");
  const std::vector<ProvisionState> want = {ProvisionState::start, ProvisionState::fingerprint,
                                            ProvisionState::cache_miss, ProvisionState::build,
                                            ProvisionState::pack, ProvisionState::ready};
  expect(r.transitions == want, "transition sequence START..READY via BUILD/PACK");
  expect(h.store->fetch_calls == 0 && h.archiver->unpack_calls == 0, "never restores on a miss");
  expect(r.commit_ok, "commit succeeded");
  expect(h.store->records["tf-gpu"].fingerprint == h.fingerprint_of(kSpecV1), "record published");
  expect(fs::exists(activation_script_path(r.environment.prefix)), "activation script written");
  fs::remove_all(h.root);
}

void test_build_failure_is_fatal() {
  Harness h("prop_build_fail");
  h.installer->base_error = make_error(ErrorCode::download_failed, "build", "wget: unable to resolve host");
  const auto r = h.run();
  expect(r.state == ProvisionState::failed, "download failure is FAILED");
  expect(r.error.code == ErrorCode::download_failed && r.error.stage == "build", "typed error with stage");
  expect(r.environment.empty(), "no environment on FAILED");
  expect(!has_transition(r, ProvisionState::restore), "no restore on a miss");
  expect(h.store->ops.empty(), "nothing committed");
  fs::remove_all(h.root);
}

void test_write_ordering_put_before_publish() {
  Harness h("prop_order");
  const auto r = h.run();
  expect(r.ok(), "READY");
  expect(h.store->ops.size() == 2, "two cache writes");
  expect(h.store->ops[0].rfind("put:", 0) == 0 && h.store->ops[1] == "publish:tf-gpu", "put precedes publish");
  expect(!h.store->dangling_publish, "record never points at a missing blob");

  Harness h2("prop_order_fail");
  h2.store->fail_put = true;
  const auto r2 = h2.run();
  expect(r2.ok(), "still READY");
  expect(h2.store->ops.size() == 1 && h2.store->ops[0].rfind("put:", 0) == 0, "no publish after failed put");
  expect(h2.store->records.empty(), "no record published");
  fs::remove_all(h.root);
  fs::remove_all(h2.root);
}

// Two instances commit the same fingerprint built under different scratch
// prefixes while a third keeps restoring.
void test_concurrent_commits_keep_archive_consistent() {
  const fs::path dir = make_temp_dir("store_race");
  LocalCacheStore store(dir.string());
  const std::string fp = spec_content_hash(kSpecV1);
  auto build_under = [](const std::string& prefix) {
    std::string blob = "ENVPACK1" + prefix;
    blob.append(64 * 1024, static_cast<char>(prefix.back()));
    return blob;
  };
  const std::string blob_a = build_under("/scratch/u/job_9999999/envs/tf-gpu");
  const std::string blob_b = build_under("/scratch/u/job_10000000/envs/tf-gpu");

  std::atomic<int> writers_left{2};
  std::atomic<int> commit_failures{0};
  auto writer = [&](const std::string& blob, const std::string& who) {
    CacheRecord rec;
    rec.spec_key = "tf-gpu";
    rec.fingerprint = fp;
    rec.archive_hash = archive_content_hash(blob);
    rec.archive_size = blob.size();
    rec.writer_instance = who;
    rec.record_format = version::RECORD_FORMAT_VERSION;
    rec.hash_algorithm = version::HASH_ALGORITHM_VERSION;
    for (int i = 0; i < 150; ++i) {
      if (!store.put(fp, blob).ok() || !store.publish_record(rec).ok()) ++commit_failures;
    }
    --writers_left;
  };

  int bad_fetches = 0;
  std::string last_error;
  std::thread a(writer, blob_a, "a@node01");
  std::thread b(writer, blob_b, "b@node02");
  while (writers_left.load() > 0) {
    if (!store.has("tf-gpu", fp)) continue;
    const auto fr = store.fetch(fp);
    if (!fr.ok() || (fr.blob != blob_a && fr.blob != blob_b)) {
      ++bad_fetches;
      last_error = fr.error.detail;
    }
  }
  a.join();
  b.join();

  expect(commit_failures.load() == 0, "every commit succeeded");
  expect(bad_fetches == 0, "no hit ever fetched an inconsistent archive: " + last_error);
  const auto final_fetch = store.fetch(fp);
  expect(final_fetch.ok(), "final archive verifies");
  expect(final_fetch.blob == blob_a || final_fetch.blob == blob_b, "final archive is one writer's build");
  const auto rep = store.verify("tf-gpu", fp);
  expect(rep.archive_intact && rep.fingerprint_current, "verify reports the entry intact");
  fs::remove_all(dir);
}

void test_commit_failure_is_not_fatal() {
  Harness h("prop_commit");
  h.store->fail_publish = true;
  const auto r = h.run();
  expect(r.ok(), "commit failure leaves READY");
  expect(!r.commit_ok, "commit_ok false");
  expect(has_warning(r, ErrorCode::cache_commit_failed), "warning carries cache_commit_failed");
  expect(r.error.ok(), "no fatal error");

  Harness p("prop_pack");
  p.archiver->fail_pack = true;
  const auto rp = p.run();
  expect(rp.ok(), "pack failure leaves READY");
  expect(has_warning(rp, ErrorCode::pack_failed), "warning carries pack_failed");
  expect(p.store->ops.empty(), "nothing committed after pack failure");
  fs::remove_all(h.root);
  fs::remove_all(p.root);
}

void test_spec_unavailable_fails() {
  Harness h("prop_nospec");
  h.config.spec_path = (h.root / "missing.yml").string();
  const auto r = h.run();
  expect(r.state == ProvisionState::failed && r.error.code == ErrorCode::spec_unavailable,
         "missing spec is FAILED(spec_unavailable)");
  expect(h.store->has_calls == 0, "no cache lookup without a fingerprint");
  fs::remove_all(h.root);
}

void test_invalid_config_fails() {
  Harness h("prop_config");
  h.config.cache_root = "relative/cache";
  const auto r = h.run();
  expect(r.state == ProvisionState::failed && r.error.code == ErrorCode::config_invalid,
         "relative cache root is config_invalid");
  fs::remove_all(h.root);
}

void test_restore_failure_policy() {
  Harness h("prop_restore_fail");
  const std::string fp = h.fingerprint_of(kSpecV1);
  CacheRecord rec;
  rec.spec_key = "tf-gpu";
  rec.fingerprint = fp;
  h.store->records["tf-gpu"] = rec;
  h.store->blobs[fp] = "FAKEPACK:/old";
  h.archiver->fail_unpack = true;

  const auto closed = h.run();
  expect(closed.state == ProvisionState::failed && closed.error.code == ErrorCode::unpack_failed,
         "fail_closed surfaces unpack_failed");
  expect(h.installer->env_calls == 0, "fail_closed never rebuilds");

  h.config.restore_policy = RestoreFailurePolicy::rebuild;
  const auto rebuilt = h.run();
  expect(rebuilt.ok() && rebuilt.path_taken == "build", "rebuild policy falls through to BUILD");
  expect(rebuilt.restore_fell_back && has_warning(rebuilt, ErrorCode::unpack_failed), "restore error kept as warning");
  expect(has_transition(rebuilt, ProvisionState::restore) && has_transition(rebuilt, ProvisionState::build),
         "both RESTORE and BUILD visited");

  h.store->fetch_error = make_error(ErrorCode::cache_read_error, "restore", "EIO", true);
  h.config.restore_policy = RestoreFailurePolicy::fail_closed;
  const auto transient = h.run();
  expect(transient.error.code == ErrorCode::cache_read_error && transient.error.transient,
         "transient read error surfaced with its flag");
  fs::remove_all(h.root);
}

void test_one_event_per_pass() {
  g_events.clear();
  set_provision_event_hook(capture_event);
  Harness h("events");
  const auto before = global_provision_stats().total.load();
  h.run();
  h.run();
  set_provision_event_hook(nullptr);
  expect(g_events.size() == 2, "one event per run");
  expect(g_events[0].path == "build" && g_events[1].path == "restore", "second pass hits the cache");
  expect(g_events[1].cache_hit && g_events[0].final_state == "ready", "event fields");
  expect(global_provision_stats().total.load() == before + 2, "stats folded");
  fs::remove_all(h.root);
}

// ============================================================================
// Scenarios (real store + archiver)
// ============================================================================

struct Cluster {
  fs::path root;
  std::shared_ptr<LocalCacheStore> store;
  std::shared_ptr<EnvPackArchiver> archiver = std::make_shared<EnvPackArchiver>();
  std::shared_ptr<FakeInstaller> installer = std::make_shared<FakeInstaller>();

  explicit Cluster(const std::string& name) : root(make_temp_dir(name)) {
    store = std::make_shared<LocalCacheStore>((root / "shared").string());
    write_file(root / "submit" / "environment.yml", kSpecV1);
  }

  ProvisionResult instance(const std::string& job, RestoreFailurePolicy policy = RestoreFailurePolicy::fail_closed) {
    ProvisionerConfig c;
    c.spec_path = (root / "submit" / "environment.yml").string();
    c.scratch_dir = (root / ("job" + job)).string();  // equal lengths for binary relocation
    c.cache_root = store->root();
    c.identity.job_id = job;
    c.identity.node_id = "n" + job;
    c.restore_policy = policy;
    EnvironmentProvisioner p(c, ProvisionerDeps{std::make_shared<Blake3Hasher>(), store, installer, archiver});
    return p.run();
  }
};

void test_scenario_first_then_second_instance() {
  Cluster c("scenario_a");
  const auto first = c.instance("1");
  expect(first.ok() && first.path_taken == "build" && first.commit_ok, "first instance builds and commits");
  const auto rec = c.store->record("tf-gpu");
  expect(rec && rec->fingerprint == first.fingerprint, "record names F1");
  expect(rec->writer_instance == "1@n1", "writer instance recorded");
  expect(c.store->fetch(first.fingerprint).ok(), "archive verifies");

  const auto second = c.instance("2");
  expect(second.ok() && second.path_taken == "restore", "second instance restores");
  expect(c.installer->env_calls == 1, "installer ran once in total");
  const fs::path prefix(second.environment.prefix);
  expect(contains(read_file(prefix / "bin" / "tool"), prefix.string()), "script relocated to the new prefix");
  expect(!contains(read_file(prefix / "bin" / "tool"), first.environment.prefix), "no trace of the build prefix");
  expect(contains(read_file(prefix / "lib" / "libfake.so"), prefix.string() + "/lib"), "binary relocated");
  expect(fs::read_symlink(prefix / "bin" / "python") == prefix / "bin" / "tool", "symlink re-pointed");
  expect(fs::exists(activation_script_path(prefix.string())), "restored env activated");
  fs::remove_all(c.root);
}

void test_scenario_edited_spec_misses() {
  Cluster c("scenario_b");
  const auto f1 = c.instance("1");
  expect(f1.ok(), "F1 cached");
  write_file(c.root / "submit" / "environment.yml", kSpecV2);
  const auto f2 = c.instance("2");
  expect(f2.fingerprint != f1.fingerprint, "edited spec has a new fingerprint");
  expect(f2.ok() && f2.path_taken == "build", "edited spec misses and builds");
  expect(c.installer->env_calls == 2, "second build ran");
  expect(c.store->record("tf-gpu")->fingerprint == f2.fingerprint, "record now names F2");
  const auto f3 = c.instance("3");
  expect(f3.path_taken == "restore" && f3.fingerprint == f2.fingerprint, "F2 now hits");
  fs::remove_all(c.root);
}

void test_scenario_record_without_archive() {
  Cluster c("scenario_c");
  const auto f1 = c.instance("1");
  expect(f1.ok(), "F1 cached");
  fs::remove(c.store->archive_path(f1.fingerprint));

  const auto missing = c.instance("2");
  expect(missing.state == ProvisionState::failed, "missing archive under a record is FAILED");
  expect(missing.error.code == ErrorCode::cache_read_error && !missing.error.transient,
         "surfaced as permanent cache_read_error");
  expect(!fs::exists(fs::path(c.root) / "job2" / "envs" / "tf-gpu"), "no environment left behind");

  const auto rebuilt = c.instance("3", RestoreFailurePolicy::rebuild);
  expect(rebuilt.ok() && rebuilt.path_taken == "build" && rebuilt.restore_fell_back, "rebuild policy recovers");
  expect(c.store->fetch(f1.fingerprint).ok(), "rebuild re-committed the archive");

  write_file(c.store->archive_path(f1.fingerprint), "ENVPACK1corrupted");
  const auto corrupt = c.instance("4");
  expect(corrupt.error.code == ErrorCode::cache_read_error, "corrupt archive is cache_read_error");
  fs::remove_all(c.root);
}

// ============================================================================
// Config
// ============================================================================

void test_config_precedence() {
  const std::map<std::string, std::string> env = {
      {"USER", "alice"}, {"SLURM_JOB_ID", "77"}, {"SLURM_SUBMIT_DIR", "/home/alice/proj"},
      {"SLURMD_NODENAME", "gpu03"}, {"SLURM_ARRAY_JOB_ID", "70"}, {"SLURM_ARRAY_TASK_ID", "7"}};
  const auto d = default_config(env);
  expect(d.scratch_dir == "/scratch/alice/job_77", "default scratch from USER and job id");
  expect(d.cache_root == "/home/alice/proj", "default cache root is the submit dir");
  expect(d.identity.instance_id() == "70_7@gpu03", "array identity");
  expect(d.restore_policy == RestoreFailurePolicy::fail_closed, "fail_closed by default");

  const fs::path dir = make_temp_dir("config");
  write_file(dir / "envcache.json",
             "{\"spec\":\"/proj/env.yml\",\"cache_root\":\"/shared/cache\",\"restore_policy\":\"rebuild\","
             "\"workload_env\":{\"TF_USE_LEGACY_KERAS\":\"1\"},"
             "\"installer\":{\"create\":\"mamba env create -f {spec} -p {prefix}\"}}");
  auto withenv = env;
  withenv["ENVCACHE_CACHE_ROOT"] = "/override/cache";
  const auto loaded = load_config((dir / "envcache.json").string(), withenv);
  expect(loaded.ok(), "config loads");
  expect(loaded.config.spec_path == "/proj/env.yml", "file value applied");
  expect(loaded.config.cache_root == "/override/cache", "env overrides file");
  expect(loaded.config.restore_policy == RestoreFailurePolicy::rebuild, "policy from file");
  expect(loaded.config.workload_env.at("TF_USE_LEGACY_KERAS") == "1", "workload env from file");
  expect(loaded.config.installer.create_command == "mamba env create -f {spec} -p {prefix}", "installer template");
  expect(validate_config(loaded.config).ok, "loaded config valid");

  write_file(dir / "bad.json", "{\"restore_policy\":\"sometimes\"}");
  expect(load_config((dir / "bad.json").string(), env).error.code == ErrorCode::config_invalid, "bad policy");
  expect(load_config((dir / "missing.json").string(), env).error.code == ErrorCode::config_invalid, "missing file");
  fs::remove_all(dir);
}

void test_config_validation() {
  ProvisionerConfig c;
  auto v = validate_config(c);
  expect(!v.ok && v.errors.size() >= 3, "empty config reports spec, scratch and cache errors");

  c.spec_path = "/p/env.yml";
  c.scratch_dir = "/scratch/u/job_1";
  c.cache_root = "/scratch/u/job_1/cache";
  v = validate_config(c);
  expect(!v.ok, "cache inside scratch is rejected");

  c.cache_root = "/shared/cache";
  v = validate_config(c);
  expect(v.ok, "valid config: " + v.to_json());

  c.spec_key = "a/b";
  expect(!validate_config(c).ok, "unsafe spec key rejected");
  c.spec_key.clear();

  ProvisionerConfig days = c;
  expect(apply_env_overrides({{"ENVCACHE_RETENTION_DAYS", "90"}}, &days).ok() && days.retention_days == 90,
         "retention days from env");
  expect(apply_env_overrides({{"ENVCACHE_RETENTION_DAYS", "18446744073709551615"}}, &days).ok(),
         "largest 64-bit value parses");
  expect(!validate_config(days).ok, "retention beyond the cap rejected");
  days.retention_days = 90;
  const auto wrapped = apply_env_overrides({{"ENVCACHE_RETENTION_DAYS", "18446744073709551616"}}, &days);
  expect(wrapped.code == ErrorCode::config_invalid, "overflowing retention days rejected");
  expect(days.retention_days == 90, "rejected value leaves the setting alone");
  expect(apply_env_overrides({{"ENVCACHE_RETENTION_DAYS", "99999999999999999999999"}}, &days).code ==
             ErrorCode::config_invalid,
         "far overflow rejected");
}

// ============================================================================
// Process + job runner
// ============================================================================

void test_process_runner() {
  const std::map<std::string, std::string> env = {{"PATH", "/usr/bin:/bin"}, {"GREETING", "hi"}};
  auto ps = shell_process("echo $GREETING; echo err >&2; exit 3", env);
  const auto r = run_process(ps);
  expect(r.exit_code == 3 && !r.timed_out, "exit code propagated");
  expect(r.stdout_text == "hi\n" && r.stderr_text == "err\n", "streams captured separately");

  ProcessSpec missing;
  missing.command = "envcache-no-such-binary";
  missing.env = env;
  const auto m = run_process(missing);
  expect(!m.error_message.empty() && m.exit_code == 127, "unknown command reported");

  auto slow = shell_process("sleep 5", env);
  slow.timeout_ms = 100;
  const auto t = run_process(slow);
  expect(t.timed_out && t.exit_code == 124, "timeout enforced when requested");

  expect(resolve_executable("sh", "/nonexistent:/bin:/usr/bin").size() > 0, "PATH lookup");
  expect(resolve_executable("/abs/path", "") == "/abs/path", "absolute path unchanged");
}

void test_job_runner_failed_never_starts_workload() {
  const fs::path dir = make_temp_dir("job_failed");
  ProvisionerConfig c;
  c.base_env = {{"PATH", "/usr/bin:/bin"}};
  c.identity.submit_dir = dir.string();
  std::ostringstream out, err;
  JobRunner runner(c, out, err);
  JobProvenance prov = runner.begin();

  ProvisionResult failed;
  failed.state = ProvisionState::failed;
  failed.error = make_error(ErrorCode::install_failed, "build", "disk full");
  const int code = runner.run(failed, {"/bin/sh", "-c", "touch " + (dir / "ran").string()}, prov);
  expect(code == kExitProvisionFailed, "FAILED exits with the provisioning failure code");
  expect(!fs::exists(dir / "ran"), "workload never started");
  expect(contains(err.str(), "install_failed"), "typed cause reported");
  expect(contains(out.str(), "UNIX_TIME"), "provenance line printed");
  fs::remove_all(dir);
}

void test_job_runner_runs_workload_in_environment() {
  const fs::path dir = make_temp_dir("job_ready");
  const fs::path prefix = dir / "envs" / "demo";
  write_file(prefix / "bin" / "hello", "#!/bin/sh\necho from-env\n");
  fs::permissions(prefix / "bin" / "hello", fs::perms::owner_all);
  write_file(dir / "job.sh", "#!/bin/bash\n#SBATCH -N 1\nenvcache run -- python train.py\n");

  ProvisionerConfig c;
  c.base_env = {{"PATH", "/usr/bin:/bin"}, {"HOME", dir.string()}};
  c.workload_env = {{"TF_USE_LEGACY_KERAS", "1"}};
  c.identity.submit_dir = dir.string();
  c.identity.job_script = (dir / "job.sh").string();
  c.audit_log_path = (dir / "audit.ndjson").string();

  ProvisionResult ready;
  ready.state = ProvisionState::ready;
  ready.environment = {prefix.string(), "demo", "ab", "built"};

  std::ostringstream out, err;
  JobRunner runner(c, out, err);
  JobProvenance prov = runner.begin();
  expect(prov.job_script_lines == 3, "job script line count");
  expect(prov.job_script_hash == blake3_hex(read_file(dir / "job.sh")), "job script digest");

  const int code = runner.run(
      ready,
      {"/bin/sh", "-c", "hello > out.txt; echo \"$CONDA_PREFIX|$CONDA_DEFAULT_ENV|$TF_USE_LEGACY_KERAS\" >> out.txt; exit 7"},
      prov);
  expect(code == 7, "workload exit code returned");
  const std::string got = read_file(dir / "out.txt");
  expect(got == "from-env\n" + prefix.string() + "|demo|1\n", "PATH, CONDA_* and extra env exported; cwd is submit dir");
  expect(contains(err.str(), "real "), "wall-clock time reported");

  const auto chain = verify_audit_chain(c.audit_log_path);
  expect(chain.ok && chain.entries == 1, "audit entry appended");
  fs::remove_all(dir);
}

void test_activation_env() {
  MaterializedEnvironment env{"/s/envs/x", "x", "ff", "restored"};
  const auto vars = activation_env(env, {{"PATH", "/usr/bin"}, {"CONDA_PREFIX", "/stale"}}, {{"OMP_NUM_THREADS", "4"}});
  expect(vars.at("PATH") == "/s/envs/x/bin:/usr/bin", "prefix bin first on PATH");
  expect(vars.at("CONDA_PREFIX") == "/s/envs/x", "stale CONDA_PREFIX replaced");
  expect(vars.at("OMP_NUM_THREADS") == "4", "extra env applied");
  expect(activation_env(env, {}, {}).at("PATH").rfind("/s/envs/x/bin:", 0) == 0, "PATH default");
}

// ============================================================================
// Audit + logging + JSON
// ============================================================================

void test_audit_chain() {
  const fs::path dir = make_temp_dir("audit");
  const std::string path = (dir / "audit.ndjson").string();
  {
    AuditLog log(path);
    for (int i = 0; i < 3; ++i) {
      JobProvenance p;
      p.job_id = std::to_string(i);
      expect(log.append(p), "append");
      expect(p.sequence == static_cast<uint64_t>(i + 1), "sequence assigned");
    }
    expect(log.entry_count() == 3 && log.failure_count() == 0, "counts");
  }
  {
    AuditLog reopened(path);
    JobProvenance p;
    expect(reopened.append(p) && p.sequence == 4, "sequence continues across processes");
  }
  auto rep = verify_audit_chain(path);
  expect(rep.ok && rep.entries == 4, "chain verifies");

  std::string text = read_file(path);
  const auto pos = text.find("\"job_id\":\"1\"");
  text.replace(pos, 12, "\"job_id\":\"9\"");
  write_file(path, text);
  rep = verify_audit_chain(path);
  expect(!rep.ok && rep.first_bad_line == 3, "edited entry breaks the chain at its successor");

  AuditLog disabled("");
  JobProvenance p;
  expect(disabled.append(p), "disabled log accepts appends");
  fs::remove_all(dir);
}

void test_audit_log_shared_between_instances() {
  const fs::path dir = make_temp_dir("audit_shared");
  const std::string path = (dir / "audit.ndjson").string();

  // Both handles are opened before either writes, as two array tasks would.
  {
    AuditLog task1(path);
    AuditLog task2(path);
    JobProvenance a, b, c;
    expect(task1.append(a) && task2.append(b) && task1.append(c), "interleaved appends");
    expect(a.sequence == 1 && b.sequence == 2 && c.sequence == 3, "each append continues the current head");
  }
  expect(verify_audit_chain(path).ok, "interleaved handles keep one chain");

  constexpr int kPerProcess = 40;
  std::vector<pid_t> children;
  for (int child = 0; child < 2; ++child) {
    const pid_t pid = ::fork();
    expect(pid >= 0, "fork");
    if (pid == 0) {
      AuditLog log(path);
      bool ok = true;
      for (int i = 0; i < kPerProcess; ++i) {
        JobProvenance p;
        p.job_id = std::to_string(child) + "-" + std::to_string(i);
        ok = log.append(p) && ok;
      }
      ::_exit(ok ? 0 : 1);
    }
    children.push_back(pid);
  }
  for (pid_t pid : children) {
    int status = 0;
    expect(::waitpid(pid, &status, 0) == pid, "waitpid");
    expect(WIFEXITED(status) && WEXITSTATUS(status) == 0, "every append in the child succeeded");
  }
  const auto rep = verify_audit_chain(path);
  expect(rep.ok, "concurrent processes keep one chain: " + rep.detail);
  expect(rep.entries == 3 + 2 * kPerProcess, "no entry lost");

  write_file(path, read_file(path) + "not an audit record\n");
  const std::string before = read_file(path);
  AuditLog after_damage(path);
  JobProvenance p;
  expect(!after_damage.append(p), "unreadable head fails the append");
  expect(after_damage.failure_count() == 1 && after_damage.entry_count() == 0, "failure counted");
  expect(read_file(path) == before, "chain not restarted");
  fs::remove_all(dir);
}

void test_structured_logging() {
  g_log_lines.clear();
  set_log_hook(capture_log);
  init_logging(LogConfig{LogLevel::info, ""});
  log_event(LogLevel::debug, "hidden");
  log_event(LogLevel::warn, "cache.commit_failed", {{"detail", "quota \"exceeded\"\n"}});
  expect(g_log_lines.size() == 1, "below-level lines dropped");
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(g_log_lines[0], &err);
  expect(!err, "log line is valid JSON");
  expect(jsonlite::get_string(obj, "level") == "warn" && jsonlite::get_string(obj, "event") == "cache.commit_failed",
         "level and event fields");
  expect(jsonlite::get_string(obj, "detail") == "quota \"exceeded\"\n", "field value round-trips");
  expect(parse_log_level("warning") == LogLevel::warn, "warning alias");
}

void test_result_json_is_valid() {
  Harness h("result_json");
  h.store->fail_publish = true;
  const auto r = h.run();
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(r.to_json(), &err);
  expect(!err, "ProvisionResult JSON parses");
  expect(jsonlite::get_string(obj, "state") == "READY", "state field");
  expect(jsonlite::get_string(obj, "path") == "build", "path field");
  expect(!jsonlite::validate_strict(version::manifest_to_json(version::current_manifest())), "manifest JSON valid");
  fs::remove_all(h.root);
}

void test_json_reader_strictness() {
  std::optional<jsonlite::JsonError> err;
  jsonlite::parse("{\n  \"a\": 1,\n  \"a\": 2\n}", &err);
  expect(err && err->code == "json_duplicate_key", "duplicate key rejected");
  expect(err && err->message.find("line 3") != std::string::npos, "error carries line number");

  expect(jsonlite::validate_strict("{\"n\": 01}").has_value(), "leading zero rejected");
  expect(jsonlite::validate_strict("[NaN]").has_value(), "NaN rejected");
  expect(jsonlite::validate_strict("\"tab\there\"").has_value(), "raw control char rejected");
  expect(jsonlite::validate_strict(std::string(40, '[') + std::string(40, ']')).has_value(),
         "deep nesting rejected");

  const auto obj = jsonlite::parse("{\"s\": \"\\ud83d\\ude00 \\u00e9\", \"m\": {\"A\": \"1\", \"B\": 2}}", &err);
  expect(!err, "surrogate pair parses");
  expect(jsonlite::get_string(obj, "s") == "\xF0\x9F\x98\x80 \xC3\xA9", "surrogate pair decoded to UTF-8");
  const auto m = jsonlite::get_string_map(obj, "m");
  expect(m.size() == 1 && m.at("A") == "1", "string map skips non-strings");
  expect(jsonlite::escape(std::string("a\x01\"")) == "a\\u0001\\\"", "escape control and quote");
}

}  // namespace

int main() {
  std::cout << "=== envcache Test Suite ===\n";
  // Keep provisioning chatter out of the test output.
  set_log_hook(capture_log);

  std::cout << "\n[Fingerprint]\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("fingerprint determinism", test_fingerprint_determinism);
  run_test("one-byte mutation sensitivity", test_fingerprint_mutation_sensitivity);
  run_test("spec unavailable", test_fingerprint_spec_unavailable);
  run_test("injected hasher", test_injected_hasher_is_used);
  run_test("spec parsing", test_spec_parse_fields);

  std::cout << "\n[Archive]\n";
  run_test("archive round trip", test_archive_roundtrip_preserves_tree);
  run_test("archive rejects garbage and escapes", test_archive_rejects_garbage_and_escapes);
  run_test("relocation rules", test_relocation_text_binary_symlink);
  run_test("unpacker relocates and cleans up", test_unpacker_relocates_and_cleans_up);

  std::cout << "\n[CacheStore]\n";
  run_test("put/publish/fetch", test_cache_store_put_publish_fetch);
  run_test("corruption detection", test_cache_store_detects_corruption);
  run_test("errno classification", test_transient_errno_classification);
  run_test("prune and verify", test_cache_store_prune_and_verify);

  std::cout << "\n[Builder]\n";
  run_test("command installer failure mapping", test_command_installer_failure_mapping);
  run_test("builder removes partial prefix", test_builder_removes_partial_prefix);

  std::cout << "\n[Provisioner]\n";
  run_test("hit restores, never builds", test_hit_restores_never_builds);
  run_test("miss builds and packs, never restores", test_miss_builds_packs_never_restores);
  run_test("build failure is fatal", test_build_failure_is_fatal);
  run_test("put before publish", test_write_ordering_put_before_publish);
  run_test("concurrent commits stay consistent", test_concurrent_commits_keep_archive_consistent);
  run_test("commit failure not fatal", test_commit_failure_is_not_fatal);
  run_test("spec unavailable fails", test_spec_unavailable_fails);
  run_test("invalid config fails", test_invalid_config_fails);
  run_test("restore failure policy", test_restore_failure_policy);
  run_test("one event per pass", test_one_event_per_pass);

  std::cout << "\n[Scenarios]\n";
  run_test("first instance builds, second restores", test_scenario_first_then_second_instance);
  run_test("edited spec misses", test_scenario_edited_spec_misses);
  run_test("record without archive", test_scenario_record_without_archive);

  std::cout << "\n[Config]\n";
  run_test("config precedence", test_config_precedence);
  run_test("config validation", test_config_validation);

  std::cout << "\n[Job]\n";
  run_test("process runner", test_process_runner);
  run_test("FAILED never starts workload", test_job_runner_failed_never_starts_workload);
  run_test("workload runs in environment", test_job_runner_runs_workload_in_environment);
  run_test("activation env", test_activation_env);

  std::cout << "\n[Audit + logging]\n";
  run_test("audit chain", test_audit_chain);
  run_test("audit log shared between instances", test_audit_log_shared_between_instances);
  run_test("structured logging", test_structured_logging);
  run_test("result JSON", test_result_json_is_valid);
  run_test("JSON reader strictness", test_json_reader_strictness);

  set_log_hook(nullptr);
  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
