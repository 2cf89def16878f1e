#pragma once

// trialbox/hash.hpp - BLAKE3 digests for patch and run artifacts.
//
// Digests are lowercase 64-char hex. Patch digests are domain-separated with
// a "patch:" prefix; artifact file digests hash the raw bytes.

#include <optional>
#include <string>
#include <string_view>

namespace trialbox {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
};

std::string blake3_hex(std::string_view payload);
HashRuntimeInfo hash_runtime_info();

// Stream-hash a file (64 KB reads). Returns nullopt if it cannot be opened.
std::optional<std::string> hash_file_blake3_hex(const std::string& path);

std::string hash_domain(std::string_view domain, std::string_view payload);
std::string patch_digest(std::string_view unified_diff);

}  // namespace trialbox
