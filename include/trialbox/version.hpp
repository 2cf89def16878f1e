#pragma once

// trialbox/version.hpp - Version manifest for every on-disk format.
//
// INVARIANT:
//   Readers of attempts.jsonl and run.json ignore fields they do not know, so
//   adding a field is compatible. Renaming or removing one requires a bump of
//   ATTEMPT_SCHEMA_VERSION.

#include <cstdint>
#include <string>

namespace trialbox {
namespace version {

// ---------------------------------------------------------------------------
// HARNESS_SEMVER
// Written into run.json as harness_version.
// ---------------------------------------------------------------------------
constexpr const char* HARNESS_SEMVER = "0.1.0";

// ---------------------------------------------------------------------------
// ATTEMPT_SCHEMA_VERSION
// schema_version carried by every AttemptRecord line.
// ---------------------------------------------------------------------------
constexpr const char* ATTEMPT_SCHEMA_VERSION = "0.1.0";

// ---------------------------------------------------------------------------
// HASH_ALGORITHM_VERSION
// Version 1 = BLAKE3-256, hex-encoded to 64 chars (patch and artifact digests).
// ---------------------------------------------------------------------------
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

struct VersionManifest {
  std::string harness_semver{HARNESS_SEMVER};
  std::string attempt_schema{ATTEMPT_SCHEMA_VERSION};
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  std::string hash_primitive;
  std::string build_timestamp;
};

VersionManifest current_manifest();

std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace trialbox
