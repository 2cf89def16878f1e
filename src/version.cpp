#include "trialbox/version.hpp"

#include "trialbox/jsonlite.hpp"

namespace trialbox {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.hash_primitive = "blake3";
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  jsonlite::Object o;
  o["harness_semver"] = m.harness_semver;
  o["attempt_schema"] = m.attempt_schema;
  o["hash_algorithm"] = static_cast<std::uint64_t>(m.hash_algorithm);
  o["hash_primitive"] = m.hash_primitive;
  o["build_timestamp"] = m.build_timestamp;
  return jsonlite::to_json(o);
}

}  // namespace version
}  // namespace trialbox
