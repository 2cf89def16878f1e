#include "trialbox/hash.hpp"

#include <array>
#include <cstdint>
#include <fstream>

extern "C" {
#include <blake3.h>
}

namespace trialbox {
namespace {

constexpr std::size_t kFileChunk = 64 * 1024;

// Incremental BLAKE3 state producing lowercase hex.
class Digest {
 public:
  Digest() { blake3_hasher_init(&state_); }

  Digest& feed(const void* data, std::size_t len) {
    if (len > 0) blake3_hasher_update(&state_, data, len);
    return *this;
  }
  Digest& feed(std::string_view bytes) { return feed(bytes.data(), bytes.size()); }

  std::string hex() {
    static constexpr char digits[] = "0123456789abcdef";
    std::array<std::uint8_t, BLAKE3_OUT_LEN> raw{};
    blake3_hasher_finalize(&state_, raw.data(), raw.size());
    std::string out;
    out.reserve(raw.size() * 2);
    for (const std::uint8_t b : raw) {
      out.push_back(digits[b >> 4]);
      out.push_back(digits[b & 0x0f]);
    }
    return out;
  }

 private:
  blake3_hasher state_;
};

}  // namespace

HashRuntimeInfo hash_runtime_info() { return HashRuntimeInfo{"blake3", blake3_version()}; }

std::string blake3_hex(std::string_view payload) { return Digest().feed(payload).hex(); }

std::optional<std::string> hash_file_blake3_hex(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return std::nullopt;
  Digest digest;
  std::array<char, kFileChunk> chunk{};
  do {
    in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    digest.feed(chunk.data(), static_cast<std::size_t>(in.gcount()));
  } while (in);
  if (in.bad()) return std::nullopt;
  return digest.hex();
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  return Digest().feed(domain).feed(payload).hex();
}

std::string patch_digest(std::string_view unified_diff) { return hash_domain("patch:", unified_diff); }

}  // namespace trialbox
