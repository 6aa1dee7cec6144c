#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

struct evp_md_st; // OpenSSL's EVP_MD

namespace treemirror {

// Digest bytes; size depends on the algorithm (16 for md5, 4 for crc32, ...)
using Fingerprint = std::vector<std::uint8_t>;

/**
 * Deterministic content fingerprint selected by name.
 *
 * Cryptographic names ("md5", "sha256", "blake2b512", ...) resolve through
 * OpenSSL's EVP digest table; "crc32" and "adler32" are served by zlib.
 * Construction fails with ConfigurationError for names this machine cannot
 * compute, so an unsupported algorithm is caught before the first pass.
 */
class FingerprintFunction {
public:
  // Name is matched case-insensitively.
  static auto create(std::string_view name) -> FingerprintFunction;

  [[nodiscard]] const std::string &name() const { return name_; }
  [[nodiscard]] auto size() const -> std::size_t { return size_; }

  [[nodiscard]] auto digest(std::span<const std::uint8_t> data) const -> Fingerprint;

  // Convenience overload for string-like input (no copy).
  [[nodiscard]] Fingerprint digest(std::string_view s) const {
    return digest(
        std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
  }

  // Streams the whole file; never samples. Throws ReconcileError if unreadable.
  [[nodiscard]] auto file(const std::filesystem::path &p) const -> Fingerprint;

private:
  enum class Backend : std::uint8_t { Evp, Crc32, Adler32 };
  friend class Digester;

  FingerprintFunction(std::string name, Backend backend, const evp_md_st *md, std::size_t size);

  std::string name_;
  Backend backend_;
  const evp_md_st *md_; // owned by OpenSSL's static table
  std::size_t size_;
};

/** Lowercase hex rendering of a fingerprint. */
std::string to_hex(const Fingerprint &fp);

// Every name create() accepts on this machine, sorted.
std::vector<std::string> supported_algorithms();

} // namespace treemirror
