#include "treemirror/fingerprint.hpp"

#include "treemirror/consts.hpp"
#include "treemirror/error.hpp"
#include "treemirror/util.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <limits>
#include <memory>
#include <openssl/evp.h> // EVP_* digest API
#include <set>
#include <stdexcept>
#include <zlib.h>

namespace treemirror {

namespace {

struct EvpCtxFree {
  void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};
using EvpCtx = std::unique_ptr<EVP_MD_CTX, EvpCtxFree>;

EvpCtx evp_start(const EVP_MD *md) {
  EvpCtx ctx{EVP_MD_CTX_new()};
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
  return ctx;
}

// zlib checksums are 32-bit; store them big-endian like the usual hex form
Fingerprint be32(uLong v) {
  return Fingerprint{static_cast<std::uint8_t>((v >> 24) & 0xFF),
                     static_cast<std::uint8_t>((v >> 16) & 0xFF),
                     static_cast<std::uint8_t>((v >> 8) & 0xFF),
                     static_cast<std::uint8_t>(v & 0xFF)};
}

} // namespace

// One running digest computation; fed in chunks, finished once.
class Digester {
public:
  explicit Digester(const FingerprintFunction &fn) : fn_(fn) {
    switch (fn_.backend_) {
    case FingerprintFunction::Backend::Evp:
      ctx_ = evp_start(fn_.md_);
      break;
    case FingerprintFunction::Backend::Crc32:
      sum_ = crc32(0L, Z_NULL, 0);
      break;
    case FingerprintFunction::Backend::Adler32:
      sum_ = adler32(0L, Z_NULL, 0);
      break;
    }
  }

  void update(std::span<const std::uint8_t> data) {
    if (fn_.backend_ == FingerprintFunction::Backend::Evp) {
      if (!data.empty() && EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
      }
      return;
    }
    // zlib takes uInt lengths
    constexpr std::size_t kMax = std::numeric_limits<uInt>::max();
    while (!data.empty()) {
      const auto n = std::min(data.size(), kMax);
      const auto *p = reinterpret_cast<const Bytef *>(data.data());
      sum_ = fn_.backend_ == FingerprintFunction::Backend::Crc32
                 ? crc32(sum_, p, static_cast<uInt>(n))
                 : adler32(sum_, p, static_cast<uInt>(n));
      data = data.subspan(n);
    }
  }

  Fingerprint finish() {
    if (fn_.backend_ != FingerprintFunction::Backend::Evp) {
      return be32(sum_);
    }
    Fingerprint out(fn_.size_);
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &len) != 1) {
      throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    if (len != out.size()) {
      throw std::runtime_error(fn_.name_ + " produced unexpected length");
    }
    return out;
  }

private:
  const FingerprintFunction &fn_;
  EvpCtx ctx_;
  uLong sum_ = 0;
};

FingerprintFunction::FingerprintFunction(std::string name, Backend backend, const evp_md_st *md,
                                         std::size_t size)
    : name_(std::move(name)), backend_(backend), md_(md), size_(size) {}

FingerprintFunction FingerprintFunction::create(std::string_view name) {
  std::string lower = strutil::to_lower(strutil::trim(name));
  if (lower.empty()) {
    throw ConfigurationError("fingerprint algorithm name is empty");
  }
  if (lower == consts::kAlgoCrc32) {
    return {std::move(lower), Backend::Crc32, nullptr, 4};
  }
  if (lower == consts::kAlgoAdler32) {
    return {std::move(lower), Backend::Adler32, nullptr, 4};
  }

  const EVP_MD *md = EVP_get_digestbyname(lower.c_str());
  if (md == nullptr) {
    throw ConfigurationError("unsupported fingerprint algorithm: " + std::string(name));
  }
  // Some names resolve but cannot be initialised (legacy provider not loaded)
  {
    EvpCtx ctx{EVP_MD_CTX_new()};
    if (!ctx || EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) {
      throw ConfigurationError("fingerprint algorithm not available: " + std::string(name));
    }
  }
  const int size = EVP_MD_size(md);
  if (size <= 0) {
    throw ConfigurationError("fingerprint algorithm has no fixed digest size: " +
                             std::string(name));
  }
  return {std::move(lower), Backend::Evp, md, static_cast<std::size_t>(size)};
}

Fingerprint FingerprintFunction::digest(std::span<const std::uint8_t> data) const {
  Digester d{*this};
  d.update(data);
  return d.finish();
}

Fingerprint FingerprintFunction::file(const std::filesystem::path &p) const {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw ReconcileError("hash", p, "cannot open for read");
  }
  Digester d{*this};
  std::vector<char> buf(consts::kChunkSize);
  while (ifs) {
    ifs.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    const auto got = ifs.gcount();
    if (got <= 0)
      break;
    d.update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(buf.data()),
                                           static_cast<std::size_t>(got)));
  }
  if (ifs.bad()) {
    throw ReconcileError("hash", p, "read failed");
  }
  return d.finish();
}

std::string to_hex(const Fingerprint &fp) {
  static constexpr std::array<char, 16> kHex = {'0', '1', '2', '3', '4', '5', '6', '7',
                                                '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
  std::string s;
  s.resize(fp.size() * 2);
  for (std::size_t i = 0; i < fp.size(); ++i) {
    unsigned b = fp[i];
    s[(2 * i) + 0] = kHex[(b >> 4) & 0xF];
    s[(2 * i) + 1] = kHex[b & 0xF];
  }
  return s;
}

std::vector<std::string> supported_algorithms() {
  std::set<std::string> names{std::string(consts::kAlgoCrc32), std::string(consts::kAlgoAdler32)};
  EVP_MD_do_all_sorted(
      [](const EVP_MD *md, const char *from, const char * /*to*/, void *arg) {
        if (md == nullptr || from == nullptr)
          return; // alias entry
        auto *out = static_cast<std::set<std::string> *>(arg);
        std::string lower = strutil::to_lower(from);
        if (lower.find("rsa") != std::string::npos)
          return; // signature aliases, not digests
        out->insert(std::move(lower));
      },
      &names);

  std::vector<std::string> out;
  for (const auto &n : names) {
    try {
      (void)FingerprintFunction::create(n);
      out.push_back(n);
    } catch (const ConfigurationError &) {
      // listed by OpenSSL but not usable with the loaded providers
    }
  }
  return out;
}

} // namespace treemirror
