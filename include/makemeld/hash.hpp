#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

struct evp_md_ctx_st; // OpenSSL EVP_MD_CTX

namespace makemeld {

// Raw 20-byte SHA-1 digest (binary, not hex)
using digest = std::array<std::uint8_t, 20>;

/**
 * Incremental SHA-1 over OpenSSL's EVP interface.
 * finish() may be called once; a finished hasher throws on further use.
 */
class Sha1 {
public:
  Sha1();
  ~Sha1();
  Sha1(Sha1 &&) noexcept;
  Sha1 &operator=(Sha1 &&) noexcept;

  void update(std::span<const std::uint8_t> data);
  void update(std::string_view s) {
    update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()),
                                         s.size()));
  }
  digest finish();

private:
  struct ctx_free {
    void operator()(evp_md_ctx_st *ctx) const noexcept;
  };
  std::unique_ptr<evp_md_ctx_st, ctx_free> ctx_;
};

digest sha1(std::span<const std::uint8_t> data);

inline digest sha1(std::string_view s) {
  Sha1 h;
  h.update(s);
  return h.finish();
}

/** Convert binary digest to 40-char lowercase hex. */
std::string to_hex(const digest &id);

/**
 * Identity of a Makefile text as shown in reports: its SHA-1 and line count.
 * Lets a reader tell which revision of each file a report was made from.
 */
struct Fingerprint {
  digest id{};
  std::size_t lines = 0;

  // First consts::kDigestShortLen hex chars of the digest.
  std::string short_hex() const;
  // "sha1 <short>, <n> lines"
  std::string describe() const;
};

Fingerprint fingerprint(std::string_view text);

} // namespace makemeld
