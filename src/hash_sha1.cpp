#include "makemeld/hash.hpp"
#include "makemeld/consts.hpp"

#include <algorithm>
#include <openssl/evp.h> // EVP_* digest API
#include <stdexcept>

namespace makemeld {

void Sha1::ctx_free::operator()(EVP_MD_CTX *ctx) const noexcept { EVP_MD_CTX_free(ctx); }

Sha1::Sha1() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_)
    throw std::runtime_error("EVP_MD_CTX_new failed");
  if (EVP_DigestInit_ex(ctx_.get(), EVP_sha1(), nullptr) != 1)
    throw std::runtime_error("EVP_DigestInit_ex(EVP_sha1) failed");
}

Sha1::~Sha1() = default;
Sha1::Sha1(Sha1 &&) noexcept = default;
Sha1 &Sha1::operator=(Sha1 &&) noexcept = default;

void Sha1::update(std::span<const std::uint8_t> data) {
  if (!ctx_)
    throw std::logic_error("Sha1::update after finish");
  if (!data.empty() && EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1)
    throw std::runtime_error("EVP_DigestUpdate failed");
}

digest Sha1::finish() {
  if (!ctx_)
    throw std::logic_error("Sha1::finish called twice");
  digest out{};
  unsigned int len = 0;
  const int ok = EVP_DigestFinal_ex(ctx_.get(), out.data(), &len);
  ctx_.reset();
  if (ok != 1)
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  if (len != out.size())
    throw std::runtime_error("SHA-1 produced unexpected length");
  return out;
}

digest sha1(std::span<const std::uint8_t> data) {
  Sha1 h;
  h.update(data);
  return h.finish();
}

std::string to_hex(const digest &id) {
  static constexpr std::string_view kHex = "0123456789abcdef";
  std::string s(consts::kDigestHexLen, '0');
  for (std::size_t i = 0; i < consts::kDigestRawLen; ++i) {
    s[2 * i] = kHex[id[i] >> 4];
    s[2 * i + 1] = kHex[id[i] & 0xF];
  }
  return s;
}

std::string Fingerprint::short_hex() const {
  return to_hex(id).substr(0, consts::kDigestShortLen);
}

std::string Fingerprint::describe() const {
  return "sha1 " + short_hex() + ", " + std::to_string(lines) + " lines";
}

// A final line without a newline still counts.
Fingerprint fingerprint(std::string_view text) {
  Fingerprint fp;
  fp.id = sha1(text);
  fp.lines = static_cast<std::size_t>(std::ranges::count(text, '\n'));
  if (!text.empty() && text.back() != '\n')
    ++fp.lines;
  return fp;
}

} // namespace makemeld
