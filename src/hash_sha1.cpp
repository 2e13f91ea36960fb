#include "treehop/hash.hpp"
#include "treehop/consts.hpp"

#include <algorithm>
#include <cctype>
#include <openssl/evp.h> // EVP_* digest API
#include <stdexcept>

namespace treehop {

namespace {

// Frees the digest context on every exit path.
struct DigestCtx {
  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  DigestCtx() = default;
  DigestCtx(const DigestCtx &) = delete;
  DigestCtx &operator=(const DigestCtx &) = delete;
  ~DigestCtx() { EVP_MD_CTX_free(ctx); }
};

int nibble(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F')
    return 10 + (c - 'A');
  return -1;
}

} // namespace

oid sha1(std::span<const std::uint8_t> data) {
  DigestCtx d;
  if (!d.ctx)
    throw std::runtime_error("EVP_MD_CTX_new failed");
  if (EVP_DigestInit_ex(d.ctx, EVP_sha1(), nullptr) != 1)
    throw std::runtime_error("EVP_DigestInit_ex(EVP_sha1) failed");
  if (!data.empty() && EVP_DigestUpdate(d.ctx, data.data(), data.size()) != 1)
    throw std::runtime_error("EVP_DigestUpdate failed");

  oid out{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(d.ctx, out.data(), &len) != 1)
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  if (len != out.size())
    throw std::runtime_error("SHA-1 produced unexpected length");
  return out;
}

bool from_hex(std::string_view hex, oid &out) {
  if (hex.size() != consts::kOidHexLen)
    return false;
  for (std::size_t i = 0; i < consts::kOidRawLen; ++i) {
    const int hi = nibble(hex[2 * i]);
    const int lo = nibble(hex[(2 * i) + 1]);
    if (hi < 0 || lo < 0)
      return false;
    out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  return true;
}

bool looks_hex40(std::string_view str) {
  if (str.size() != consts::kOidHexLen)
    return false;
  return std::ranges::all_of(str,
                             [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); });
}

} // namespace treehop
