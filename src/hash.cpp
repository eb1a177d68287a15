#include "storyflow/hash.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <openssl/evp.h> // EVP_* digest API
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <zlib.h>

namespace storyflow {

namespace {

struct MdCtxFree {
  void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxFree>;

constexpr std::array<char, 16> kHex = {'0', '1', '2', '3', '4', '5', '6', '7',
                                       '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};

} // namespace

digest sha1(std::span<const std::uint8_t> data) {
  MdCtx ctx{EVP_MD_CTX_new()};
  if (!ctx)
    throw std::runtime_error("sha1: cannot allocate digest context");

  digest out{};
  unsigned int len = 0;
  const bool ok = EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr) == 1 &&
                  (data.empty() || EVP_DigestUpdate(ctx.get(), data.data(), data.size()) == 1) &&
                  EVP_DigestFinal_ex(ctx.get(), out.data(), &len) == 1;
  if (!ok || len != out.size())
    throw std::runtime_error("sha1: digest failed");
  return out;
}

std::string to_hex(const digest &d) {
  std::string s;
  s.resize(d.size() * 2);
  for (std::size_t i = 0; i < d.size(); ++i) {
    unsigned b = d[i];
    s[(2 * i) + 0] = kHex[(b >> 4) & 0xF];
    s[(2 * i) + 1] = kHex[b & 0xF];
  }
  return s;
}

std::string crc32_hex(std::string_view data) {
  uLong crc = ::crc32(0L, Z_NULL, 0);
  crc = ::crc32(crc, reinterpret_cast<const Bytef *>(data.data()), static_cast<uInt>(data.size()));
  std::string s(8, '0');
  for (int i = 7; i >= 0; --i) {
    s[static_cast<std::size_t>(i)] = kHex[crc & 0xF];
    crc >>= 4;
  }
  return s;
}

} // namespace storyflow
