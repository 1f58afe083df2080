// ─── VeilProxy — URL token codec implementation ─────────────────────────

#include "crypto.h"
#include "crow.h"

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <memory>
#include <vector>

namespace crypto {

namespace {

// scrypt parameters; identical to the defaults the token format was
// introduced with, so a given SECRET_KEY always yields the same key.
constexpr uint64_t kScryptN = 16384;
constexpr uint64_t kScryptR = 8;
constexpr uint64_t kScryptP = 1;
const char kScryptSalt[] = "salt";

struct CipherCtxDeleter {
  void operator()(EVP_CIPHER_CTX *ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

std::string last_openssl_error() {
  unsigned long code = ERR_get_error();
  if (code == 0) return "unknown OpenSSL error";
  char buf[256];
  ERR_error_string_n(code, buf, sizeof(buf));
  return buf;
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════
//  Hex / UTF-8 helpers
// ═══════════════════════════════════════════════════════════════════════

std::string hex_encode(const uint8_t *data, size_t len) {
  static const char hex[] = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (size_t i = 0; i < len; ++i) {
    out += hex[data[i] >> 4];
    out += hex[data[i] & 0x0F];
  }
  return out;
}

std::optional<std::string> hex_decode(const std::string &hex) {
  if (hex.size() % 2 != 0) return std::nullopt;
  std::string out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int hi = hex_value(hex[i]);
    int lo = hex_value(hex[i + 1]);
    if (hi < 0 || lo < 0) return std::nullopt;
    out += static_cast<char>((hi << 4) | lo);
  }
  return out;
}

bool is_valid_utf8(const std::string &value) {
  size_t i = 0;
  const size_t n = value.size();
  while (i < n) {
    unsigned char c = static_cast<unsigned char>(value[i]);
    size_t extra = 0;
    uint32_t cp = 0;
    if (c < 0x80) {
      ++i;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      extra = 1;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      extra = 2;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      extra = 3;
      cp = c & 0x07;
    } else {
      return false;
    }
    if (i + extra >= n) return false;
    for (size_t k = 1; k <= extra; ++k) {
      unsigned char cc = static_cast<unsigned char>(value[i + k]);
      if ((cc & 0xC0) != 0x80) return false;
      cp = (cp << 6) | (cc & 0x3F);
    }
    // Overlong forms, surrogates and out-of-range code points.
    if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) ||
        (extra == 3 && cp < 0x10000) || cp > 0x10FFFF ||
        (cp >= 0xD800 && cp <= 0xDFFF)) {
      return false;
    }
    i += extra + 1;
  }
  return true;
}

std::string random_hex(size_t count) {
  std::vector<uint8_t> bytes(count);
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    throw CodecError("RAND_bytes failed: " + last_openssl_error());
  }
  return hex_encode(bytes.data(), bytes.size());
}

// ═══════════════════════════════════════════════════════════════════════
//  TokenCodec
// ═══════════════════════════════════════════════════════════════════════

TokenCodec::TokenCodec(const std::string &secret) {
  if (EVP_PBE_scrypt(secret.data(), secret.size(),
                     reinterpret_cast<const unsigned char *>(kScryptSalt),
                     sizeof(kScryptSalt) - 1, kScryptN, kScryptR, kScryptP,
                     0, key_.data(), key_.size()) != 1) {
    throw CodecError("scrypt key derivation failed: " + last_openssl_error());
  }
}

std::string TokenCodec::encode(const std::string &absolute_url) const {
  std::array<uint8_t, kIvSize> iv{};
  if (RAND_bytes(iv.data(), static_cast<int>(iv.size())) != 1) {
    throw CodecError("RAND_bytes failed: " + last_openssl_error());
  }

  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) throw CodecError("EVP_CIPHER_CTX_new failed");
  if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key_.data(),
                         iv.data()) != 1) {
    throw CodecError("EVP_EncryptInit_ex failed: " + last_openssl_error());
  }

  std::vector<uint8_t> out(absolute_url.size() + kIvSize);
  int written = 0;
  if (EVP_EncryptUpdate(
          ctx.get(), out.data(), &written,
          reinterpret_cast<const unsigned char *>(absolute_url.data()),
          static_cast<int>(absolute_url.size())) != 1) {
    throw CodecError("EVP_EncryptUpdate failed: " + last_openssl_error());
  }
  int tail = 0;
  if (EVP_EncryptFinal_ex(ctx.get(), out.data() + written, &tail) != 1) {
    throw CodecError("EVP_EncryptFinal_ex failed: " + last_openssl_error());
  }

  return hex_encode(iv.data(), iv.size()) + ":" +
         hex_encode(out.data(), static_cast<size_t>(written + tail));
}

std::optional<std::string> TokenCodec::decode(const std::string &token) const {
  size_t sep = token.find(':');
  if (sep == std::string::npos) return std::nullopt;

  auto iv = hex_decode(token.substr(0, sep));
  auto ciphertext = hex_decode(token.substr(sep + 1));
  if (!iv || iv->size() != kIvSize) return std::nullopt;
  if (!ciphertext || ciphertext->empty() ||
      ciphertext->size() % kIvSize != 0) {
    return std::nullopt;
  }

  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    CROW_LOG_ERROR << "Token decode: EVP_CIPHER_CTX_new failed";
    return std::nullopt;
  }
  if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key_.data(),
                         reinterpret_cast<const unsigned char *>(iv->data())) !=
      1) {
    ERR_clear_error();
    return std::nullopt;
  }

  std::vector<uint8_t> out(ciphertext->size() + kIvSize);
  int written = 0;
  if (EVP_DecryptUpdate(
          ctx.get(), out.data(), &written,
          reinterpret_cast<const unsigned char *>(ciphertext->data()),
          static_cast<int>(ciphertext->size())) != 1) {
    ERR_clear_error();
    return std::nullopt;
  }
  int tail = 0;
  if (EVP_DecryptFinal_ex(ctx.get(), out.data() + written, &tail) != 1) {
    // Bad padding: wrong key, truncated or tampered token.
    ERR_clear_error();
    CROW_LOG_DEBUG << "Token decode: ciphertext rejected";
    return std::nullopt;
  }

  std::string plain(reinterpret_cast<const char *>(out.data()),
                    static_cast<size_t>(written + tail));
  OPENSSL_cleanse(out.data(), out.size());
  if (plain.empty() || !is_valid_utf8(plain)) return std::nullopt;
  for (unsigned char c : plain) {
    if (c < 0x20 || c == 0x7F) return std::nullopt;
  }
  return plain;
}

}  // namespace crypto
