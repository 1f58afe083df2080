#pragma once
// ─── VeilProxy — URL token codec ────────────────────────────────────────
// Turns an absolute destination URL into an opaque, routable path segment
// and back.  Tokens are `hex(iv) ":" hex(ciphertext)` under AES-256-CBC
// with a fresh random IV per call; the key is derived once from the
// process secret with scrypt.

#include <array>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace crypto {

// Raised when the cipher primitive itself fails (key derivation, RNG,
// EVP context).  Never raised for a bad token: decode() reports those by
// returning std::nullopt.
class CodecError : public std::runtime_error {
 public:
  explicit CodecError(const std::string &what) : std::runtime_error(what) {}
};

class TokenCodec {
 public:
  static constexpr size_t kKeySize = 32;
  static constexpr size_t kIvSize = 16;

  // Derives the AES key from `secret`.  Throws CodecError on failure.
  explicit TokenCodec(const std::string &secret);

  // Precondition: `absolute_url` is a valid http(s) URL (callers check).
  // Two calls with the same input return different tokens.
  std::string encode(const std::string &absolute_url) const;

  // Returns std::nullopt for malformed tokens, tokens minted under another
  // key, corrupted ciphertext, or plaintext that is not clean UTF-8.
  std::optional<std::string> decode(const std::string &token) const;

 private:
  std::array<uint8_t, kKeySize> key_{};
};

/// Generate `count` random bytes rendered as lowercase hex (2*count chars).
/// Used for the fallback process secret.  Throws CodecError if the RNG
/// fails.
std::string random_hex(size_t count);

std::string hex_encode(const uint8_t *data, size_t len);
std::optional<std::string> hex_decode(const std::string &hex);

bool is_valid_utf8(const std::string &value);

}  // namespace crypto
