#ifndef SLICER_CRYPTO_DIGEST_HPP
#define SLICER_CRYPTO_DIGEST_HPP

#include <array>
#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include "crypto_error.hpp"

namespace slicer::crypto {

// Forward declaration for OpenSSL digest context
struct DigestContext;

// Incremental SHA-256 over OpenSSL EVP
class Sha256 {
public:
  static constexpr size_t DIGEST_SIZE = 32;
  using Digest = std::array<uint8_t, DIGEST_SIZE>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Sha256();
  ~Sha256();
  Sha256(const Sha256&) = delete;
  Sha256& operator=(const Sha256&) = delete;


  // ---- HASHING ----
  void update(const void* data, size_t length);
  // Finalizes the digest; the object is reset and may be reused afterwards
  Digest finish();


  // ---- ONE-SHOT HELPERS ----
  static Digest hash(const void* data, size_t length);
  static Digest hash_stream(std::istream& input);
  static std::string to_hex(const uint8_t* data, size_t length);
  static std::string to_hex(const Digest& digest) { return to_hex(digest.data(), digest.size()); }

private:
  // ---- PARAMETERS ----
  std::unique_ptr<DigestContext> context_;

  void reset();
};

} // namespace slicer::crypto

#endif // SLICER_CRYPTO_DIGEST_HPP
