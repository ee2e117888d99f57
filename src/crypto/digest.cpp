#include "crypto/digest.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <sstream>
#include <vector>

namespace slicer::crypto {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  // Initialize new digest context
  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw DigestError("Failed to create hash context");
    }
  }

  // Free the digest context when the object is destroyed
  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  // Access the underlying context
  EVP_MD_CTX* get() { return ctx; }
};

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Sha256::Sha256() : context_(std::make_unique<DigestContext>()) {
  reset();
}

Sha256::~Sha256() = default;

void Sha256::reset() {
  if (!EVP_DigestInit_ex(context_->get(), EVP_sha256(), nullptr)) {
    throw DigestError("Failed to initialize hash context");
  }
}

//==============================================
// HASHING
//==============================================

void Sha256::update(const void* data, size_t length) {
  if (length == 0) {
    return;
  }
  if (!EVP_DigestUpdate(context_->get(), data, length)) {
    throw DigestError("Failed to update hash");
  }
}

Sha256::Digest Sha256::finish() {
  Digest digest{};
  unsigned int digest_len = 0;
  if (!EVP_DigestFinal_ex(context_->get(), digest.data(), &digest_len)) {
    throw DigestError("Failed to finalize hash");
  }
  if (digest_len != DIGEST_SIZE) {
    throw DigestError("Unexpected digest length " + std::to_string(digest_len));
  }
  reset();
  return digest;
}

//==============================================
// ONE-SHOT HELPERS
//==============================================

Sha256::Digest Sha256::hash(const void* data, size_t length) {
  Sha256 sha;
  sha.update(data, length);
  return sha.finish();
}

Sha256::Digest Sha256::hash_stream(std::istream& input) {
  Sha256 sha;
  std::vector<char> buffer(64 * 1024);
  while (input.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || input.gcount() > 0) {
    sha.update(buffer.data(), static_cast<size_t>(input.gcount()));
  }
  if (input.bad()) {
    throw DigestError("Failed to read input stream");
  }
  return sha.finish();
}

std::string Sha256::to_hex(const uint8_t* data, size_t length) {
  // Convert the raw hash bytes to a hexadecimal string
  std::stringstream ss;
  for (size_t i = 0; i < length; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(data[i]);
  }
  return ss.str();
}

} // namespace slicer::crypto
