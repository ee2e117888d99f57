#ifndef SLICER_BUILD_PIECE_COMMITMENT_HPP
#define SLICER_BUILD_PIECE_COMMITMENT_HPP

#include <cstdint>
#include <istream>
#include <string>
#include "crypto/digest.hpp"

namespace slicer::build {

struct CommitmentResult {
  std::string commitment_id;
  crypto::Sha256::Digest root{};
  // Bytes read from the archive
  std::int64_t payload_size = 0;
  // Padded piece size, a power of two
  std::uint64_t piece_size = 0;
};

// Binary merkle commitment over 32-byte leaves. Inner nodes are SHA-256 of the
// concatenated children with the two top bits of the last byte cleared. The
// payload is zero-padded up to piece_size_for(payload) bytes.
class PieceCommitment {
public:
  static constexpr std::size_t LEAF_SIZE = 32;
  static constexpr std::uint64_t MIN_PIECE_SIZE = 128;

  static CommitmentResult compute(std::istream& input);

  // Smallest power of two >= max(128, ceil(payload * 128 / 127))
  static std::uint64_t piece_size_for(std::int64_t payload_size);
  // Payload capacity of a padded piece
  static std::uint64_t unpadded_size(std::uint64_t piece_size) { return piece_size - piece_size / 128; }
};

} // namespace slicer::build

#endif // SLICER_BUILD_PIECE_COMMITMENT_HPP
