#include "build/piece_commitment.hpp"
#include <algorithm>
#include <cstring>
#include <optional>
#include <vector>
#include <boost/log/trivial.hpp>

namespace slicer::build {

using crypto::Sha256;
using Digest = Sha256::Digest;

namespace {

Digest hash_pair(const Digest& left, const Digest& right) {
  Sha256 sha;
  sha.update(left.data(), left.size());
  sha.update(right.data(), right.size());
  Digest node = sha.finish();
  node[Sha256::DIGEST_SIZE - 1] &= 0x3F;
  return node;
}

// Pending left siblings, one slot per tree level
class MerkleAccumulator {
public:
  void add_leaf(const Digest& leaf) {
    Digest carry = leaf;
    std::size_t level = 0;
    while (level < levels_.size() && levels_[level]) {
      carry = hash_pair(*levels_[level], carry);
      levels_[level].reset();
      level++;
    }
    if (level == levels_.size()) {
      levels_.emplace_back();
    }
    levels_[level] = carry;
  }

  // Closes the tree at the given height, completing missing leaves with zeros
  Digest root(std::size_t height) {
    std::vector<Digest> zero(height + 1);
    zero[0].fill(0);
    for (std::size_t i = 1; i <= height; ++i) {
      zero[i] = hash_pair(zero[i - 1], zero[i - 1]);
    }
    levels_.resize(height + 1);

    std::optional<Digest> carry;
    for (std::size_t level = 0; level < height; ++level) {
      if (levels_[level] && carry) {
        carry = hash_pair(*levels_[level], *carry);
      } else if (levels_[level]) {
        carry = hash_pair(*levels_[level], zero[level]);
      } else if (carry) {
        carry = hash_pair(*carry, zero[level]);
      }
    }
    if (levels_[height]) {
      return *levels_[height];
    }
    return carry ? *carry : zero[height];
  }

private:
  std::vector<std::optional<Digest>> levels_;
};

} // namespace

std::uint64_t PieceCommitment::piece_size_for(std::int64_t payload_size) {
  const std::uint64_t payload = payload_size > 0 ? static_cast<std::uint64_t>(payload_size) : 0;
  const std::uint64_t expanded = (payload * 128 + 126) / 127;
  std::uint64_t piece_size = MIN_PIECE_SIZE;
  while (piece_size < expanded) {
    piece_size <<= 1;
  }
  return piece_size;
}

CommitmentResult PieceCommitment::compute(std::istream& input) {
  if (!input.good()) {
    throw crypto::DigestError("Piece commitment: invalid input stream");
  }

  MerkleAccumulator accumulator;
  CommitmentResult result;

  std::vector<char> buffer(LEAF_SIZE * 4096);
  while (input.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || input.gcount() > 0) {
    const auto bytes_read = static_cast<std::size_t>(input.gcount());
    for (std::size_t offset = 0; offset < bytes_read; offset += LEAF_SIZE) {
      Digest leaf{};
      std::memcpy(leaf.data(), buffer.data() + offset, std::min(LEAF_SIZE, bytes_read - offset));
      accumulator.add_leaf(leaf);
    }
    result.payload_size += static_cast<std::int64_t>(bytes_read);
    // A short read only happens at end of stream, so leaf alignment is preserved
  }
  if (input.bad()) {
    throw crypto::DigestError("Piece commitment: failed to read input stream");
  }

  result.piece_size = piece_size_for(result.payload_size);
  std::size_t height = 0;
  for (std::uint64_t leaves = result.piece_size / LEAF_SIZE; leaves > 1; leaves >>= 1) {
    height++;
  }
  result.root = accumulator.root(height);
  result.commitment_id = "piece-" + Sha256::to_hex(result.root);

  BOOST_LOG_TRIVIAL(debug) << "Piece commitment: " << result.commitment_id << ", payload "
                           << result.payload_size << " bytes, piece " << result.piece_size << " bytes";
  return result;
}

} // namespace slicer::build
