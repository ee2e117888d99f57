#include "build/build_callback.hpp"
#include <chrono>
#include <boost/log/trivial.hpp>
#include "build/build_error.hpp"
#include "build/piece_commitment.hpp"
#include "crypto/crypto_error.hpp"

namespace slicer::build {

namespace {

[[noreturn]] void raise(const std::exception& error) {
  BOOST_LOG_TRIVIAL(error) << "Build: Slice build failed: " << error.what();
  throw BuildError(std::string("slice build failed: ") + error.what());
}

} // namespace

std::unique_ptr<BuildCallback> make_build_callback(CallbackKind kind, const CallbackOptions& options) {
  switch (kind) {
    case CallbackKind::CommitmentRecording:
      return std::make_unique<CommitmentRecordingCallback>(options);
    case CallbackKind::ManifestOnly:
      return std::make_unique<ManifestOnlyCallback>(options);
    case CallbackKind::Discard:
      return std::make_unique<DiscardCallback>();
  }
  throw BuildError("unknown callback kind");
}


//==============================================
// COMMITMENT RECORDING
//==============================================

CommitmentRecordingCallback::CommitmentRecordingCallback(const CallbackOptions& options)
  : options_(options)
  , archives_(options.car_dir)
  , manifest_(options.car_dir / MANIFEST_FILE_NAME,
              {"payload_cid", "filename", "piece_cid", "payload_size", "piece_size", "detail"}) {}

void CommitmentRecordingCallback::on_success(const SliceArchive& archive, const std::string& slice_name,
                                             const std::string& content_id, const std::string& detail) {
  try {
    BOOST_LOG_TRIVIAL(info) << "Build: Calculating piece commitment for " << slice_name;
    auto started = std::chrono::steady_clock::now();
    CommitmentResult commitment;
    {
      auto in = archive.open();
      commitment = PieceCommitment::compute(in);
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
    BOOST_LOG_TRIVIAL(info) << "Build: Piece commitment " << commitment.commitment_id << ", payload size "
                            << commitment.payload_size << ", piece size " << commitment.piece_size
                            << ", took " << elapsed.count() << " ms";

    const std::string key = commitment.commitment_id + ".car";
    if (archives_.has(key)) {
      BOOST_LOG_TRIVIAL(warning) << "Build: Archive " << key << " already exists, replacing it";
    }
    {
      auto in = archive.open();
      archives_.store(key, in);
    }
    if (options_.add_padding) {
      archives_.pad(key, PieceCommitment::unpadded_size(commitment.piece_size));
    }
    if (options_.rename) {
      archives_.rename(key, commitment.commitment_id);
    }

    manifest_.append({content_id, slice_name, commitment.commitment_id,
                      std::to_string(commitment.payload_size), std::to_string(commitment.piece_size), detail});

    if (options_.repository) {
      store::ManifestRecord record;
      record.payload_cid = content_id;
      record.filename = slice_name;
      record.piece_cid = commitment.commitment_id;
      record.payload_size = commitment.payload_size;
      record.piece_size = static_cast<std::int64_t>(commitment.piece_size);
      record.detail = detail;
      record.status = store::ManifestStatus::Completed;
      options_.repository->create(std::move(record));
    }
  } catch (const store::StoreError& e) {
    throw BuildError("recording " + slice_name + " failed: " + e.what());
  } catch (const crypto::CryptoError& e) {
    throw BuildError("commitment for " + slice_name + " failed: " + e.what());
  }
}

void CommitmentRecordingCallback::on_error(const std::exception& error) {
  raise(error);
}


//==============================================
// MANIFEST ONLY
//==============================================

ManifestOnlyCallback::ManifestOnlyCallback(const CallbackOptions& options)
  : archives_(options.car_dir)
  , manifest_(options.car_dir / MANIFEST_FILE_NAME, {"payload_cid", "filename", "detail"}) {}

void ManifestOnlyCallback::on_success(const SliceArchive& archive, const std::string& slice_name,
                                      const std::string& content_id, const std::string& detail) {
  try {
    {
      auto in = archive.open();
      archives_.store(content_id + ".car", in);
    }
    manifest_.append({content_id, slice_name, detail});
  } catch (const store::StoreError& e) {
    throw BuildError("recording " + slice_name + " failed: " + e.what());
  }
}

void ManifestOnlyCallback::on_error(const std::exception& error) {
  raise(error);
}


//==============================================
// DISCARD
//==============================================

void DiscardCallback::on_error(const std::exception& error) {
  raise(error);
}

} // namespace slicer::build
