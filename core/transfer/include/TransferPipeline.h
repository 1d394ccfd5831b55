#pragma once

#include "AdvancedSyncOptions.h"
#include "BandwidthLimiter.h"
#include "Compression.h"
#include "Crypto.h"

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace DriveSync {

class CancellationToken;

/**
 * @brief Byte and hash accounting for one encode/decode pass
 */
struct TransferResult {
    uint64_t bytesRead = 0;
    uint64_t bytesWritten = 0;
    std::string inputChecksum;   // SHA-256 of the consumed bytes
    std::string outputChecksum;  // SHA-256 of the produced bytes
};

/**
 * @brief Reversible per-file transformation.
 *
 * Write path: compress -> encrypt -> rate-limit -> write.
 * Restore path: read -> rate-limit -> decrypt -> decompress.
 *
 * Strategies are fixed at construction. One pipeline is shared by all
 * workers of an operation, so the limiter budget is global to it. The
 * pipeline knows nothing about paths, groups or tracking.
 */
class TransferPipeline {
public:
    static constexpr size_t CHUNK_SIZE = 64 * 1024;

    /// Pass-through pipeline (copy + hashing only)
    TransferPipeline();

    TransferPipeline(std::unique_ptr<ICompressor> compressor,
                     std::optional<EncryptionSecret> secret,
                     std::shared_ptr<BandwidthLimiter> limiter);

    /**
     * @brief Build the stages described by @p options
     * @throws std::runtime_error if the key file cannot be loaded
     * @throws std::invalid_argument for invalid option values
     */
    static std::unique_ptr<TransferPipeline> fromOptions(const AdvancedSyncOptions& options);

    /**
     * @brief Encode @p in into @p out (out may be null to only measure and hash)
     * @throws TransferError on stream failures
     * @throws OperationCancelled between chunks
     */
    TransferResult encode(std::istream& in, std::ostream* out, const CancellationToken* cancel = nullptr) const;

    /**
     * @brief Inverse of encode()
     * @throws IntegrityError on authentication or decompression failure
     */
    TransferResult decode(std::istream& in, std::ostream* out, const CancellationToken* cancel = nullptr) const;

    /**
     * @brief Decode without output or throttling, to hash stored bytes
     * @throws IntegrityError on authentication or decompression failure
     */
    TransferResult inspect(std::istream& in, const CancellationToken* cancel = nullptr) const;

    std::vector<uint8_t> encodeBuffer(const std::vector<uint8_t>& data) const;
    std::vector<uint8_t> decodeBuffer(const std::vector<uint8_t>& data) const;

    bool transformsData() const { return compressor_ != nullptr || secret_.has_value(); }
    bool compresses() const { return compressor_ != nullptr; }
    bool encrypts() const { return secret_.has_value(); }
    BandwidthLimiter* limiter() const { return limiter_.get(); }

    /// e.g. "gzip(6) -> aes-256-gcm -> 10.00 MB/s"
    std::string describe() const;

private:
    std::vector<std::unique_ptr<CodecStream>> encodeStages() const;
    std::vector<std::unique_ptr<CodecStream>> decodeStages() const;
    TransferResult runDecode(std::istream& in, std::ostream* out, const CancellationToken* cancel,
                             bool throttle) const;

    std::unique_ptr<ICompressor> compressor_;
    std::optional<EncryptionSecret> secret_;
    std::shared_ptr<BandwidthLimiter> limiter_;
};

} // namespace DriveSync
