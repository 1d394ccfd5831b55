#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace DriveSync {

class CancellationToken;
class TransferPipeline;

/**
 * @brief What one file transfer wrote
 */
struct TransferOutcome {
    std::string checksum;        // Plaintext SHA-256
    std::string storedChecksum;  // SHA-256 of the bytes on the backup side
    uint64_t plainSize = 0;
    uint64_t storedSize = 0;
    int64_t destinationMtimeNs = 0;
};

/**
 * @brief Moves single files between a master and a backup tree.
 *
 * Data lands in "<destination>.dsync-tmp" first. The temp file is hashed
 * again and compared with what the pipeline produced, given the source
 * mtime, then renamed over the destination. On any failure or
 * cancellation the temp file is removed and the destination is untouched.
 */
class FileTransfer {
public:
    explicit FileTransfer(const TransferPipeline& pipeline);

    /**
     * @brief master -> backup through the encode pipeline
     * @throws TransferError, IntegrityError, OperationCancelled
     */
    TransferOutcome store(const std::filesystem::path& source, const std::filesystem::path& destination,
                          const CancellationToken* cancel = nullptr) const;

    /**
     * @brief backup -> master through the decode pipeline
     * @throws TransferError, IntegrityError, OperationCancelled
     */
    TransferOutcome retrieve(const std::filesystem::path& source, const std::filesystem::path& destination,
                             const CancellationToken* cancel = nullptr) const;

    /**
     * @brief Delete @p file and any parent directories left empty, up to @p root
     * @throws TransferError if the file cannot be removed
     */
    static void removeFile(const std::filesystem::path& file, const std::filesystem::path& root);

    /**
     * @brief First free name among "<file>.backup", "<file>.backup.1", ...
     */
    static std::filesystem::path keepBothName(const std::filesystem::path& file);

    static std::filesystem::path tempPathFor(const std::filesystem::path& destination);

private:
    TransferOutcome transfer(const std::filesystem::path& source, const std::filesystem::path& destination,
                             const CancellationToken* cancel, bool encode) const;

    const TransferPipeline& pipeline_;
};

} // namespace DriveSync
