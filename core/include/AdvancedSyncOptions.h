#pragma once

#include "Compression.h"
#include "Config.h"
#include "Result.h"
#include "SyncTypes.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace DriveSync {

/**
 * @brief Per-operation transfer settings, built by the caller and never mutated mid-operation
 */
struct AdvancedSyncOptions {
    using PhaseCallback = std::function<void(SyncPhase phase)>;
    using ProgressCallback = std::function<void(size_t processed, size_t total)>;

    // Bandwidth throttling (MB/s, 0 = unlimited)
    double bandwidthLimitMbps = 0.0;

    // Encryption: exactly one of password / key file when enabled
    bool encryptionEnabled = false;
    std::string encryptionPassword;
    std::string encryptionKeyFile;

    // Compression
    bool compressionEnabled = false;
    CompressionAlgorithm compressionAlgorithm = CompressionAlgorithm::Gzip;
    int compressionLevel = GzipCompressor::DEFAULT_LEVEL;

    // Files transferred concurrently
    size_t parallelFiles = 1;

    // Reuse tracked checksums when size and mtime are unchanged
    bool incremental = true;

    std::vector<std::string> excludePatterns;

    // Byte difference tolerated before an untracked pair is a size_mismatch
    uint64_t sizeTolerance = 0;

    bool calculateSpaceSavings = true;

    PhaseCallback onPhase;
    ProgressCallback onProgress;

    /// True when stored bytes differ from the source bytes
    bool transformsData() const { return encryptionEnabled || compressionEnabled; }

    Result<void> validate() const;

    /**
     * @brief Read options from @p prefix keys:
     *
     *   bandwidth_limit_mbps, encryption, encryption_password, encryption_key_file,
     *   compression, compression_algorithm, compression_level, parallel_files,
     *   incremental, exclude (comma list), size_tolerance, space_savings
     *
     * @return ConfigError naming the offending key
     */
    static Result<AdvancedSyncOptions> fromConfig(const Config& config, const std::string& prefix = "sync.");

    static std::unordered_map<std::string, Config::Validator> configSchema(const std::string& prefix = "sync.");
};

} // namespace DriveSync
