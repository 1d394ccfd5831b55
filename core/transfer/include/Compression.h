#pragma once

#include "CodecStream.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace DriveSync {

enum class CompressionAlgorithm {
    None,
    Gzip,
    Lz4
};

const char* toString(CompressionAlgorithm algorithm);
std::optional<CompressionAlgorithm> parseCompressionAlgorithm(const std::string& text);

/**
 * @brief Compression strategy selected once per pipeline
 */
class ICompressor {
public:
    virtual ~ICompressor() = default;

    virtual std::string name() const = 0;
    virtual int level() const = 0;

    virtual std::unique_ptr<CodecStream> newCompressStream() const = 0;

    /**
     * @brief Inverse stream
     * @note Corrupt or truncated input raises IntegrityError
     */
    virtual std::unique_ptr<CodecStream> newDecompressStream() const = 0;

    std::vector<uint8_t> compress(const std::vector<uint8_t>& data) const;
    std::vector<uint8_t> decompress(const std::vector<uint8_t>& data) const;
};

/**
 * @brief gzip-framed deflate (zlib), levels 1-9
 */
class GzipCompressor : public ICompressor {
public:
    static constexpr int MIN_LEVEL = 1;
    static constexpr int MAX_LEVEL = 9;
    static constexpr int DEFAULT_LEVEL = 6;

    /// @throws std::invalid_argument if @p level is outside 1-9
    explicit GzipCompressor(int level = DEFAULT_LEVEL);

    std::string name() const override { return "gzip"; }
    int level() const override { return level_; }

    std::unique_ptr<CodecStream> newCompressStream() const override;
    std::unique_ptr<CodecStream> newDecompressStream() const override;

private:
    int level_;
};

/**
 * @brief Build the compressor for @p algorithm
 *
 * None yields nullptr. Lz4 has no codec in this build and falls back to
 * gzip level 1 with a warning. Levels outside 1-9 are clamped.
 */
std::unique_ptr<ICompressor> makeCompressor(CompressionAlgorithm algorithm, int level);

} // namespace DriveSync
