#include "Compression.h"
#include "Logger.h"
#include "SyncExceptions.h"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <zlib.h>

namespace DriveSync {

namespace {

constexpr size_t kOutChunk = 32768;
constexpr int kGzipWindowBits = 15 + 16;

class GzipDeflateStream : public CodecStream {
public:
    explicit GzipDeflateStream(int level) {
        std::memset(&zs_, 0, sizeof(zs_));
        if (deflateInit2(&zs_, level, Z_DEFLATED, kGzipWindowBits, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
            throw std::runtime_error("Failed to initialize gzip compression");
        }
    }

    ~GzipDeflateStream() override {
        deflateEnd(&zs_);
    }

    void update(const uint8_t* data, size_t length, std::vector<uint8_t>& out) override {
        if (length == 0) {
            return;
        }
        zs_.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data));
        zs_.avail_in = static_cast<uInt>(length);
        run(Z_NO_FLUSH, out);
    }

    void finish(std::vector<uint8_t>& out) override {
        zs_.next_in = nullptr;
        zs_.avail_in = 0;
        run(Z_FINISH, out);
    }

private:
    void run(int flush, std::vector<uint8_t>& out) {
        uint8_t buffer[kOutChunk];
        int ret;
        do {
            zs_.next_out = buffer;
            zs_.avail_out = sizeof(buffer);

            ret = deflate(&zs_, flush);
            if (ret == Z_STREAM_ERROR) {
                throw std::runtime_error("gzip compression failed");
            }
            out.insert(out.end(), buffer, buffer + (sizeof(buffer) - zs_.avail_out));
        } while (zs_.avail_out == 0 || (flush == Z_FINISH && ret != Z_STREAM_END));
    }

    z_stream zs_;
};

class GzipInflateStream : public CodecStream {
public:
    GzipInflateStream() {
        std::memset(&zs_, 0, sizeof(zs_));
        if (inflateInit2(&zs_, kGzipWindowBits) != Z_OK) {
            throw std::runtime_error("Failed to initialize gzip decompression");
        }
    }

    ~GzipInflateStream() override {
        inflateEnd(&zs_);
    }

    void update(const uint8_t* data, size_t length, std::vector<uint8_t>& out) override {
        if (length == 0) {
            return;
        }
        if (ended_) {
            throw IntegrityError("Trailing data after compressed stream");
        }

        zs_.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data));
        zs_.avail_in = static_cast<uInt>(length);

        uint8_t buffer[kOutChunk];
        while (true) {
            zs_.next_out = buffer;
            zs_.avail_out = sizeof(buffer);

            int ret = inflate(&zs_, Z_NO_FLUSH);
            if (ret != Z_OK && ret != Z_STREAM_END && ret != Z_BUF_ERROR) {
                throw IntegrityError(std::string("Corrupt compressed data: ") + (zs_.msg ? zs_.msg : "inflate failed"));
            }
            out.insert(out.end(), buffer, buffer + (sizeof(buffer) - zs_.avail_out));

            if (ret == Z_STREAM_END) {
                ended_ = true;
                if (zs_.avail_in > 0) {
                    throw IntegrityError("Trailing data after compressed stream");
                }
                break;
            }
            if (ret == Z_BUF_ERROR || (zs_.avail_out != 0 && zs_.avail_in == 0)) {
                break;
            }
        }
    }

    void finish(std::vector<uint8_t>& /*out*/) override {
        if (!ended_) {
            throw IntegrityError("Truncated compressed stream");
        }
    }

private:
    z_stream zs_;
    bool ended_ = false;
};

} // namespace

const char* toString(CompressionAlgorithm algorithm) {
    switch (algorithm) {
        case CompressionAlgorithm::None: return "none";
        case CompressionAlgorithm::Gzip: return "gzip";
        case CompressionAlgorithm::Lz4: return "lz4";
    }
    return "none";
}

std::optional<CompressionAlgorithm> parseCompressionAlgorithm(const std::string& text) {
    if (text == "none") return CompressionAlgorithm::None;
    if (text == "gzip") return CompressionAlgorithm::Gzip;
    if (text == "lz4") return CompressionAlgorithm::Lz4;
    return std::nullopt;
}

std::vector<uint8_t> ICompressor::compress(const std::vector<uint8_t>& data) const {
    std::vector<uint8_t> out;
    auto stream = newCompressStream();
    stream->update(data.data(), data.size(), out);
    stream->finish(out);
    return out;
}

std::vector<uint8_t> ICompressor::decompress(const std::vector<uint8_t>& data) const {
    std::vector<uint8_t> out;
    auto stream = newDecompressStream();
    stream->update(data.data(), data.size(), out);
    stream->finish(out);
    return out;
}

GzipCompressor::GzipCompressor(int level) : level_(level) {
    if (level < MIN_LEVEL || level > MAX_LEVEL) {
        throw std::invalid_argument("gzip level must be between 1 and 9, got " + std::to_string(level));
    }
}

std::unique_ptr<CodecStream> GzipCompressor::newCompressStream() const {
    return std::make_unique<GzipDeflateStream>(level_);
}

std::unique_ptr<CodecStream> GzipCompressor::newDecompressStream() const {
    return std::make_unique<GzipInflateStream>();
}

std::unique_ptr<ICompressor> makeCompressor(CompressionAlgorithm algorithm, int level) {
    switch (algorithm) {
        case CompressionAlgorithm::None:
            return nullptr;
        case CompressionAlgorithm::Lz4:
            Logger::instance().log(LogLevel::WARN, "lz4 is not available in this build, falling back to gzip level 1",
                                   "Compression");
            return std::make_unique<GzipCompressor>(GzipCompressor::MIN_LEVEL);
        case CompressionAlgorithm::Gzip:
            break;
    }

    int clamped = std::clamp(level, GzipCompressor::MIN_LEVEL, GzipCompressor::MAX_LEVEL);
    if (clamped != level) {
        Logger::instance().log(LogLevel::WARN, "Compression level " + std::to_string(level) +
                               " out of range, using " + std::to_string(clamped), "Compression");
    }
    return std::make_unique<GzipCompressor>(clamped);
}

} // namespace DriveSync
