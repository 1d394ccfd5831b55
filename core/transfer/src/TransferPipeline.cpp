#include "TransferPipeline.h"
#include "CancellationToken.h"
#include "Checksum.h"
#include "Logger.h"
#include "SyncExceptions.h"

#include <functional>
#include <iomanip>
#include <istream>
#include <ostream>
#include <sstream>

namespace DriveSync {

namespace {

using Emit = std::function<void(const std::vector<uint8_t>&)>;

void pushThrough(const std::vector<std::unique_ptr<CodecStream>>& stages,
                 const uint8_t* data, size_t length, const Emit& emit) {
    std::vector<uint8_t> current(data, data + length);
    for (const auto& stage : stages) {
        std::vector<uint8_t> next;
        stage->update(current.data(), current.size(), next);
        current.swap(next);
        if (current.empty()) {
            return;
        }
    }
    if (!current.empty()) {
        emit(current);
    }
}

void finishAll(const std::vector<std::unique_ptr<CodecStream>>& stages, const Emit& emit) {
    std::vector<uint8_t> carry;
    for (const auto& stage : stages) {
        std::vector<uint8_t> out;
        if (!carry.empty()) {
            stage->update(carry.data(), carry.size(), out);
        }
        stage->finish(out);
        carry.swap(out);
    }
    if (!carry.empty()) {
        emit(carry);
    }
}

void writeOut(std::ostream* out, const std::vector<uint8_t>& bytes) {
    if (!out) {
        return;
    }
    out->write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!*out) {
        throw TransferError("Write failed");
    }
}

} // namespace

TransferPipeline::TransferPipeline()
    : limiter_(std::make_shared<BandwidthLimiter>(0)) {
}

TransferPipeline::TransferPipeline(std::unique_ptr<ICompressor> compressor,
                                   std::optional<EncryptionSecret> secret,
                                   std::shared_ptr<BandwidthLimiter> limiter)
    : compressor_(std::move(compressor))
    , secret_(std::move(secret))
    , limiter_(limiter ? std::move(limiter) : std::make_shared<BandwidthLimiter>(0)) {
}

std::unique_ptr<TransferPipeline> TransferPipeline::fromOptions(const AdvancedSyncOptions& options) {
    std::unique_ptr<ICompressor> compressor;
    if (options.compressionEnabled) {
        compressor = makeCompressor(options.compressionAlgorithm, options.compressionLevel);
    }

    std::optional<EncryptionSecret> secret;
    if (options.encryptionEnabled) {
        if (!options.encryptionKeyFile.empty()) {
            secret = EncryptionSecret::fromKeyFile(options.encryptionKeyFile);
        } else {
            secret = EncryptionSecret::fromPassword(options.encryptionPassword);
        }
    }

    std::shared_ptr<BandwidthLimiter> limiter = BandwidthLimiter::fromMegabytesPerSecond(options.bandwidthLimitMbps);

    auto pipeline = std::make_unique<TransferPipeline>(std::move(compressor), std::move(secret), std::move(limiter));
    Logger::instance().log(LogLevel::DEBUG, "Transfer pipeline: " + pipeline->describe(), "TransferPipeline");
    return pipeline;
}

std::vector<std::unique_ptr<CodecStream>> TransferPipeline::encodeStages() const {
    std::vector<std::unique_ptr<CodecStream>> stages;
    if (compressor_) {
        stages.push_back(compressor_->newCompressStream());
    }
    if (secret_) {
        stages.push_back(Crypto::newEncryptStream(*secret_));
    }
    return stages;
}

std::vector<std::unique_ptr<CodecStream>> TransferPipeline::decodeStages() const {
    std::vector<std::unique_ptr<CodecStream>> stages;
    if (secret_) {
        stages.push_back(Crypto::newDecryptStream(*secret_));
    }
    if (compressor_) {
        stages.push_back(compressor_->newDecompressStream());
    }
    return stages;
}

TransferResult TransferPipeline::encode(std::istream& in, std::ostream* out, const CancellationToken* cancel) const {
    TransferResult result;
    Checksum inputHash;
    Checksum outputHash;
    auto stages = encodeStages();

    Emit emit = [&](const std::vector<uint8_t>& bytes) {
        limiter_->acquire(bytes.size(), cancel);
        writeOut(out, bytes);
        outputHash.update(bytes.data(), bytes.size());
        result.bytesWritten += bytes.size();
    };

    std::vector<char> buffer(CHUNK_SIZE);
    while (in) {
        if (cancel) {
            cancel->throwIfCancelled();
        }
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto count = static_cast<size_t>(in.gcount());
        if (count == 0) {
            break;
        }
        const auto* bytes = reinterpret_cast<const uint8_t*>(buffer.data());
        inputHash.update(bytes, count);
        result.bytesRead += count;
        pushThrough(stages, bytes, count, emit);
    }
    if (in.bad()) {
        throw TransferError("Read failed");
    }

    finishAll(stages, emit);
    if (out) {
        out->flush();
        if (!*out) {
            throw TransferError("Write failed");
        }
    }

    result.inputChecksum = inputHash.hexDigest();
    result.outputChecksum = outputHash.hexDigest();
    return result;
}

TransferResult TransferPipeline::decode(std::istream& in, std::ostream* out, const CancellationToken* cancel) const {
    return runDecode(in, out, cancel, true);
}

TransferResult TransferPipeline::inspect(std::istream& in, const CancellationToken* cancel) const {
    return runDecode(in, nullptr, cancel, false);
}

TransferResult TransferPipeline::runDecode(std::istream& in, std::ostream* out, const CancellationToken* cancel,
                                           bool throttle) const {
    TransferResult result;
    Checksum inputHash;
    Checksum outputHash;
    auto stages = decodeStages();

    Emit emit = [&](const std::vector<uint8_t>& bytes) {
        writeOut(out, bytes);
        outputHash.update(bytes.data(), bytes.size());
        result.bytesWritten += bytes.size();
    };

    std::vector<char> buffer(CHUNK_SIZE);
    while (in) {
        if (cancel) {
            cancel->throwIfCancelled();
        }
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto count = static_cast<size_t>(in.gcount());
        if (count == 0) {
            break;
        }
        if (throttle) {
            limiter_->acquire(count, cancel);
        }
        const auto* bytes = reinterpret_cast<const uint8_t*>(buffer.data());
        inputHash.update(bytes, count);
        result.bytesRead += count;
        pushThrough(stages, bytes, count, emit);
    }
    if (in.bad()) {
        throw TransferError("Read failed");
    }

    finishAll(stages, emit);
    if (out) {
        out->flush();
        if (!*out) {
            throw TransferError("Write failed");
        }
    }

    result.inputChecksum = inputHash.hexDigest();
    result.outputChecksum = outputHash.hexDigest();
    return result;
}

std::vector<uint8_t> TransferPipeline::encodeBuffer(const std::vector<uint8_t>& data) const {
    std::istringstream in(std::string(data.begin(), data.end()));
    std::ostringstream out;
    encode(in, &out);
    const std::string bytes = out.str();
    return std::vector<uint8_t>(bytes.begin(), bytes.end());
}

std::vector<uint8_t> TransferPipeline::decodeBuffer(const std::vector<uint8_t>& data) const {
    std::istringstream in(std::string(data.begin(), data.end()));
    std::ostringstream out;
    decode(in, &out);
    const std::string bytes = out.str();
    return std::vector<uint8_t>(bytes.begin(), bytes.end());
}

std::string TransferPipeline::describe() const {
    std::ostringstream oss;
    bool first = true;
    auto stage = [&](const std::string& text) {
        if (!first) oss << " -> ";
        oss << text;
        first = false;
    };

    if (compressor_) {
        stage(compressor_->name() + "(" + std::to_string(compressor_->level()) + ")");
    }
    if (secret_) {
        stage(secret_->source == KeySource::Password ? "aes-256-gcm(password)" : "aes-256-gcm(key file)");
    }
    if (limiter_->isEnabled()) {
        std::ostringstream rate;
        rate << std::fixed << std::setprecision(2)
             << static_cast<double>(limiter_->getRateLimit()) / BandwidthLimiter::BYTES_PER_MEGABYTE << " MB/s";
        stage(rate.str());
    }
    if (first) {
        oss << "copy";
    }
    return oss.str();
}

} // namespace DriveSync
