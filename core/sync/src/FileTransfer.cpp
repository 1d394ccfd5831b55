#include "FileTransfer.h"
#include "Checksum.h"
#include "LoggerMacros.h"
#include "PathFilter.h"
#include "SyncExceptions.h"
#include "TransferPipeline.h"
#include "TreeScanner.h"

#include <fstream>
#include <system_error>

namespace DriveSync {

namespace fs = std::filesystem;

namespace {

/// Removes the temp file unless the rename went through
class TempFileGuard {
public:
    explicit TempFileGuard(fs::path path) : path_(std::move(path)) {}
    ~TempFileGuard() {
        if (!committed_) {
            std::error_code ec;
            fs::remove(path_, ec);
            if (ec) {
                LOG_WARN_COMP("Could not remove temp file " + path_.string() + ": " + ec.message(), "FileTransfer");
            }
        }
    }

    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

    void commit() { committed_ = true; }

private:
    fs::path path_;
    bool committed_ = false;
};

} // namespace

FileTransfer::FileTransfer(const TransferPipeline& pipeline) : pipeline_(pipeline) {
}

fs::path FileTransfer::tempPathFor(const fs::path& destination) {
    fs::path temp = destination;
    temp += PathFilter::TEMP_SUFFIX;
    return temp;
}

TransferOutcome FileTransfer::store(const fs::path& source, const fs::path& destination,
                                    const CancellationToken* cancel) const {
    return transfer(source, destination, cancel, true);
}

TransferOutcome FileTransfer::retrieve(const fs::path& source, const fs::path& destination,
                                       const CancellationToken* cancel) const {
    return transfer(source, destination, cancel, false);
}

TransferOutcome FileTransfer::transfer(const fs::path& source, const fs::path& destination,
                                       const CancellationToken* cancel, bool encode) const {
    std::error_code ec;
    auto sourceTime = fs::last_write_time(source, ec);
    if (ec) {
        throw TransferError("Cannot stat " + source.string() + ": " + ec.message());
    }

    fs::create_directories(destination.parent_path(), ec);
    if (ec) {
        throw TransferError("Cannot create " + destination.parent_path().string() + ": " + ec.message());
    }

    std::ifstream in(source, std::ios::binary);
    if (!in) {
        throw TransferError("Cannot open " + source.string() + " for reading");
    }

    const fs::path temp = tempPathFor(destination);
    TempFileGuard guard(temp);

    TransferResult result;
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw TransferError("Cannot open " + temp.string() + " for writing");
        }
        result = encode ? pipeline_.encode(in, &out, cancel) : pipeline_.decode(in, &out, cancel);
        out.close();
        if (!out) {
            throw TransferError("Cannot finish writing " + temp.string());
        }
    }

    const std::string written = Checksum::ofFile(temp, cancel);
    if (written != result.outputChecksum) {
        throw IntegrityError("Checksum mismatch after copy to " + destination.string());
    }

    fs::last_write_time(temp, sourceTime, ec);
    if (ec) {
        throw TransferError("Cannot set mtime on " + temp.string() + ": " + ec.message());
    }

    fs::rename(temp, destination, ec);
    if (ec) {
        throw TransferError("Cannot move " + temp.string() + " into place: " + ec.message());
    }
    guard.commit();

    TransferOutcome outcome;
    if (encode) {
        outcome.checksum = result.inputChecksum;
        outcome.storedChecksum = result.outputChecksum;
        outcome.plainSize = result.bytesRead;
        outcome.storedSize = result.bytesWritten;
    } else {
        outcome.checksum = result.outputChecksum;
        outcome.storedChecksum = result.inputChecksum;
        outcome.plainSize = result.bytesWritten;
        outcome.storedSize = result.bytesRead;
    }

    auto finalTime = fs::last_write_time(destination, ec);
    outcome.destinationMtimeNs = toNanoseconds(ec ? sourceTime : finalTime);

    LOG_DEBUG_COMP_IF((encode ? "Stored " : "Retrieved ") + source.string() + " -> " + destination.string() +
                      " (" + std::to_string(outcome.plainSize) + " bytes)", "FileTransfer");
    return outcome;
}

void FileTransfer::removeFile(const fs::path& file, const fs::path& root) {
    std::error_code ec;
    fs::remove(file, ec);
    if (ec) {
        throw TransferError("Cannot delete " + file.string() + ": " + ec.message());
    }

    const fs::path stop = root.lexically_normal();
    fs::path dir = file.parent_path();
    while (!dir.empty() && dir.lexically_normal() != stop && dir.lexically_normal().string().size() > stop.string().size()) {
        if (!fs::is_empty(dir, ec) || ec) {
            break;
        }
        fs::remove(dir, ec);
        if (ec) {
            break;
        }
        dir = dir.parent_path();
    }
}

fs::path FileTransfer::keepBothName(const fs::path& file) {
    fs::path candidate = file;
    candidate += ".backup";
    std::error_code ec;
    for (int n = 1; fs::exists(candidate, ec); ++n) {
        candidate = file;
        candidate += ".backup." + std::to_string(n);
    }
    return candidate;
}

} // namespace DriveSync
