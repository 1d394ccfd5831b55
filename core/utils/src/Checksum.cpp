#include "Checksum.h"
#include "CancellationToken.h"
#include "SyncExceptions.h"
#include <openssl/evp.h>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace DriveSync {

Checksum::Checksum() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("Failed to create digest context");
    }
    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("Failed to initialize SHA-256");
    }
}

Checksum::~Checksum() {
    EVP_MD_CTX_free(ctx_);
}

void Checksum::update(const void* data, size_t length) {
    if (finished_) {
        throw std::logic_error("Checksum already finalized");
    }
    if (length > 0 && EVP_DigestUpdate(ctx_, data, length) != 1) {
        throw std::runtime_error("SHA-256 update failed");
    }
}

std::string Checksum::hexDigest() {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    if (EVP_DigestFinal_ex(ctx_, hash, &hashLen) != 1) {
        throw std::runtime_error("SHA-256 finalization failed");
    }
    finished_ = true;
    return toHex(hash, hashLen);
}

std::string Checksum::toHex(const unsigned char* data, size_t length) {
    std::stringstream ss;
    for (size_t i = 0; i < length; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return ss.str();
}

std::string Checksum::ofFile(const std::filesystem::path& path, const CancellationToken* cancel) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw TransferError("Cannot open for hashing: " + path.string());
    }

    Checksum sum;
    std::vector<char> buffer(CHUNK_SIZE);
    while (file) {
        if (cancel) {
            cancel->throwIfCancelled();
        }
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        sum.update(buffer.data(), static_cast<size_t>(file.gcount()));
    }
    if (file.bad()) {
        throw TransferError("Read error while hashing: " + path.string());
    }
    return sum.hexDigest();
}

std::string Checksum::ofBytes(const std::vector<uint8_t>& data) {
    Checksum sum;
    sum.update(data.data(), data.size());
    return sum.hexDigest();
}

} // namespace DriveSync
