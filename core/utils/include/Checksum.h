#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace DriveSync {

class CancellationToken;

/**
 * @brief Incremental SHA-256 (OpenSSL EVP) producing lowercase hex digests.
 *
 * File hashing reads in CHUNK_SIZE blocks so memory use is constant
 * regardless of file size.
 */
class Checksum {
public:
    static constexpr size_t CHUNK_SIZE = 64 * 1024;

    Checksum();
    ~Checksum();

    Checksum(const Checksum&) = delete;
    Checksum& operator=(const Checksum&) = delete;

    void update(const void* data, size_t length);

    /// Finish the digest; the object must not be updated afterwards
    std::string hexDigest();

    /**
     * @brief Hash a file's contents
     * @throws TransferError if the file cannot be opened or read
     * @throws OperationCancelled if the token fires between chunks
     */
    static std::string ofFile(const std::filesystem::path& path, const CancellationToken* cancel = nullptr);

    static std::string ofBytes(const std::vector<uint8_t>& data);

    static std::string toHex(const unsigned char* data, size_t length);

private:
    EVP_MD_CTX* ctx_;
    bool finished_{false};
};

} // namespace DriveSync
