#ifndef DRIVESYNC_CRYPTO_H
#define DRIVESYNC_CRYPTO_H

#include "CodecStream.h"

#include <array>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace DriveSync {

/**
 * @brief Where the file key of an encrypted stream comes from
 */
enum class KeySource : uint8_t {
    Password = 1,   // PBKDF2-HMAC-SHA256
    KeyFile = 2     // HKDF-SHA256 over raw key material
};

/**
 * @brief Caller-supplied secret; a per-file key is derived from it and the stream salt
 */
struct EncryptionSecret {
    KeySource source = KeySource::Password;
    std::string password;
    std::vector<uint8_t> keyMaterial;

    EncryptionSecret() = default;
    EncryptionSecret(const EncryptionSecret&) = default;
    EncryptionSecret& operator=(const EncryptionSecret&) = default;
    ~EncryptionSecret();

    static EncryptionSecret fromPassword(const std::string& password);

    /**
     * @brief Load a raw 32-byte key file
     * @throws std::runtime_error if the file is missing or not exactly 32 bytes
     */
    static EncryptionSecret fromKeyFile(const std::filesystem::path& path);

    static EncryptionSecret fromKeyMaterial(std::vector<uint8_t> key);
};

/**
 * @brief AES-256-GCM file encryption
 *
 * Stream layout:
 *   [magic "DSE1" (4)] [key source (1)] [PBKDF2 iterations, big endian (4)]
 *   [salt (16)] [nonce (12)] [ciphertext (n)] [tag (16)]
 *
 * The header is authenticated as associated data. Any tag mismatch,
 * truncation or malformed header raises IntegrityError.
 */
class Crypto {
public:
    static constexpr size_t KEY_SIZE = 32;      // 256 bits
    static constexpr size_t SALT_SIZE = 16;
    static constexpr size_t NONCE_SIZE = 12;    // 96-bit GCM nonce
    static constexpr size_t TAG_SIZE = 16;
    static constexpr size_t MAGIC_SIZE = 4;
    static constexpr size_t HEADER_SIZE = MAGIC_SIZE + 1 + 4 + SALT_SIZE + NONCE_SIZE;
    static constexpr uint32_t PBKDF2_ITERATIONS = 100000;
    static constexpr uint32_t MAX_PBKDF2_ITERATIONS = 10000000;
    static constexpr std::array<uint8_t, MAGIC_SIZE> MAGIC = {{'D', 'S', 'E', '1'}};

    /**
     * @brief Cryptographically secure random bytes
     * @throws std::runtime_error if the RNG fails
     */
    static std::vector<uint8_t> randomBytes(size_t count);

    /**
     * @brief PBKDF2-HMAC-SHA256 key derivation
     * @return 32-byte key
     */
    static std::vector<uint8_t> deriveKeyFromPassword(
        const std::string& password,
        const std::vector<uint8_t>& salt,
        uint32_t iterations = PBKDF2_ITERATIONS
    );

    /**
     * @brief HKDF-SHA256 expansion of raw key material with a per-file salt
     * @return 32-byte key
     */
    static std::vector<uint8_t> deriveKeyFromKeyMaterial(
        const std::vector<uint8_t>& keyMaterial,
        const std::vector<uint8_t>& salt
    );

    /**
     * @brief Streaming encryptor writing header, ciphertext and tag
     * @throws std::runtime_error on OpenSSL failure
     */
    static std::unique_ptr<CodecStream> newEncryptStream(const EncryptionSecret& secret);

    /**
     * @brief Streaming decryptor.
     *
     * Plaintext is released before the tag is checked; callers must discard
     * output when finish() throws.
     */
    static std::unique_ptr<CodecStream> newDecryptStream(const EncryptionSecret& secret);

    static std::vector<uint8_t> encrypt(const std::vector<uint8_t>& plaintext, const EncryptionSecret& secret);

    /// @throws IntegrityError on tag mismatch, truncation or bad header
    static std::vector<uint8_t> decrypt(const std::vector<uint8_t>& data, const EncryptionSecret& secret);
};

} // namespace DriveSync

#endif // DRIVESYNC_CRYPTO_H
