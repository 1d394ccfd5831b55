#include "Crypto.h"
#include "Logger.h"
#include "SyncExceptions.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/rand.h>

#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace DriveSync {

namespace {

const char* kHkdfInfo = "drivesync-file-key";

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

struct PkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};

void wipe(std::vector<uint8_t>& bytes) {
    if (!bytes.empty()) {
        OPENSSL_cleanse(bytes.data(), bytes.size());
    }
}

void putUint32(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>(value >> 24));
    out.push_back(static_cast<uint8_t>(value >> 16));
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value));
}

uint32_t getUint32(const uint8_t* in) {
    return (static_cast<uint32_t>(in[0]) << 24) | (static_cast<uint32_t>(in[1]) << 16) |
           (static_cast<uint32_t>(in[2]) << 8) | static_cast<uint32_t>(in[3]);
}

std::vector<uint8_t> deriveFileKey(const EncryptionSecret& secret, const std::vector<uint8_t>& salt,
                                   uint32_t iterations) {
    if (secret.source == KeySource::Password) {
        return Crypto::deriveKeyFromPassword(secret.password, salt, iterations);
    }
    return Crypto::deriveKeyFromKeyMaterial(secret.keyMaterial, salt);
}

CipherCtxPtr newGcmContext(bool encrypt, const std::vector<uint8_t>& key, const uint8_t* nonce,
                           const std::vector<uint8_t>& aad) {
    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("Failed to create cipher context");
    }

    auto init = encrypt ? EVP_EncryptInit_ex : EVP_DecryptInit_ex;
    if (init(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(Crypto::NONCE_SIZE), nullptr) != 1 ||
        init(ctx.get(), nullptr, nullptr, key.data(), nonce) != 1) {
        throw std::runtime_error("Failed to initialize AES-256-GCM");
    }

    int len = 0;
    auto update = encrypt ? EVP_EncryptUpdate : EVP_DecryptUpdate;
    if (update(ctx.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) {
        throw std::runtime_error("Failed to authenticate stream header");
    }
    return ctx;
}

class GcmEncryptStream : public CodecStream {
public:
    explicit GcmEncryptStream(const EncryptionSecret& secret) {
        auto salt = Crypto::randomBytes(Crypto::SALT_SIZE);
        auto nonce = Crypto::randomBytes(Crypto::NONCE_SIZE);
        uint32_t iterations = secret.source == KeySource::Password ? Crypto::PBKDF2_ITERATIONS : 0;

        header_.assign(Crypto::MAGIC.begin(), Crypto::MAGIC.end());
        header_.push_back(static_cast<uint8_t>(secret.source));
        putUint32(header_, iterations);
        header_.insert(header_.end(), salt.begin(), salt.end());
        header_.insert(header_.end(), nonce.begin(), nonce.end());

        auto key = deriveFileKey(secret, salt, iterations);
        ctx_ = newGcmContext(true, key, nonce.data(), header_);
        wipe(key);
    }

    void update(const uint8_t* data, size_t length, std::vector<uint8_t>& out) override {
        emitHeader(out);
        if (length == 0) {
            return;
        }
        size_t offset = out.size();
        out.resize(offset + length);
        int len = 0;
        if (EVP_EncryptUpdate(ctx_.get(), out.data() + offset, &len, data, static_cast<int>(length)) != 1) {
            throw std::runtime_error("Encryption failed");
        }
        out.resize(offset + static_cast<size_t>(len));
    }

    void finish(std::vector<uint8_t>& out) override {
        emitHeader(out);
        uint8_t block[16];
        int len = 0;
        if (EVP_EncryptFinal_ex(ctx_.get(), block, &len) != 1) {
            throw std::runtime_error("Encryption finalization failed");
        }
        out.insert(out.end(), block, block + len);

        uint8_t tag[Crypto::TAG_SIZE];
        if (EVP_CIPHER_CTX_ctrl(ctx_.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(Crypto::TAG_SIZE), tag) != 1) {
            throw std::runtime_error("Failed to read authentication tag");
        }
        out.insert(out.end(), tag, tag + Crypto::TAG_SIZE);
    }

private:
    void emitHeader(std::vector<uint8_t>& out) {
        if (!headerWritten_) {
            out.insert(out.end(), header_.begin(), header_.end());
            headerWritten_ = true;
        }
    }

    CipherCtxPtr ctx_;
    std::vector<uint8_t> header_;
    bool headerWritten_ = false;
};

class GcmDecryptStream : public CodecStream {
public:
    explicit GcmDecryptStream(const EncryptionSecret& secret) : secret_(secret) {}

    void update(const uint8_t* data, size_t length, std::vector<uint8_t>& out) override {
        pending_.insert(pending_.end(), data, data + length);

        if (!ctx_) {
            if (pending_.size() < Crypto::HEADER_SIZE) {
                return;
            }
            parseHeader();
            pending_.erase(pending_.begin(), pending_.begin() + Crypto::HEADER_SIZE);
        }

        // The last TAG_SIZE bytes seen so far may be the tag
        if (pending_.size() <= Crypto::TAG_SIZE) {
            return;
        }
        size_t ready = pending_.size() - Crypto::TAG_SIZE;
        size_t offset = out.size();
        out.resize(offset + ready);
        int len = 0;
        if (EVP_DecryptUpdate(ctx_.get(), out.data() + offset, &len, pending_.data(), static_cast<int>(ready)) != 1) {
            throw IntegrityError("Decryption failed");
        }
        out.resize(offset + static_cast<size_t>(len));
        pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(ready));
    }

    void finish(std::vector<uint8_t>& out) override {
        if (!ctx_) {
            throw IntegrityError("Encrypted stream truncated inside header");
        }
        if (pending_.size() != Crypto::TAG_SIZE) {
            throw IntegrityError("Encrypted stream truncated: missing authentication tag");
        }
        if (EVP_CIPHER_CTX_ctrl(ctx_.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(Crypto::TAG_SIZE),
                                pending_.data()) != 1) {
            throw IntegrityError("Failed to set authentication tag");
        }
        uint8_t block[16];
        int len = 0;
        if (EVP_DecryptFinal_ex(ctx_.get(), block, &len) != 1) {
            throw IntegrityError("Authentication tag mismatch: data corrupted or wrong key");
        }
        out.insert(out.end(), block, block + len);
    }

private:
    void parseHeader() {
        const uint8_t* header = pending_.data();
        if (!std::equal(Crypto::MAGIC.begin(), Crypto::MAGIC.end(), header)) {
            throw IntegrityError("Not a DriveSync encrypted stream");
        }

        auto source = static_cast<KeySource>(header[Crypto::MAGIC_SIZE]);
        if (source != KeySource::Password && source != KeySource::KeyFile) {
            throw IntegrityError("Unknown key source in encrypted stream header");
        }
        if (source != secret_.source) {
            throw IntegrityError(source == KeySource::Password
                                     ? "Stream was encrypted with a password, not a key file"
                                     : "Stream was encrypted with a key file, not a password");
        }

        uint32_t iterations = getUint32(header + Crypto::MAGIC_SIZE + 1);
        if (source == KeySource::Password && (iterations == 0 || iterations > Crypto::MAX_PBKDF2_ITERATIONS)) {
            throw IntegrityError("Invalid PBKDF2 iteration count in header");
        }

        const uint8_t* saltBegin = header + Crypto::MAGIC_SIZE + 1 + 4;
        std::vector<uint8_t> salt(saltBegin, saltBegin + Crypto::SALT_SIZE);
        const uint8_t* nonce = saltBegin + Crypto::SALT_SIZE;
        std::vector<uint8_t> aad(header, header + Crypto::HEADER_SIZE);

        auto key = deriveFileKey(secret_, salt, iterations);
        ctx_ = newGcmContext(false, key, nonce, aad);
        wipe(key);
    }

    EncryptionSecret secret_;
    CipherCtxPtr ctx_;
    std::vector<uint8_t> pending_;
};

} // namespace

// EncryptionSecret

EncryptionSecret::~EncryptionSecret() {
    if (!password.empty()) {
        OPENSSL_cleanse(&password[0], password.size());
    }
    wipe(keyMaterial);
}

EncryptionSecret EncryptionSecret::fromPassword(const std::string& password) {
    if (password.empty()) {
        throw std::invalid_argument("Encryption password must not be empty");
    }
    EncryptionSecret secret;
    secret.source = KeySource::Password;
    secret.password = password;
    return secret;
}

EncryptionSecret EncryptionSecret::fromKeyFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open key file: " + path.string());
    }

    std::vector<uint8_t> key(Crypto::KEY_SIZE + 1);
    file.read(reinterpret_cast<char*>(key.data()), static_cast<std::streamsize>(key.size()));
    if (file.gcount() != static_cast<std::streamsize>(Crypto::KEY_SIZE)) {
        wipe(key);
        throw std::runtime_error("Key file must contain exactly 32 bytes: " + path.string());
    }
    key.resize(Crypto::KEY_SIZE);
    return fromKeyMaterial(std::move(key));
}

EncryptionSecret EncryptionSecret::fromKeyMaterial(std::vector<uint8_t> key) {
    if (key.size() != Crypto::KEY_SIZE) {
        throw std::invalid_argument("Key material must be 32 bytes");
    }
    EncryptionSecret secret;
    secret.source = KeySource::KeyFile;
    secret.keyMaterial = std::move(key);
    return secret;
}

// Crypto

std::vector<uint8_t> Crypto::randomBytes(size_t count) {
    std::vector<uint8_t> bytes(count);
    if (count > 0 && RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
        throw std::runtime_error("Failed to generate random bytes");
    }
    return bytes;
}

std::vector<uint8_t> Crypto::deriveKeyFromPassword(
    const std::string& password,
    const std::vector<uint8_t>& salt,
    uint32_t iterations
) {
    std::vector<uint8_t> key(KEY_SIZE);

    if (PKCS5_PBKDF2_HMAC(
        password.c_str(),
        static_cast<int>(password.length()),
        salt.data(),
        static_cast<int>(salt.size()),
        static_cast<int>(iterations),
        EVP_sha256(),
        static_cast<int>(KEY_SIZE),
        key.data()
    ) != 1) {
        throw std::runtime_error("Key derivation failed");
    }

    return key;
}

std::vector<uint8_t> Crypto::deriveKeyFromKeyMaterial(
    const std::vector<uint8_t>& keyMaterial,
    const std::vector<uint8_t>& salt
) {
    std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter> pctx(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr));
    if (!pctx) {
        throw std::runtime_error("Failed to create HKDF context");
    }

    std::vector<uint8_t> key(KEY_SIZE);
    size_t keyLength = key.size();
    if (EVP_PKEY_derive_init(pctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_hkdf_md(pctx.get(), EVP_sha256()) <= 0 ||
        EVP_PKEY_CTX_set1_hkdf_salt(pctx.get(), salt.data(), static_cast<int>(salt.size())) <= 0 ||
        EVP_PKEY_CTX_set1_hkdf_key(pctx.get(), keyMaterial.data(), static_cast<int>(keyMaterial.size())) <= 0 ||
        EVP_PKEY_CTX_add1_hkdf_info(pctx.get(), reinterpret_cast<const unsigned char*>(kHkdfInfo),
                                    static_cast<int>(std::char_traits<char>::length(kHkdfInfo))) <= 0 ||
        EVP_PKEY_derive(pctx.get(), key.data(), &keyLength) <= 0 ||
        keyLength != KEY_SIZE) {
        throw std::runtime_error("HKDF key derivation failed");
    }
    return key;
}

std::unique_ptr<CodecStream> Crypto::newEncryptStream(const EncryptionSecret& secret) {
    return std::make_unique<GcmEncryptStream>(secret);
}

std::unique_ptr<CodecStream> Crypto::newDecryptStream(const EncryptionSecret& secret) {
    return std::make_unique<GcmDecryptStream>(secret);
}

std::vector<uint8_t> Crypto::encrypt(const std::vector<uint8_t>& plaintext, const EncryptionSecret& secret) {
    std::vector<uint8_t> out;
    out.reserve(HEADER_SIZE + plaintext.size() + TAG_SIZE);
    auto stream = newEncryptStream(secret);
    stream->update(plaintext.data(), plaintext.size(), out);
    stream->finish(out);
    return out;
}

std::vector<uint8_t> Crypto::decrypt(const std::vector<uint8_t>& data, const EncryptionSecret& secret) {
    std::vector<uint8_t> out;
    auto stream = newDecryptStream(secret);
    stream->update(data.data(), data.size(), out);
    try {
        stream->finish(out);
    } catch (const IntegrityError&) {
        wipe(out);
        throw;
    }
    return out;
}

} // namespace DriveSync
