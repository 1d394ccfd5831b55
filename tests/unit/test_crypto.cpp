#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>

#include "Crypto.h"
#include "SyncExceptions.h"

using namespace DriveSync;

namespace fs = std::filesystem;

namespace {
std::vector<uint8_t> bytesOf(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}
}

TEST(CryptoTest, RandomBytes) {
    auto a = Crypto::randomBytes(32);
    auto b = Crypto::randomBytes(32);
    EXPECT_EQ(a.size(), 32u);
    EXPECT_NE(a, b);
    EXPECT_TRUE(Crypto::randomBytes(0).empty());
}

TEST(CryptoTest, KeyDerivationIsDeterministicPerSalt) {
    auto salt = Crypto::randomBytes(Crypto::SALT_SIZE);
    auto otherSalt = Crypto::randomBytes(Crypto::SALT_SIZE);

    auto k1 = Crypto::deriveKeyFromPassword("correct horse", salt, 1000);
    auto k2 = Crypto::deriveKeyFromPassword("correct horse", salt, 1000);
    EXPECT_EQ(k1.size(), Crypto::KEY_SIZE);
    EXPECT_EQ(k1, k2);
    EXPECT_NE(k1, Crypto::deriveKeyFromPassword("correct horse", otherSalt, 1000));
    EXPECT_NE(k1, Crypto::deriveKeyFromPassword("wrong horse", salt, 1000));

    auto material = Crypto::randomBytes(Crypto::KEY_SIZE);
    auto h1 = Crypto::deriveKeyFromKeyMaterial(material, salt);
    EXPECT_EQ(h1.size(), Crypto::KEY_SIZE);
    EXPECT_EQ(h1, Crypto::deriveKeyFromKeyMaterial(material, salt));
    EXPECT_NE(h1, Crypto::deriveKeyFromKeyMaterial(material, otherSalt));
}

TEST(CryptoTest, PasswordRoundTrip) {
    auto secret = EncryptionSecret::fromPassword("hunter2");
    auto plaintext = bytesOf("Quarterly report, draft 3");

    auto sealed = Crypto::encrypt(plaintext, secret);
    ASSERT_EQ(sealed.size(), Crypto::HEADER_SIZE + plaintext.size() + Crypto::TAG_SIZE);
    EXPECT_TRUE(std::equal(Crypto::MAGIC.begin(), Crypto::MAGIC.end(), sealed.begin()));
    EXPECT_EQ(sealed[Crypto::MAGIC_SIZE], static_cast<uint8_t>(KeySource::Password));

    EXPECT_EQ(Crypto::decrypt(sealed, secret), plaintext);

    // Fresh salt and nonce per stream
    EXPECT_NE(Crypto::encrypt(plaintext, secret), sealed);
}

TEST(CryptoTest, EmptyPlaintext) {
    auto secret = EncryptionSecret::fromPassword("pw");
    auto sealed = Crypto::encrypt({}, secret);
    EXPECT_EQ(sealed.size(), Crypto::HEADER_SIZE + Crypto::TAG_SIZE);
    EXPECT_TRUE(Crypto::decrypt(sealed, secret).empty());
}

TEST(CryptoTest, WrongPasswordFailsAuthentication) {
    auto sealed = Crypto::encrypt(bytesOf("secret"), EncryptionSecret::fromPassword("right"));
    EXPECT_THROW(Crypto::decrypt(sealed, EncryptionSecret::fromPassword("wrong")), IntegrityError);
}

TEST(CryptoTest, TamperingIsDetected) {
    auto secret = EncryptionSecret::fromPassword("pw");
    auto sealed = Crypto::encrypt(bytesOf("important bytes that must not change"), secret);

    auto flippedBody = sealed;
    flippedBody[Crypto::HEADER_SIZE + 3] ^= 0x01;
    EXPECT_THROW(Crypto::decrypt(flippedBody, secret), IntegrityError);

    auto flippedTag = sealed;
    flippedTag.back() ^= 0x80;
    EXPECT_THROW(Crypto::decrypt(flippedTag, secret), IntegrityError);

    // The header is authenticated too
    auto flippedNonce = sealed;
    flippedNonce[Crypto::HEADER_SIZE - 1] ^= 0x01;
    EXPECT_THROW(Crypto::decrypt(flippedNonce, secret), IntegrityError);

    auto badMagic = sealed;
    badMagic[0] = 'X';
    EXPECT_THROW(Crypto::decrypt(badMagic, secret), IntegrityError);
}

TEST(CryptoTest, TruncationIsDetected) {
    auto secret = EncryptionSecret::fromPassword("pw");
    auto sealed = Crypto::encrypt(bytesOf("some payload"), secret);

    std::vector<uint8_t> noTag(sealed.begin(), sealed.end() - 1);
    EXPECT_THROW(Crypto::decrypt(noTag, secret), IntegrityError);

    std::vector<uint8_t> headerOnly(sealed.begin(), sealed.begin() + 10);
    EXPECT_THROW(Crypto::decrypt(headerOnly, secret), IntegrityError);

    EXPECT_THROW(Crypto::decrypt({}, secret), IntegrityError);
}

TEST(CryptoTest, KeyFileSecret) {
    fs::path dir = fs::temp_directory_path() / "drivesync_crypto_keyfile";
    fs::create_directories(dir);
    auto material = Crypto::randomBytes(Crypto::KEY_SIZE);
    {
        std::ofstream key(dir / "good.key", std::ios::binary);
        key.write(reinterpret_cast<const char*>(material.data()), static_cast<std::streamsize>(material.size()));
        std::ofstream shortKey(dir / "short.key", std::ios::binary);
        shortKey << "too short";
    }

    auto secret = EncryptionSecret::fromKeyFile(dir / "good.key");
    EXPECT_EQ(secret.source, KeySource::KeyFile);
    EXPECT_EQ(secret.keyMaterial, material);

    auto sealed = Crypto::encrypt(bytesOf("key file data"), secret);
    EXPECT_EQ(sealed[Crypto::MAGIC_SIZE], static_cast<uint8_t>(KeySource::KeyFile));
    EXPECT_EQ(Crypto::decrypt(sealed, EncryptionSecret::fromKeyMaterial(material)), bytesOf("key file data"));

    // A password cannot open a key-file stream
    EXPECT_THROW(Crypto::decrypt(sealed, EncryptionSecret::fromPassword("pw")), IntegrityError);

    EXPECT_THROW(EncryptionSecret::fromKeyFile(dir / "short.key"), std::runtime_error);
    EXPECT_THROW(EncryptionSecret::fromKeyFile(dir / "missing.key"), std::runtime_error);
    EXPECT_THROW(EncryptionSecret::fromKeyMaterial({1, 2, 3}), std::invalid_argument);
    EXPECT_THROW(EncryptionSecret::fromPassword(""), std::invalid_argument);

    std::error_code ec;
    fs::remove_all(dir, ec);
}

TEST(CryptoTest, StreamingMatchesOneShot) {
    auto secret = EncryptionSecret::fromKeyMaterial(Crypto::randomBytes(Crypto::KEY_SIZE));
    std::vector<uint8_t> plaintext(200000);
    for (size_t i = 0; i < plaintext.size(); ++i) {
        plaintext[i] = static_cast<uint8_t>((i * 31) & 0xff);
    }

    std::vector<uint8_t> sealed;
    auto encryptor = Crypto::newEncryptStream(secret);
    for (size_t offset = 0; offset < plaintext.size(); offset += 4096) {
        size_t length = std::min<size_t>(4096, plaintext.size() - offset);
        encryptor->update(plaintext.data() + offset, length, sealed);
    }
    encryptor->finish(sealed);

    // Feed the decryptor in pieces that split the header and the tag
    std::vector<uint8_t> opened;
    auto decryptor = Crypto::newDecryptStream(secret);
    for (size_t offset = 0; offset < sealed.size(); offset += 7) {
        size_t length = std::min<size_t>(7, sealed.size() - offset);
        decryptor->update(sealed.data() + offset, length, opened);
    }
    decryptor->finish(opened);

    EXPECT_EQ(opened, plaintext);
    EXPECT_EQ(Crypto::decrypt(sealed, secret), plaintext);
}
