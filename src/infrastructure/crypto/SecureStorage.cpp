#include "infrastructure/crypto/SecureStorage.hpp"

#include "core/Errors.hpp"

#include <sodium.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>

namespace hostwatch::infra {

namespace {

constexpr size_t KEY_SIZE = crypto_secretbox_KEYBYTES;
constexpr size_t NONCE_SIZE = crypto_secretbox_NONCEBYTES;
constexpr size_t MAC_SIZE = crypto_secretbox_MACBYTES;

} // namespace

SecureStorage::SecureStorage(const std::filesystem::path& keyPath) : keyPath_(keyPath) {
    if (sodium_init() < 0) {
        throw core::ConfigurationError("Failed to initialize libsodium");
    }

    key_.resize(KEY_SIZE);

    std::error_code ec;
    if (std::filesystem::exists(keyPath_, ec)) {
        // A key that cannot be read is never replaced: that would orphan stored secrets.
        if (!loadKey()) {
            throw core::ConfigurationError("Invalid encryption key file: " + keyPath_.string());
        }
        ready_ = true;
        return;
    }

    randombytes_buf(key_.data(), KEY_SIZE);
    ready_ = writeKey();
}

SecureStorage::~SecureStorage() {
    if (!key_.empty()) {
        sodium_memzero(key_.data(), key_.size());
    }
}

bool SecureStorage::loadKey() {
    std::ifstream file(keyPath_, std::ios::binary);
    if (!file) {
        return false;
    }

    file.read(reinterpret_cast<char*>(key_.data()), static_cast<std::streamsize>(KEY_SIZE));
    if (file.gcount() != static_cast<std::streamsize>(KEY_SIZE)) {
        return false;
    }

    spdlog::debug("Loaded encryption key from {}", keyPath_.string());
    return true;
}

bool SecureStorage::writeKey() {
    std::error_code ec;
    auto parent = keyPath_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            spdlog::error("Failed to create key directory {}: {}", parent.string(), ec.message());
            return false;
        }
    }

    std::ofstream file(keyPath_, std::ios::binary | std::ios::trunc);
    if (!file) {
        spdlog::error("Failed to create key file: {}", keyPath_.string());
        return false;
    }

    file.write(reinterpret_cast<const char*>(key_.data()), static_cast<std::streamsize>(KEY_SIZE));
    file.close();
    if (!file) {
        spdlog::error("Failed to write key file: {}", keyPath_.string());
        return false;
    }

    std::filesystem::permissions(keyPath_,
                                 std::filesystem::perms::owner_read |
                                     std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
        spdlog::warn("Could not restrict permissions on {}: {}", keyPath_.string(), ec.message());
    }

    spdlog::info("Generated new encryption key at {}", keyPath_.string());
    return true;
}

std::string SecureStorage::encrypt(const std::string& plaintext) {
    if (!ready_) {
        spdlog::error("Encryption key unavailable, refusing to encrypt");
        return {};
    }

    std::vector<unsigned char> sealed(NONCE_SIZE + MAC_SIZE + plaintext.size());
    unsigned char* nonce = sealed.data();
    randombytes_buf(nonce, NONCE_SIZE);

    if (crypto_secretbox_easy(sealed.data() + NONCE_SIZE,
                              reinterpret_cast<const unsigned char*>(plaintext.data()),
                              plaintext.size(), nonce, key_.data()) != 0) {
        spdlog::error("Encryption failed");
        return {};
    }

    return base64Encode(sealed);
}

std::optional<std::string> SecureStorage::decrypt(const std::string& ciphertext) const {
    if (!ready_) {
        return std::nullopt;
    }

    auto sealed = base64Decode(ciphertext);
    if (sealed.size() < NONCE_SIZE + MAC_SIZE) {
        spdlog::error("Encrypted value is too short");
        return std::nullopt;
    }

    const unsigned char* nonce = sealed.data();
    const unsigned char* boxed = sealed.data() + NONCE_SIZE;
    size_t boxedLen = sealed.size() - NONCE_SIZE;

    std::string plaintext(boxedLen - MAC_SIZE, '\0');
    if (crypto_secretbox_open_easy(reinterpret_cast<unsigned char*>(plaintext.data()), boxed,
                                   boxedLen, nonce, key_.data()) != 0) {
        spdlog::error("Decryption failed, value was sealed with a different key");
        return std::nullopt;
    }

    return plaintext;
}

std::string base64Encode(const std::vector<unsigned char>& data) {
    if (data.empty()) {
        return {};
    }

    size_t encodedLen = sodium_base64_encoded_len(data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string encoded(encodedLen, '\0');
    sodium_bin2base64(encoded.data(), encodedLen, data.data(), data.size(),
                      sodium_base64_VARIANT_ORIGINAL);

    // encodedLen counts the terminating NUL
    encoded.resize(encodedLen - 1);
    return encoded;
}

std::vector<unsigned char> base64Decode(const std::string& encoded) {
    if (encoded.empty()) {
        return {};
    }

    std::vector<unsigned char> decoded(encoded.size());
    size_t decodedLen = 0;
    if (sodium_base642bin(decoded.data(), decoded.size(), encoded.c_str(), encoded.size(),
                          nullptr, &decodedLen, nullptr, sodium_base64_VARIANT_ORIGINAL) != 0) {
        return {};
    }

    decoded.resize(decodedLen);
    return decoded;
}

} // namespace hostwatch::infra
