#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace hostwatch::infra {

/**
 * @brief Encrypts secrets kept in the configuration file.
 *
 * Uses libsodium's secret-box with a 32-byte key stored in a separate file
 * readable only by the owner. The key is generated on first use. Ciphertext
 * is the nonce followed by the boxed message, Base64 encoded, so it can sit
 * in a JSON string.
 *
 * @note This class is non-copyable.
 */
class SecureStorage {
public:
    /**
     * @brief Constructs a SecureStorage and loads or creates its key.
     * @param keyPath Path to the key file.
     * @throws core::ConfigurationError if libsodium cannot be initialized, or the
     *         key file exists but does not hold a valid key.
     */
    explicit SecureStorage(const std::filesystem::path& keyPath);

    /**
     * @brief Destructor. Securely zeroes key material.
     */
    ~SecureStorage();

    SecureStorage(const SecureStorage&) = delete;
    SecureStorage& operator=(const SecureStorage&) = delete;

    /**
     * @brief Encrypts a secret.
     * @param plaintext Secret to encrypt.
     * @return Base64 text, or an empty string if the key could not be persisted.
     */
    std::string encrypt(const std::string& plaintext);

    /**
     * @brief Decrypts a value produced by encrypt().
     * @param ciphertext Base64 text with the nonce prepended.
     * @return Plaintext, or nullopt if the value is malformed or was sealed with another key.
     */
    std::optional<std::string> decrypt(const std::string& ciphertext) const;

    /**
     * @brief True once a key is loaded or freshly written to disk.
     */
    [[nodiscard]] bool ready() const { return ready_; }

    [[nodiscard]] const std::filesystem::path& keyPath() const { return keyPath_; }

private:
    bool loadKey();
    bool writeKey();

    std::filesystem::path keyPath_;
    std::vector<unsigned char> key_;
    bool ready_{false};
};

/**
 * @brief Encodes binary data to Base64.
 */
std::string base64Encode(const std::vector<unsigned char>& data);

/**
 * @brief Decodes Base64 text.
 * @return Decoded bytes, empty if the text is not valid Base64.
 */
std::vector<unsigned char> base64Decode(const std::string& encoded);

} // namespace hostwatch::infra
