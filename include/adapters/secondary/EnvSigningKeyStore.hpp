#pragma once

#include "ports/output/ISigningKeyStore.hpp"
#include "domain/StorageExceptions.hpp"
#include <cstdlib>
#include <iostream>

namespace identity::adapters::secondary {

/**
 * @brief Ключи подписи из ENV (K8s Secret)
 *
 * - IDENTITY_JWT_KEY_ID            (default: "k1")
 * - IDENTITY_JWT_SECRET            (обязательный, >= 32 байт)
 * - IDENTITY_JWT_PREVIOUS_KEY_ID   (опционально, ротация)
 * - IDENTITY_JWT_PREVIOUS_SECRET   (опционально, только для проверки)
 *
 * Ключи читаются один раз в конструкторе: validate() не делает I/O.
 */
class EnvSigningKeyStore : public ports::output::ISigningKeyStore {
public:
    static constexpr size_t MIN_SECRET_LENGTH = 32;

    EnvSigningKeyStore() {
        current_.keyId = getEnvOrDefault("IDENTITY_JWT_KEY_ID", "k1");
        current_.secret = getEnvOrThrow("IDENTITY_JWT_SECRET");
        checkSecret(current_);

        const char* previousSecret = std::getenv("IDENTITY_JWT_PREVIOUS_SECRET");
        if (previousSecret) {
            ports::output::SigningKey previous;
            previous.keyId = getEnvOrThrow("IDENTITY_JWT_PREVIOUS_KEY_ID");
            previous.secret = previousSecret;
            checkSecret(previous);

            if (previous.keyId == current_.keyId) {
                throw domain::SigningKeyUnavailableException("Previous key id must differ from current key id");
            }
            previous_ = previous;
        }

        std::cout << "[EnvSigningKeyStore] Loaded kid=" << current_.keyId
                  << (previous_ ? " (+previous kid=" + previous_->keyId + ")" : "") << std::endl;
    }

    ports::output::SigningKey currentKey() const override {
        return current_;
    }

    std::optional<ports::output::SigningKey> findKey(const std::string& keyId) const override {
        if (keyId == current_.keyId) return current_;
        if (previous_ && keyId == previous_->keyId) return previous_;
        return std::nullopt;
    }

private:
    ports::output::SigningKey current_;
    std::optional<ports::output::SigningKey> previous_;

    static void checkSecret(const ports::output::SigningKey& key) {
        if (key.keyId.empty()) {
            throw domain::SigningKeyUnavailableException("Signing key id must not be empty");
        }
        if (key.secret.size() < MIN_SECRET_LENGTH) {
            throw domain::SigningKeyUnavailableException(
                "Signing secret for kid=" + key.keyId + " is shorter than "
                + std::to_string(MIN_SECRET_LENGTH) + " bytes");
        }
    }

    static std::string getEnvOrDefault(const char* name, const std::string& defaultValue) {
        const char* value = std::getenv(name);
        return value ? value : defaultValue;
    }

    static std::string getEnvOrThrow(const char* name) {
        const char* value = std::getenv(name);
        if (!value) {
            throw domain::SigningKeyUnavailableException(std::string("Required env variable not set: ") + name);
        }
        return value;
    }
};

} // namespace identity::adapters::secondary
