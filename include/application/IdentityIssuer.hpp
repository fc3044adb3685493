#pragma once

#include "ports/input/IIdentityIssuer.hpp"
#include "ports/input/IMetricsService.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/IClock.hpp"
#include "domain/StorageExceptions.hpp"
#include "IdGenerator.hpp"
#include <memory>
#include <iostream>

namespace identity::application {

/**
 * @brief Выдача анонимных аккаунтов по отпечатку устройства
 *
 * Атомарность create-or-get обеспечивает unique index хранилища.
 * Проигравший гонку вызов получает DuplicateFingerprintException,
 * один раз повторяет lookup и возвращает accountId победителя.
 */
class IdentityIssuer : public ports::input::IIdentityIssuer {
public:
    static constexpr size_t MAX_FINGERPRINT_LENGTH = 256;

    IdentityIssuer(
        std::shared_ptr<ports::output::IAccountRepository> accountRepo,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<ports::input::IMetricsService> metrics
    ) : accountRepo_(std::move(accountRepo))
      , clock_(std::move(clock))
      , metrics_(std::move(metrics))
    {
        std::cout << "[IdentityIssuer] Created" << std::endl;
    }

    ports::input::CreateOrGetResult createOrGetAccount(const std::string& deviceFingerprint) override {
        std::string reason;
        if (!isValidFingerprint(deviceFingerprint, reason)) {
            return failure(domain::AuthErrorCode::INVALID_ARGUMENT, reason);
        }

        try {
            if (auto existing = accountRepo_->findByFingerprint(deviceFingerprint)) {
                return {true, existing->accountId, false, domain::AuthErrorCode::OK, "Account exists"};
            }

            domain::Account account(IdGenerator::uuidV4(), deviceFingerprint, clock_->now());

            try {
                accountRepo_->insert(account);
            } catch (const domain::DuplicateFingerprintException&) {
                // Параллельный вызов успел вставить аккаунт: возвращаем его
                auto winner = accountRepo_->findByFingerprint(deviceFingerprint);
                if (!winner) {
                    std::cerr << "[IdentityIssuer] Conflict not resolved for fingerprint" << std::endl;
                    return failure(domain::AuthErrorCode::UNAVAILABLE, "Account conflict could not be resolved");
                }
                std::cout << "[IdentityIssuer] Conflict resolved, returning " << winner->accountId << std::endl;
                return {true, winner->accountId, false, domain::AuthErrorCode::OK, "Account exists"};
            }

            metrics_->increment("accounts_created_total");
            std::cout << "[IdentityIssuer] Created account: " << account.accountId << std::endl;
            return {true, account.accountId, true, domain::AuthErrorCode::OK, "Account created"};

        } catch (const domain::StorageTimeoutException& e) {
            std::cerr << "[IdentityIssuer] Storage timeout: " << e.what() << std::endl;
            return failure(domain::AuthErrorCode::DEADLINE_EXCEEDED, "Account storage timed out");
        } catch (const domain::StorageUnavailableException& e) {
            std::cerr << "[IdentityIssuer] Storage unavailable: " << e.what() << std::endl;
            return failure(domain::AuthErrorCode::UNAVAILABLE, "Account storage unavailable");
        }
    }

private:
    std::shared_ptr<ports::output::IAccountRepository> accountRepo_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;

    static ports::input::CreateOrGetResult failure(domain::AuthErrorCode code, const std::string& message) {
        return {false, "", false, code, message};
    }

    static bool isValidFingerprint(const std::string& fingerprint, std::string& reason) {
        if (fingerprint.empty()) {
            reason = "device_fingerprint is required";
            return false;
        }
        if (fingerprint.size() > MAX_FINGERPRINT_LENGTH) {
            reason = "device_fingerprint is too long";
            return false;
        }
        if (fingerprint.front() == ' ' || fingerprint.back() == ' ') {
            reason = "device_fingerprint has surrounding whitespace";
            return false;
        }
        for (unsigned char c : fingerprint) {
            if (c < 0x20 || c > 0x7E) {
                reason = "device_fingerprint contains non-printable characters";
                return false;
            }
        }
        return true;
    }
};

} // namespace identity::application
