#pragma once

#include <stdexcept>
#include <string>

namespace identity::domain {

/**
 * @brief Хранилище недоступно (нет соединения, ошибка драйвера)
 */
class StorageUnavailableException : public std::runtime_error {
public:
    explicit StorageUnavailableException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Операция с хранилищем не уложилась в statement timeout
 */
class StorageTimeoutException : public std::runtime_error {
public:
    explicit StorageTimeoutException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Нарушение уникальности device_fingerprint при вставке
 *
 * Возникает, когда параллельный вызов успел создать аккаунт
 * для того же устройства между lookup и insert.
 */
class DuplicateFingerprintException : public std::runtime_error {
public:
    explicit DuplicateFingerprintException(const std::string& fingerprint)
        : std::runtime_error("Account already exists for fingerprint: " + fingerprint) {}
};

/**
 * @brief Запись ссылается на аккаунт, которого нет в хранилище
 *
 * Ошибка вызывающего, а не хранилища: наследует std::invalid_argument.
 */
class UnknownAccountException : public std::invalid_argument {
public:
    explicit UnknownAccountException(const std::string& accountId)
        : std::invalid_argument("Unknown account: " + accountId) {}
};

/**
 * @brief Хранилище ключей подписи недоступно или ключ невалиден
 */
class SigningKeyUnavailableException : public std::runtime_error {
public:
    explicit SigningKeyUnavailableException(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace identity::domain
