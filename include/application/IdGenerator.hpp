#pragma once

#include <openssl/rand.h>
#include <string>
#include <array>
#include <stdexcept>
#include <cstdio>

namespace identity::application {

/**
 * @brief Генерация случайных идентификаторов
 *
 * Случайность из CSPRNG OpenSSL (RAND_bytes), потокобезопасно.
 */
class IdGenerator {
public:
    /**
     * @brief UUID v4 в каноническом виде xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx
     * @throws std::runtime_error если RAND_bytes не смог выдать байты
     */
    static std::string uuidV4() {
        std::array<unsigned char, 16> b{};
        if (RAND_bytes(b.data(), static_cast<int>(b.size())) != 1) {
            throw std::runtime_error("RAND_bytes failed");
        }

        b[6] = static_cast<unsigned char>((b[6] & 0x0F) | 0x40);  // version 4
        b[8] = static_cast<unsigned char>((b[8] & 0x3F) | 0x80);  // variant 10xx

        char buf[37];
        std::snprintf(buf, sizeof(buf),
            "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
            b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7],
            b[8], b[9], b[10], b[11], b[12], b[13], b[14], b[15]);
        return buf;
    }

    /**
     * @brief ID в формате "prefix-<uuid v4>"
     */
    static std::string prefixed(const std::string& prefix) {
        return prefix + "-" + uuidV4();
    }
};

} // namespace identity::application
