#pragma once

#include "ports/output/IJwtProvider.hpp"
#include "ports/output/ISigningKeyStore.hpp"
#include <jwt-cpp/jwt.h>
#include <memory>
#include <system_error>
#include <iostream>

namespace identity::adapters::secondary
{

    /**
     * @brief JWT провайдер на jwt-cpp: компактный JWS, HS256
     *
     * Заголовок: {"alg":"HS256","typ":"JWT","kid":"<keyId>"}
     * Payload:   {"sub","iss","aud","iat","exp","jti"}
     *
     * Секрет для проверки выбирается по kid. alg из заголовка не выбирает
     * алгоритм: всё, кроме HS256, отклоняется до проверки подписи.
     */
    class HmacJwtAdapter : public ports::output::IJwtProvider
    {
    public:
        explicit HmacJwtAdapter(std::shared_ptr<ports::output::ISigningKeyStore> keyStore)
            : keyStore_(std::move(keyStore))
        {
            std::cout << "[HmacJwtAdapter] Created, current kid=" << keyStore_->currentKey().keyId << std::endl;
        }

        std::string encode(const domain::TokenClaims &claims) override
        {
            auto key = keyStore_->currentKey();

            auto builder = jwt::create()
                               .set_type("JWT")
                               .set_key_id(key.keyId)
                               .set_subject(claims.subject)
                               .set_issuer(claims.issuer)
                               .set_audience(claims.audience)
                               .set_issued_at(claims.issuedAt)
                               .set_expires_at(claims.expiresAt);
            if (!claims.tokenId.empty())
            {
                builder.set_id(claims.tokenId);
            }
            return builder.sign(jwt::algorithm::hs256{key.secret});
        }

        ports::output::JwtDecodeResult decode(const std::string &token) const override
        {
            using ports::output::JwtDecodeStatus;
            ports::output::JwtDecodeResult result;

            try
            {
                auto decoded = jwt::decode(token);

                if (!hasHeaderClaim(decoded, "alg", jwt::json::type::string))
                {
                    return result;
                }
                if (decoded.get_algorithm() != "HS256")
                {
                    result.status = JwtDecodeStatus::UNSUPPORTED_ALGORITHM;
                    return result;
                }
                if (!hasHeaderClaim(decoded, "kid", jwt::json::type::string))
                {
                    return result;
                }

                auto key = keyStore_->findKey(decoded.get_key_id());
                if (!key)
                {
                    result.status = JwtDecodeStatus::UNKNOWN_KEY;
                    return result;
                }

                // exp/iat проверяет TokenService по IClock, здесь только подпись
                auto verifier = jwt::verify().allow_algorithm(jwt::algorithm::hs256{key->secret});
                std::error_code ec;
                verifier.verify(decoded, ec);
                if (ec && ec.category() != jwt::error::token_verification_error_category())
                {
                    result.status = JwtDecodeStatus::BAD_SIGNATURE;
                    return result;
                }

                if (!hasPayloadClaim(decoded, "sub", jwt::json::type::string) ||
                    !hasPayloadClaim(decoded, "iss", jwt::json::type::string) ||
                    !hasPayloadClaim(decoded, "aud", jwt::json::type::string) ||
                    !hasPayloadClaim(decoded, "iat", jwt::json::type::integer) ||
                    !hasPayloadClaim(decoded, "exp", jwt::json::type::integer))
                {
                    return result;
                }

                result.claims.subject = decoded.get_subject();
                result.claims.issuer = decoded.get_issuer();
                result.claims.audience = decoded.get_payload_claim("aud").as_string();
                if (hasPayloadClaim(decoded, "jti", jwt::json::type::string))
                {
                    result.claims.tokenId = decoded.get_id();
                }
                result.claims.issuedAt = decoded.get_issued_at();
                result.claims.expiresAt = decoded.get_expires_at();
                result.status = JwtDecodeStatus::OK;
                return result;
            }
            catch (const std::exception &)
            {
                // jwt-cpp: invalid_argument на число сегментов, runtime_error на base64/JSON,
                // bad_cast на claim не того типа
                result.status = JwtDecodeStatus::MALFORMED;
                return result;
            }
        }

    private:
        std::shared_ptr<ports::output::ISigningKeyStore> keyStore_;

        template <typename Decoded>
        static bool hasHeaderClaim(const Decoded &decoded, const std::string &name, jwt::json::type type)
        {
            return decoded.has_header_claim(name) && decoded.get_header_claim(name).get_type() == type;
        }

        template <typename Decoded>
        static bool hasPayloadClaim(const Decoded &decoded, const std::string &name, jwt::json::type type)
        {
            return decoded.has_payload_claim(name) && decoded.get_payload_claim(name).get_type() == type;
        }
    };

} // namespace identity::adapters::secondary
