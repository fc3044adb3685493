#pragma once

#include <IResponse.hpp>
#include "domain/enums/AuthErrorCode.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace identity::adapters::primary {

/**
 * @brief Ответ с ошибкой: {"error": "<CODE>", "message": "..."}
 *
 * HTTP статус по коду ошибки плюс заголовок grpc-status для gRPC-Web клиентов.
 */
inline void sendError(IResponse& res, domain::AuthErrorCode code, const std::string& message) {
    nlohmann::json error;
    error["error"] = domain::toString(code);
    error["message"] = message;

    res.setHeader("grpc-status", std::to_string(domain::toGrpcStatus(code)));
    res.setHeader("grpc-message", message);
    res.setResult(domain::toHttpStatus(code), "application/json", error.dump());
}

} // namespace identity::adapters::primary
