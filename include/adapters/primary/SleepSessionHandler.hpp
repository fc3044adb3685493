#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ISleepSessionService.hpp"
#include "domain/StorageExceptions.hpp"
#include "domain/Timestamp.hpp"
#include "CallContextAttributes.hpp"
#include "ErrorResponse.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace identity::adapters::primary
{

    /**
     * @brief GET/POST /api/v1/sleep/sessions: записи о сне вызывающего
     *
     * Регистрируется только за AuthInterceptorMiddleware. Владелец записей -
     * accountId из CallContext; поля account_id/user_id в теле игнорируются.
     *
     * POST body:
     * {
     *   "started_at": "2026-10-17T23:10:00Z",
     *   "ended_at":   "2026-10-18T06:40:00Z",
     *   "quality": 82,
     *   "notes": "..."
     * }
     */
    class SleepSessionHandler : public IHttpHandler
    {
    public:
        explicit SleepSessionHandler(
            std::shared_ptr<ports::input::ISleepSessionService> sleepService) : sleepService_(std::move(sleepService))
        {
            std::cout << "[SleepSessionHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            auto context = CallContextAttributes::resolve(req);
            if (!context)
            {
                sendError(res, domain::AuthErrorCode::UNAUTHENTICATED, "Bearer token required");
                return;
            }

            try
            {
                if (req.getMethod() == "GET")
                {
                    handleList(*context, res);
                }
                else if (req.getMethod() == "POST")
                {
                    handleRecord(*context, req, res);
                }
                else
                {
                    res.setResult(405, "application/json", R"({"error": "Method not allowed"})");
                }
            }
            catch (const nlohmann::json::exception &)
            {
                sendError(res, domain::AuthErrorCode::INVALID_ARGUMENT, "Invalid request body");
            }
            catch (const domain::UnknownAccountException &e)
            {
                std::cerr << "[SleepSessionHandler] " << e.what() << std::endl;
                sendError(res, domain::AuthErrorCode::INVALID_ARGUMENT, "Unknown account");
            }
            catch (const std::invalid_argument &e)
            {
                sendError(res, domain::AuthErrorCode::INVALID_ARGUMENT, e.what());
            }
            catch (const domain::StorageTimeoutException &e)
            {
                std::cerr << "[SleepSessionHandler] Storage timeout: " << e.what() << std::endl;
                sendError(res, domain::AuthErrorCode::DEADLINE_EXCEEDED, "Storage timed out");
            }
            catch (const domain::StorageUnavailableException &e)
            {
                std::cerr << "[SleepSessionHandler] Storage unavailable: " << e.what() << std::endl;
                sendError(res, domain::AuthErrorCode::UNAVAILABLE, "Storage unavailable");
            }
        }

    private:
        std::shared_ptr<ports::input::ISleepSessionService> sleepService_;

        void handleList(const domain::CallContext &context, IResponse &res)
        {
            nlohmann::json items = nlohmann::json::array();
            for (const auto &session : sleepService_->listSessions(context))
            {
                items.push_back(toJson(session));
            }

            nlohmann::json response;
            response["account_id"] = context.accountId;
            response["sessions"] = items;
            res.setResult(200, "application/json", response.dump());
        }

        void handleRecord(const domain::CallContext &context, IRequest &req, IResponse &res)
        {
            auto body = nlohmann::json::parse(req.getBody());
            if (!body.is_object())
            {
                throw std::invalid_argument("Request body must be a JSON object");
            }

            ports::input::RecordSleepRequest request;
            request.startedAt = domain::Timestamp::fromString(body.at("started_at").get<std::string>());
            request.endedAt = domain::Timestamp::fromString(body.at("ended_at").get<std::string>());
            request.quality = body.value("quality", 0);
            request.notes = body.value("notes", "");

            auto session = sleepService_->recordSession(context, request);
            res.setResult(201, "application/json", toJson(session).dump());
        }

        static nlohmann::json toJson(const domain::SleepSession &session)
        {
            nlohmann::json j;
            j["session_id"] = session.sessionId;
            j["account_id"] = session.accountId;
            j["started_at"] = domain::Timestamp::toString(session.startedAt);
            j["ended_at"] = domain::Timestamp::toString(session.endedAt);
            j["duration_minutes"] = session.durationMinutes();
            j["quality"] = session.quality;
            j["notes"] = session.notes;
            return j;
        }
    };

} // namespace identity::adapters::primary
