#pragma once

#include <IHttpHandler.hpp>
#include <memory>
#include <vector>
#include <iostream>
#include <nlohmann/json.hpp>

namespace identity::adapters::primary
{

    /**
     * @brief Цепочка middleware + handler
     *
     * Middleware сигнализирует "продолжить" статусом 0. Первый handler,
     * выставивший ненулевой статус, завершает цепочку.
     */
    class ChainHandler : public IHttpHandler
    {
    public:
        template <typename... Handlers>
        explicit ChainHandler(Handlers &&...handlers)
        {
            (handlers_.push_back(std::forward<Handlers>(handlers)), ...);
        }

        void handle(IRequest &req, IResponse &res) override
        {
            for (auto &h : handlers_)
            {
                h->handle(req, res);
                if (res.getStatus() != 0)
                    return;
            }

            std::cerr << "[ChainHandler] Error: middleware chain finished, but httpStatus is zero." << std::endl;
            nlohmann::json error;
            error["error"] = "INTERNAL";
            error["message"] = "Internal server error";
            res.setResult(500, "application/json", error.dump());
        }

    private:
        std::vector<std::shared_ptr<IHttpHandler>> handlers_;
    };

} // namespace identity::adapters::primary
