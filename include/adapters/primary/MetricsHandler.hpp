#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IMetricsService.hpp"

#include <memory>

namespace identity::adapters::primary {

/**
 * @brief HTTP handler для endpoint /metrics
 *
 * @note Content-Type: text/plain; version=0.0.4; charset=utf-8
 */
class MetricsHandler : public IHttpHandler {
public:
    explicit MetricsHandler(std::shared_ptr<ports::input::IMetricsService> metrics)
        : metrics_(std::move(metrics)) {}

    void handle(IRequest& req, IResponse& res) override {
        res.setStatus(200);
        res.setHeader("Content-Type", "text/plain; version=0.0.4; charset=utf-8");
        res.setBody(metrics_->toPrometheusFormat());
    }

private:
    std::shared_ptr<ports::input::IMetricsService> metrics_;
};

} // namespace identity::adapters::primary
