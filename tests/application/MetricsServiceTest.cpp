#include <gtest/gtest.h>

#include "application/MetricsService.hpp"

using namespace identity;

class MetricsServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        metrics_ = std::make_shared<application::MetricsService>(std::make_shared<settings::MetricsSettings>());
    }

    std::shared_ptr<application::MetricsService> metrics_;
};

TEST_F(MetricsServiceTest, DeclaredSeriesStartAtZero) {
    auto output = metrics_->toPrometheusFormat();

    EXPECT_NE(output.find("accounts_created_total 0"), std::string::npos);
    EXPECT_NE(output.find("auth_requests_total{result=\"deadline_exceeded\"} 0"), std::string::npos);
}

TEST_F(MetricsServiceTest, IncrementWithLabels) {
    metrics_->increment("auth_requests_total", {{"result", "authorized"}});
    metrics_->increment("auth_requests_total", {{"result", "authorized"}});

    EXPECT_EQ(metrics_->value("auth_requests_total{result=\"authorized\"}"), 2);
    EXPECT_EQ(metrics_->value("auth_requests_total{result=\"unauthenticated\"}"), 0);
}

TEST_F(MetricsServiceTest, UnknownFamily_Ignored) {
    metrics_->increment("http_requests_total");

    EXPECT_EQ(metrics_->value("http_requests_total"), 0);
    EXPECT_EQ(metrics_->toPrometheusFormat().find("http_requests_total"), std::string::npos);
}

TEST_F(MetricsServiceTest, SeriesFollowTheirFamilyHeader) {
    metrics_->increment("tokens_issued_total");
    auto output = metrics_->toPrometheusFormat();

    auto typeLine = output.find("# TYPE tokens_issued_total counter");
    auto series = output.find("tokens_issued_total 1");
    auto nextFamily = output.find("# HELP auth_requests_total");

    ASSERT_NE(typeLine, std::string::npos);
    EXPECT_GT(series, typeLine);
    EXPECT_LT(series, nextFamily);
}
