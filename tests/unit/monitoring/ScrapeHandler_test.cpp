// ScrapeHandler_test.cpp
// Copyright (C) 2025 svcmon Project

#include "core/monitoring/ScrapeHandler.h"
#include "core/service/util/ServiceEnums.h"
#include "core/service/util/ServiceException.h"
#include "mocks/FakeServiceManager.h"
#include "mocks/MockServiceQueryClient.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace svcmon::core::monitoring;
using namespace svcmon::core::service;
using svcmon::service::PassErrorKind;
using svcmon::service::PassResult;
using svcmon::service::ServiceCollector;
using svcmon::service::ServiceCollectorConfig;
using svcmon::service::test::FakeServiceManager;
using svcmon::service::test::MockServiceQueryClient;
using ::testing::_;
using ::testing::Throw;

class ScrapeHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        manager_ = std::make_shared<FakeServiceManager>();
        manager_->addService("WinRM", "Windows Remote Management", kApiStateRunning, kApiStartAuto, 812,
                             "NT AUTHORITY\\NetworkService");
        manager_->addService("Spooler", "Print Spooler", kApiStateStopped, kApiStartDemand);
    }

    std::shared_ptr<const ServiceCollector> liveCollector() const {
        ServiceCollectorConfig config;
        config.useLiveApi = true;
        return std::make_shared<const ServiceCollector>(config, nullptr, manager_);
    }

    static bool contains(const std::string& haystack, const std::string& needle) {
        return haystack.find(needle) != std::string::npos;
    }

    std::shared_ptr<FakeServiceManager> manager_;
};

TEST_F(ScrapeHandlerTest, RequiresCollector) {
    EXPECT_THROW(ScrapeHandler(nullptr), std::invalid_argument);
}

TEST_F(ScrapeHandlerTest, SuccessfulScrape) {
    ScrapeHandler handler(liveCollector());

    PassResult result;
    const std::string output = handler.scrape(result);

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(2u, result.servicesEmitted);

    EXPECT_TRUE(contains(output,
        "windows_service_info{name=\"winrm\",display_name=\"Windows Remote Management\","
        "process_id=\"812\",run_as=\"NT AUTHORITY\\\\NetworkService\"} 1"));
    EXPECT_TRUE(contains(output, "windows_service_state{name=\"spooler\",state=\"stopped\"} 1"));
    EXPECT_TRUE(contains(output, "windows_service_start_mode{name=\"spooler\",start_mode=\"manual\"} 1"));
    EXPECT_TRUE(contains(output, "windows_service_status{name=\"winrm\",status=\"ok\"} 0"));
    EXPECT_TRUE(contains(output, "windows_exporter_collector_success{collector=\"service\"} 1"));
    EXPECT_TRUE(contains(output, "# TYPE windows_exporter_collector_duration_seconds gauge"));
    EXPECT_TRUE(contains(output, "windows_exporter_collector_duration_seconds{collector=\"service\"} "));
}

TEST_F(ScrapeHandlerTest, ConnectionFailureReportsZeroSuccess) {
    manager_->setConnectFails(true);
    ScrapeHandler handler(liveCollector());

    PassResult result;
    const std::string output = handler.scrape(result);

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(PassErrorKind::CONNECTION, result.errorKind);
    EXPECT_TRUE(contains(output, "windows_exporter_collector_success{collector=\"service\"} 0"));
    EXPECT_FALSE(contains(output, "windows_service_"));
}

TEST_F(ScrapeHandlerTest, QueryFailureReportsZeroSuccess) {
    auto client = std::make_shared<MockServiceQueryClient>();
    EXPECT_CALL(*client, queryServices(_))
        .WillOnce(Throw(EnumerationException("Next failed")));

    ServiceCollectorConfig config;
    config.useLiveApi = false;
    ScrapeHandler handler(std::make_shared<const ServiceCollector>(config, client, nullptr));

    const std::string output = handler.scrape();
    EXPECT_TRUE(contains(output, "windows_exporter_collector_success{collector=\"service\"} 0"));
}

TEST_F(ScrapeHandlerTest, UnclassifiedErrorReportsZeroSuccess) {
    auto client = std::make_shared<MockServiceQueryClient>();
    EXPECT_CALL(*client, queryServices(_))
        .WillOnce(Throw(ServiceException("WMI returned unexpected result")));

    ServiceCollectorConfig config;
    config.useLiveApi = false;
    ScrapeHandler handler(std::make_shared<const ServiceCollector>(config, client, nullptr));

    PassResult result;
    std::string output;
    EXPECT_NO_THROW(output = handler.scrape(result));
    EXPECT_EQ(PassErrorKind::INTERNAL, result.errorKind);
    EXPECT_TRUE(contains(output, "windows_exporter_collector_success{collector=\"service\"} 0"));
}

TEST_F(ScrapeHandlerTest, CustomNamespace) {
    ScrapeHandler handler(liveCollector(), "svc");

    const std::string output = handler.scrape();
    EXPECT_TRUE(contains(output, "svc_service_state{name=\"winrm\",state=\"running\"} 1"));
    EXPECT_TRUE(contains(output, "svc_exporter_collector_success{collector=\"service\"} 1"));
    EXPECT_FALSE(contains(output, "windows_"));
}

TEST_F(ScrapeHandlerTest, IndependentPassPerScrape) {
    ScrapeHandler handler(liveCollector());

    const std::string first = handler.scrape();
    manager_->addService("Dhcp", "DHCP Client", kApiStateRunning, kApiStartAuto);
    const std::string second = handler.scrape();

    EXPECT_FALSE(contains(first, "name=\"dhcp\""));
    EXPECT_TRUE(contains(second, "windows_service_state{name=\"dhcp\",state=\"running\"} 1"));
    EXPECT_EQ(2, manager_->counters().connects.load());
}
