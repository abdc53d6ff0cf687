#include "svcmon/service/ServiceCollector.hpp"
#include "core/service/util/ServiceEnums.h"
#include "core/service/util/ServiceException.h"
#include "mocks/FakeServiceManager.h"
#include "mocks/MockServiceQueryClient.h"
#include "mocks/RecordingSink.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <map>
#include <sstream>
#include <thread>
#include <vector>

using namespace svcmon::service;
using namespace svcmon::core::service;
using svcmon::service::test::FakeServiceManager;
using svcmon::service::test::MockServiceQueryClient;
using svcmon::service::test::RecordingSink;
using svcmon::core::service::dto::MetricKind;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

class ServiceCollectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        query_client_ = std::make_shared<MockServiceQueryClient>();
        manager_ = std::make_shared<FakeServiceManager>();
    }

    ServiceCollectorConfig liveConfig() const {
        ServiceCollectorConfig config;
        config.useLiveApi = true;
        config.filter = "Name='ignored'";
        return config;
    }

    ServiceCollectorConfig queryConfig(const std::string& filter = "") const {
        ServiceCollectorConfig config;
        config.useLiveApi = false;
        config.filter = filter;
        return config;
    }

    static RawQueryService raw(const std::string& name, const std::string& state) {
        RawQueryService r;
        r.name = name;
        r.displayName = name;
        r.state = state;
        r.startMode = "Manual";
        r.status = "OK";
        return r;
    }

    std::shared_ptr<MockServiceQueryClient> query_client_;
    std::shared_ptr<FakeServiceManager> manager_;
};

// ============================================================================
// Backend selection
// ============================================================================

TEST_F(ServiceCollectorTest, LiveApiSelectedByFlag) {
    ServiceCollector collector(liveConfig(), query_client_, manager_);
    EXPECT_TRUE(collector.usesLiveApi());

    EXPECT_CALL(*query_client_, queryServices(_)).Times(0);

    RecordingSink sink;
    EXPECT_TRUE(collector.collect(sink).ok());
    EXPECT_EQ(1, manager_->counters().connects.load());
}

TEST_F(ServiceCollectorTest, QueryBackendSelectedByFlag) {
    EXPECT_CALL(*query_client_, queryServices(_))
        .WillOnce(Return(std::vector<RawQueryService>{}));

    ServiceCollector collector(queryConfig(), query_client_, manager_);
    EXPECT_FALSE(collector.usesLiveApi());

    RecordingSink sink;
    EXPECT_TRUE(collector.collect(sink).ok());
    EXPECT_EQ(0, manager_->counters().connects.load());
}

TEST_F(ServiceCollectorTest, MissingDependencyForSelectedBackendThrows) {
    EXPECT_THROW(ServiceCollector(liveConfig(), query_client_, nullptr), std::invalid_argument);
    EXPECT_THROW(ServiceCollector(queryConfig(), nullptr, manager_), std::invalid_argument);
}

TEST_F(ServiceCollectorTest, FilterIgnoredByLiveBackend) {
    manager_->addService("WinRM", "WinRM", kApiStateRunning, kApiStartAuto);
    manager_->addService("Spooler", "Spooler", kApiStateRunning, kApiStartAuto);

    ServiceCollector collector(liveConfig(), query_client_, manager_);
    RecordingSink sink;
    auto result = collector.collect(sink);

    EXPECT_EQ(2u, result.servicesEmitted);
}

TEST_F(ServiceCollectorTest, DefaultConfigLogsBothWarnings) {
    std::ostringstream captured;
    auto previous = spdlog::default_logger();
    spdlog::set_default_logger(std::make_shared<spdlog::logger>(
        "capture", std::make_shared<spdlog::sinks::ostream_sink_mt>(captured)));

    ServiceCollectorConfig config;
    config.useLiveApi = true;
    ServiceCollector collector(config, query_client_, manager_);
    spdlog::default_logger()->flush();
    spdlog::set_default_logger(previous);

    EXPECT_NE(std::string::npos, captured.str().find("WMI collection is disabled."));
    EXPECT_NE(std::string::npos, captured.str().find("No where-clause specified"));
}

// ============================================================================
// Live API pass
// ============================================================================

TEST_F(ServiceCollectorTest, LivePassEmitsTwentySixRowsPerService) {
    manager_->addService("WinRM", "Windows Remote Management", kApiStateRunning, kApiStartAuto, 812);
    manager_->addService("Spooler", "Print Spooler", kApiStateStopped, kApiStartDemand);

    ServiceCollector collector(liveConfig(), query_client_, manager_);
    RecordingSink sink;
    auto result = collector.collect(sink);

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(PassState::DONE, result.finalState);
    EXPECT_EQ(PassErrorKind::NONE, result.errorKind);
    EXPECT_TRUE(result.error.empty());
    EXPECT_EQ(2u, result.servicesEmitted);
    EXPECT_EQ(52u, result.rowsEmitted);
    EXPECT_EQ(52u, sink.rows.size());
}

TEST_F(ServiceCollectorTest, LivePassRunningStateOneHot) {
    manager_->addService("X", "X", kApiStateRunning, kApiStartAuto);

    ServiceCollector collector(liveConfig(), query_client_, manager_);
    RecordingSink sink;
    collector.collect(sink);

    auto states = sink.rowsOf(MetricKind::State, "x");
    ASSERT_EQ(8u, states.size());
    for (const auto& row : states) {
        const double expected = row.labelValues[1] == "running" ? 1.0 : 0.0;
        EXPECT_EQ(expected, row.value) << row.labelValues[1];
    }
}

TEST_F(ServiceCollectorTest, LivePassStatusRowsAllZero) {
    manager_->addService("WinRM", "WinRM", kApiStateRunning, kApiStartAuto);
    manager_->addService("Dhcp", "Dhcp", kApiStateStopped, kApiStartDisabled);

    ServiceCollector collector(liveConfig(), query_client_, manager_);
    RecordingSink sink;
    collector.collect(sink);

    for (const auto& name : {"winrm", "dhcp"}) {
        auto statuses = sink.rowsOf(MetricKind::Status, name);
        ASSERT_EQ(12u, statuses.size());
        for (const auto& row : statuses) {
            EXPECT_EQ(0.0, row.value);
        }
    }
}

TEST_F(ServiceCollectorTest, LivePassNamesLowerCasedEverywhere) {
    manager_->addService("WinRM", "Windows Remote Management", kApiStateRunning, kApiStartAuto);

    ServiceCollector collector(liveConfig(), query_client_, manager_);
    RecordingSink sink;
    collector.collect(sink);

    std::map<MetricKind, int> per_kind;
    for (const auto& row : sink.rows) {
        EXPECT_EQ("winrm", row.labelValues[0]);
        ++per_kind[row.kind];
    }
    EXPECT_EQ(1, per_kind[MetricKind::Info]);
    EXPECT_EQ(8, per_kind[MetricKind::State]);
    EXPECT_EQ(5, per_kind[MetricKind::StartMode]);
    EXPECT_EQ(12, per_kind[MetricKind::Status]);
}

TEST_F(ServiceCollectorTest, LivePassSkipsFailedServiceWithoutError) {
    manager_->addService("A", "A", kApiStateRunning, kApiStartAuto);
    manager_->addService("B", "B", kApiStateRunning, kApiStartAuto);
    manager_->addService("C", "C", kApiStateRunning, kApiStartAuto);
    manager_->failService("B", FakeServiceManager::Failure::OPEN);

    ServiceCollector collector(liveConfig(), query_client_, manager_);
    RecordingSink sink;
    auto result = collector.collect(sink);

    EXPECT_TRUE(result.ok());
    EXPECT_TRUE(result.error.empty());
    EXPECT_EQ(2u, result.servicesEmitted);
    EXPECT_EQ(1u, result.servicesSkipped);
    EXPECT_EQ(52u, sink.rows.size());
    EXPECT_TRUE(sink.rowsOf(MetricKind::Info, "b").empty());
}

TEST_F(ServiceCollectorTest, LivePassConnectionFailure) {
    manager_->addService("A", "A", kApiStateRunning, kApiStartAuto);
    manager_->setConnectFails(true);

    ServiceCollector collector(liveConfig(), query_client_, manager_);
    RecordingSink sink;
    auto result = collector.collect(sink);

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(PassState::FAILED, result.finalState);
    EXPECT_EQ(PassErrorKind::CONNECTION, result.errorKind);
    EXPECT_FALSE(result.error.empty());
    EXPECT_TRUE(sink.rows.empty());
}

TEST_F(ServiceCollectorTest, LivePassEnumerationFailure) {
    manager_->setListFails(true);

    ServiceCollector collector(liveConfig(), query_client_, manager_);
    RecordingSink sink;
    auto result = collector.collect(sink);

    EXPECT_EQ(PassErrorKind::ENUMERATION, result.errorKind);
    EXPECT_TRUE(sink.rows.empty());
}

// ============================================================================
// Query pass
// ============================================================================

TEST_F(ServiceCollectorTest, QueryPassUsesConfiguredFilter) {
    EXPECT_CALL(*query_client_, queryServices(QueryBackend::buildQuery("Name='WinRM'")))
        .WillOnce(Return(std::vector<RawQueryService>{raw("WinRM", "Running")}));

    ServiceCollector collector(queryConfig("Name='WinRM'"), query_client_, manager_);
    RecordingSink sink;
    auto result = collector.collect(sink);

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(26u, sink.rows.size());
    EXPECT_EQ(1.0, sink.valueOf(MetricKind::State, "winrm", "running"));
    EXPECT_EQ(1.0, sink.valueOf(MetricKind::StartMode, "winrm", "manual"));
    EXPECT_EQ(1.0, sink.valueOf(MetricKind::Status, "winrm", "ok"));
}

TEST_F(ServiceCollectorTest, QueryPassFailureEmitsNothing) {
    EXPECT_CALL(*query_client_, queryServices(_))
        .WillOnce(Throw(EnumerationException("ExecQuery failed")));

    ServiceCollector collector(queryConfig(), query_client_, manager_);
    RecordingSink sink;
    auto result = collector.collect(sink);

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(PassErrorKind::ENUMERATION, result.errorKind);
    EXPECT_NE(std::string::npos, result.error.find("ExecQuery failed"));
    EXPECT_TRUE(sink.rows.empty());
    EXPECT_EQ(0u, result.rowsEmitted);
}

TEST_F(ServiceCollectorTest, UnclassifiedBackendErrorFailsPass) {
    EXPECT_CALL(*query_client_, queryServices(_))
        .WillOnce(Throw(ServiceException("WMI returned unexpected result")));

    ServiceCollector collector(queryConfig(), query_client_, manager_);
    RecordingSink sink;
    PassResult result;
    EXPECT_NO_THROW(result = collector.collect(sink));

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(PassState::FAILED, result.finalState);
    EXPECT_EQ(PassErrorKind::INTERNAL, result.errorKind);
    EXPECT_NE(std::string::npos, result.error.find("unexpected result"));
    EXPECT_TRUE(sink.rows.empty());
}

TEST_F(ServiceCollectorTest, QueryPassUnknownStartModeAllZero) {
    auto r = raw("Odd", "Running");
    r.startMode = "Sometimes";
    EXPECT_CALL(*query_client_, queryServices(_))
        .WillOnce(Return(std::vector<RawQueryService>{r}));

    ServiceCollector collector(queryConfig(), query_client_, manager_);
    RecordingSink sink;
    ASSERT_TRUE(collector.collect(sink).ok());

    auto modes = sink.rowsOf(MetricKind::StartMode, "odd");
    ASSERT_EQ(5u, modes.size());
    for (const auto& row : modes) {
        EXPECT_EQ(0.0, row.value);
    }
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(ServiceCollectorTest, ConcurrentPassesUseIndependentConnections) {
    manager_->addService("WinRM", "WinRM", kApiStateRunning, kApiStartAuto);
    manager_->addService("Spooler", "Spooler", kApiStateStopped, kApiStartDemand);
    manager_->addService("Dhcp", "Dhcp", kApiStateRunning, kApiStartAuto);

    const ServiceCollector collector(liveConfig(), query_client_, manager_);

    constexpr int kPasses = 4;
    std::vector<RecordingSink> sinks(kPasses);
    std::vector<PassResult> results(kPasses);
    std::vector<std::thread> threads;
    for (int i = 0; i < kPasses; ++i) {
        threads.emplace_back([&, i]() { results[i] = collector.collect(sinks[i]); });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (int i = 0; i < kPasses; ++i) {
        EXPECT_TRUE(results[i].ok()) << "pass " << i;
        EXPECT_EQ(78u, sinks[i].rows.size()) << "pass " << i;
    }
    EXPECT_EQ(kPasses, manager_->counters().connects.load());
    EXPECT_EQ(kPasses, manager_->counters().disconnects.load());
    EXPECT_EQ(3 * kPasses, manager_->counters().handles_opened.load());
    EXPECT_EQ(3 * kPasses, manager_->counters().handles_closed.load());
}

TEST_F(ServiceCollectorTest, PassStateNames) {
    EXPECT_STREQ("idle", passStateToString(PassState::IDLE));
    EXPECT_STREQ("collecting", passStateToString(PassState::COLLECTING));
    EXPECT_STREQ("failed", passStateToString(PassState::FAILED));
}
