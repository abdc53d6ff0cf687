#include "core/service/impl/RowEmitter.h"
#include "mocks/RecordingSink.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

using namespace svcmon::core::service;
using svcmon::service::test::RecordingSink;
using ::testing::ElementsAre;
using ::testing::Pair;

namespace {

dto::ServiceRecord makeRecord() {
    dto::ServiceRecord record;
    record.name = "WinRM";
    record.displayName = "Windows Remote Management (WS-Management)";
    record.processId = 1234;
    record.runAs = "NT AUTHORITY\\NetworkService";
    record.state = ServiceState::Running;
    record.startMode = StartMode::Auto;
    record.status = ServiceStatus::Ok;
    return record;
}

int countOnes(const std::vector<dto::MetricRow>& rows) {
    int ones = 0;
    for (const auto& row : rows) {
        if (row.value == 1.0) {
            ++ones;
        } else {
            EXPECT_EQ(0.0, row.value);
        }
    }
    return ones;
}

} // namespace

// ============================================================================
// One-hot encoding
// ============================================================================

TEST(OneHotTest, ExactlyOneIndicatorInCanonicalOrder) {
    auto entries = oneHot(kAllStartModes, std::optional<StartMode>(StartMode::Manual));

    std::vector<std::pair<std::string, double>> actual;
    for (const auto& [label, indicator] : entries) {
        actual.emplace_back(std::string(label), indicator);
    }

    EXPECT_THAT(actual, ElementsAre(
        Pair("boot", 0.0),
        Pair("system", 0.0),
        Pair("auto", 0.0),
        Pair("manual", 1.0),
        Pair("disabled", 0.0)));
}

TEST(OneHotTest, MissingValueIsAllZero) {
    auto entries = oneHot(kAllStatuses, std::optional<ServiceStatus>());

    ASSERT_EQ(12u, entries.size());
    for (const auto& [label, indicator] : entries) {
        EXPECT_EQ(0.0, indicator) << label;
    }
}

// ============================================================================
// Row building
// ============================================================================

TEST(RowEmitterTest, TwentySixRowsPerService) {
    EXPECT_EQ(26u, kRowsPerService);
    EXPECT_EQ(26u, buildRows(makeRecord()).size());
}

TEST(RowEmitterTest, InfoRowComesFirst) {
    auto rows = buildRows(makeRecord());

    ASSERT_FALSE(rows.empty());
    EXPECT_EQ(dto::MetricKind::Info, rows[0].kind);
    EXPECT_EQ(1.0, rows[0].value);
    EXPECT_THAT(rows[0].labelValues, ElementsAre(
        "winrm",
        "Windows Remote Management (WS-Management)",
        "1234",
        "NT AUTHORITY\\NetworkService"));
}

TEST(RowEmitterTest, NameLowerCasedInEveryRow) {
    for (const auto& row : buildRows(makeRecord())) {
        ASSERT_FALSE(row.labelValues.empty());
        EXPECT_EQ("winrm", row.labelValues[0]);
    }
}

TEST(RowEmitterTest, RunningStateIsHot) {
    RecordingSink sink;
    EXPECT_EQ(26u, emitRows(makeRecord(), sink));

    auto states = sink.rowsOf(dto::MetricKind::State, "winrm");
    ASSERT_EQ(8u, states.size());
    EXPECT_EQ(1, countOnes(states));
    EXPECT_EQ(1.0, sink.valueOf(dto::MetricKind::State, "winrm", "running"));
    EXPECT_EQ(0.0, sink.valueOf(dto::MetricKind::State, "winrm", "stopped"));
}

TEST(RowEmitterTest, StartModeAndStatusOneHot) {
    RecordingSink sink;
    emitRows(makeRecord(), sink);

    auto modes = sink.rowsOf(dto::MetricKind::StartMode, "winrm");
    ASSERT_EQ(5u, modes.size());
    EXPECT_EQ(1, countOnes(modes));
    EXPECT_EQ(1.0, sink.valueOf(dto::MetricKind::StartMode, "winrm", "auto"));

    auto statuses = sink.rowsOf(dto::MetricKind::Status, "winrm");
    ASSERT_EQ(12u, statuses.size());
    EXPECT_EQ(1, countOnes(statuses));
    EXPECT_EQ(1.0, sink.valueOf(dto::MetricKind::Status, "winrm", "ok"));
}

TEST(RowEmitterTest, RecordWithoutStatusEmitsZeroStatusRows) {
    auto record = makeRecord();
    record.status.reset();

    RecordingSink sink;
    EXPECT_EQ(26u, emitRows(record, sink));

    auto statuses = sink.rowsOf(dto::MetricKind::Status, "winrm");
    ASSERT_EQ(12u, statuses.size());
    EXPECT_EQ(0, countOnes(statuses));
}

TEST(RowEmitterTest, UnmappedStartModeStillEmitsFiveRows) {
    auto record = makeRecord();
    record.startMode.reset();

    auto rows = buildRows(record);
    ASSERT_EQ(26u, rows.size());

    std::vector<dto::MetricRow> modes;
    for (const auto& row : rows) {
        if (row.kind == dto::MetricKind::StartMode) {
            modes.push_back(row);
        }
    }
    ASSERT_EQ(5u, modes.size());
    EXPECT_EQ(0, countOnes(modes));
}

TEST(RowEmitterTest, StoppedServiceReportsZeroPid) {
    auto record = makeRecord();
    record.processId = 0;
    record.state = ServiceState::Stopped;

    auto rows = buildRows(record);
    EXPECT_EQ("0", rows[0].labelValues[2]);
}
