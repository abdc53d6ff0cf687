#pragma once

#include "core/service/dto/MetricRow.h"
#include "core/service/interfaces/IMetricSink.h"

#include <string>
#include <vector>

namespace svcmon::service::test {

using svcmon::core::service::dto::MetricKind;
using svcmon::core::service::dto::MetricRow;

// 전달받은 행을 순서대로 저장하는 테스트용 싱크
class RecordingSink : public svcmon::core::service::IMetricSink {
public:
    void send(const MetricRow& row) override { rows.push_back(row); }

    std::vector<MetricRow> rowsOf(MetricKind kind, const std::string& name) const {
        std::vector<MetricRow> result;
        for (const auto& row : rows) {
            if (row.kind == kind && !row.labelValues.empty() && row.labelValues[0] == name) {
                result.push_back(row);
            }
        }
        return result;
    }

    // 특정 라벨 값의 행 값 (없으면 -1)
    double valueOf(MetricKind kind, const std::string& name, const std::string& label) const {
        for (const auto& row : rowsOf(kind, name)) {
            if (row.labelValues.size() > 1 && row.labelValues[1] == label) {
                return row.value;
            }
        }
        return -1.0;
    }

    std::vector<MetricRow> rows;
};

} // namespace svcmon::service::test
