#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace svcmon::core::service::dto {

/**
 * @brief 서비스 메트릭 종류
 */
enum class MetricKind : uint8_t {
    Info,       ///< name, display_name, process_id, run_as (값은 항상 1.0)
    State,      ///< name, state
    StartMode,  ///< name, start_mode
    Status      ///< name, status
};

inline const char* metricKindToString(MetricKind kind) {
    switch (kind) {
        case MetricKind::Info:      return "info";
        case MetricKind::State:     return "state";
        case MetricKind::StartMode: return "start_mode";
        case MetricKind::Status:    return "status";
        default:                    return "unknown";
    }
}

/**
 * @brief 싱크로 전달되는 출력 단위
 *
 * labelValues 순서는 MetricKind 별 라벨 이름 순서와 동일.
 */
struct MetricRow {
    MetricKind kind = MetricKind::Info;
    double value = 0.0;
    std::vector<std::string> labelValues;

    MetricRow() = default;

    MetricRow(MetricKind k, double v, std::vector<std::string> labels)
        : kind(k)
        , value(v)
        , labelValues(std::move(labels)) {}
};

} // namespace svcmon::core::service::dto
