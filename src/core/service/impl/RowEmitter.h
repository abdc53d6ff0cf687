#pragma once

#include "core/service/dto/MetricRow.h"
#include "core/service/dto/ServiceRecord.h"
#include "core/service/interfaces/IMetricSink.h"
#include "core/service/util/ServiceEnums.h"

#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace svcmon::core::service {

/// (canonical 라벨, 0.0 또는 1.0)
using OneHotEntry = std::pair<std::string_view, double>;

/**
 * @brief one-hot 인코딩
 *
 * values 순서대로 모든 canonical 값을 정확히 한 번씩 반환.
 * current 가 std::nullopt 이면 전부 0.0.
 *
 * @param values canonical 열거 순서
 * @param current 현재 값
 */
template <typename E, std::size_t N>
std::vector<OneHotEntry> oneHot(const std::array<E, N>& values, std::optional<E> current) {
    std::vector<OneHotEntry> entries;
    entries.reserve(N);
    for (const auto value : values) {
        const double indicator = (current && *current == value) ? 1.0 : 0.0;
        entries.emplace_back(toLabel(value), indicator);
    }
    return entries;
}

/// 서비스 1건당 행 수: info 1 + state 8 + start_mode 5 + status 12
inline constexpr std::size_t kRowsPerService =
    1 + kAllStates.size() + kAllStartModes.size() + kAllStatuses.size();

/**
 * @brief ServiceRecord -> MetricRow 목록
 *
 * 순서: info, state, start_mode, status. 서비스 이름은 소문자로 변환됨.
 */
std::vector<dto::MetricRow> buildRows(const dto::ServiceRecord& record);

/**
 * @brief buildRows 결과를 싱크로 전송
 *
 * @return 전송한 행 수 (항상 kRowsPerService)
 */
std::size_t emitRows(const dto::ServiceRecord& record, IMetricSink& sink);

} // namespace svcmon::core::service
