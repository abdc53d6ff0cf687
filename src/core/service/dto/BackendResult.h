#pragma once

#include "ServiceRecord.h"

#include <cstddef>
#include <vector>

namespace svcmon::core::service::dto {

/**
 * @brief 백엔드 1회 조회 결과
 */
struct BackendResult {
    std::vector<ServiceRecord> records;

    /// 개별 오류로 건너뛴 서비스 수 (쿼리 백엔드는 항상 0)
    std::size_t skipped = 0;
};

} // namespace svcmon::core::service::dto
