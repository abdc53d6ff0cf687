#pragma once

#include "core/service/util/ServiceEnums.h"

#include <cstdint>
#include <optional>
#include <string>

namespace svcmon::core::service::dto {

/**
 * @brief 백엔드가 정규화한 서비스 스냅샷
 *
 * 패스마다 새로 생성되고 행(row) 변환 후 폐기됨.
 *
 * @example
 * ServiceRecord record;
 * record.name = "WinRM";
 * record.state = ServiceState::Running;
 * record.startMode = StartMode::Auto;
 * // status 미설정 -> 12개 status 행 모두 0
 */
struct ServiceRecord {
    /// 서비스 이름 (원본 대소문자 유지, 라벨 생성 시 소문자 변환)
    std::string name;

    /// 표시 이름 (빈 문자열 가능)
    std::string displayName;

    /// 프로세스 ID (실행 중이 아니면 0)
    uint32_t processId = 0;

    /// 실행 계정 (알 수 없으면 빈 문자열)
    std::string runAs;

    ServiceState state = ServiceState::Unknown;

    /// 매핑 실패 시 std::nullopt
    std::optional<StartMode> startMode;

    /// 라이브 API 백엔드는 항상 std::nullopt
    std::optional<ServiceStatus> status;
};

} // namespace svcmon::core::service::dto
