// MetricDescriptors.h - 서비스 메트릭 이름/도움말/라벨 정의
// Copyright (C) 2025 svcmon Project

#ifndef SVCMON_CORE_MONITORING_METRICDESCRIPTORS_H
#define SVCMON_CORE_MONITORING_METRICDESCRIPTORS_H

#include "core/service/dto/MetricRow.h"

#include <string>
#include <vector>

namespace svcmon::core::monitoring {

/**
 * @brief 메트릭 패밀리 정의
 */
struct MetricDescriptor {
    std::string name;                     ///< 완전한 이름 (예: windows_service_state)
    std::string help;
    std::vector<std::string> labelNames;
};

/**
 * @brief namespace_subsystem_name 형태의 이름 생성
 *
 * 빈 구성 요소는 건너뜀.
 */
std::string buildFQName(const std::string& ns, const std::string& subsystem, const std::string& name);

/**
 * @brief 서비스 메트릭 종류별 descriptor
 *
 * @param ns 메트릭 namespace (기본값 "windows")
 */
MetricDescriptor describe(service::dto::MetricKind kind, const std::string& ns);

} // namespace svcmon::core::monitoring

#endif // SVCMON_CORE_MONITORING_METRICDESCRIPTORS_H
