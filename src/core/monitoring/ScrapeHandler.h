// ScrapeHandler.h - 스크레이프 요청 1회 처리
// Copyright (C) 2025 svcmon Project

#ifndef SVCMON_CORE_MONITORING_SCRAPEHANDLER_H
#define SVCMON_CORE_MONITORING_SCRAPEHANDLER_H

#include "svcmon/service/ServiceCollector.hpp"

#include <memory>
#include <string>

namespace svcmon::core::monitoring {

/**
 * @brief 스크레이프마다 서비스 수집 패스를 실행하고 텍스트 포맷으로 반환
 *
 * 서비스 메트릭 뒤에 수집기 메타 메트릭을 추가함:
 * - <ns>_exporter_collector_duration_seconds{collector="service"}
 * - <ns>_exporter_collector_success{collector="service"} (성공 1, 실패 0)
 *
 * 실패한 패스에서 이미 생성된 행은 그대로 포함됨.
 */
class ScrapeHandler {
private:
    std::shared_ptr<const svcmon::service::ServiceCollector> collector_;
    std::string namespace_;

public:
    /**
     * @param collector 서비스 수집기
     * @param ns 메트릭 namespace (기본값: "windows")
     */
    explicit ScrapeHandler(std::shared_ptr<const svcmon::service::ServiceCollector> collector,
                           std::string ns = "windows");

    /**
     * @brief 패스 1회 실행 후 Prometheus 텍스트 반환
     *
     * 매 호출마다 독립된 싱크를 사용하므로 동시 호출에 안전함.
     */
    std::string scrape() const;

    /**
     * @brief scrape()와 동일하되 패스 결과도 반환
     */
    std::string scrape(svcmon::service::PassResult& result) const;
};

} // namespace svcmon::core::monitoring

#endif // SVCMON_CORE_MONITORING_SCRAPEHANDLER_H
