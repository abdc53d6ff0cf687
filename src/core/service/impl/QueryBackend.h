#pragma once

#include "core/service/dto/BackendResult.h"
#include "core/service/dto/ServiceRecord.h"
#include "core/service/interfaces/IServiceQueryClient.h"

#include <memory>
#include <string>

namespace svcmon::core::service {

/**
 * @brief 선언적 쿼리 백엔드 (WMI Win32_Service)
 *
 * 필터가 적용된 단일 WQL 쿼리로 전체 목록을 가져옴.
 * 쿼리 실패는 패스 전체 실패이며 부분 결과는 반환하지 않음.
 */
class QueryBackend {
public:
    /**
     * @param client 쿼리 소스
     * @param filter WQL WHERE 절 (빈 문자열이면 필터 없음)
     */
    QueryBackend(std::shared_ptr<IServiceQueryClient> client, std::string filter);

    /**
     * @brief 쿼리 실행 및 정규화
     *
     * @throws ConnectionException, EnumerationException
     */
    dto::BackendResult fetch() const;

    const std::string& filter() const { return filter_; }

    /**
     * @brief WQL 문장 생성
     *
     * 예: buildQuery("StartMode='Auto'")
     *   -> "SELECT ... FROM Win32_Service WHERE StartMode='Auto'"
     */
    static std::string buildQuery(const std::string& filter);

    static dto::ServiceRecord normalize(const RawQueryService& raw);

private:
    std::shared_ptr<IServiceQueryClient> client_;
    std::string filter_;
};

} // namespace svcmon::core::service
