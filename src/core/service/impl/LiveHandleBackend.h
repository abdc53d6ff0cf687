#pragma once

#include "core/service/dto/BackendResult.h"
#include "core/service/dto/ServiceRecord.h"
#include "core/service/interfaces/IServiceManager.h"

#include <memory>
#include <optional>
#include <string>

namespace svcmon::core::service {

/**
 * @brief 라이브 핸들 백엔드 (Service Control Manager)
 *
 * 패스마다 관리자에 새로 연결하고, 서비스별로 핸들을 열어
 * config/status 를 조회한 뒤 즉시 닫음.
 *
 * 오류 처리:
 * - 연결 실패, 목록 조회 실패: 예외 전파 (패스 실패)
 * - 개별 서비스 open/config/query 실패: 해당 서비스만 건너뜀
 *
 * 쿼리 필터는 적용하지 않음.
 */
class LiveHandleBackend {
public:
    explicit LiveHandleBackend(std::shared_ptr<IServiceManager> manager);

    /**
     * @throws ConnectionException, EnumerationException
     */
    dto::BackendResult fetch() const;

private:
    /**
     * @brief 서비스 1건 조회
     *
     * @return 개별 오류 시 std::nullopt (핸들은 이미 닫힌 상태)
     */
    std::optional<dto::ServiceRecord> queryService(IServiceManagerConnection& connection,
                                                   const std::string& name) const;

    std::shared_ptr<IServiceManager> manager_;
};

} // namespace svcmon::core::service
