#ifndef SVCMON_SERVICE_SERVICE_COLLECTOR_HPP
#define SVCMON_SERVICE_SERVICE_COLLECTOR_HPP

#include "core/service/impl/LiveHandleBackend.h"
#include "core/service/impl/QueryBackend.h"
#include "core/service/interfaces/IMetricSink.h"
#include "core/service/interfaces/IServiceManager.h"
#include "core/service/interfaces/IServiceQueryClient.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <variant>

namespace svcmon {
namespace service {

/**
 * @brief 서비스 수집기 설정
 *
 * 프로세스 수명 동안 고정됨.
 */
struct ServiceCollectorConfig {
    /// WQL WHERE 절 (쿼리 백엔드 전용, 빈 문자열이면 전체)
    std::string filter;

    /// true 이면 라이브 API(SCM) 백엔드, false 이면 WMI 쿼리 백엔드
    bool useLiveApi = true;
};

/**
 * @brief 패스 진행 단계
 */
enum class PassState : uint8_t {
    IDLE,
    SELECTING_BACKEND,
    COLLECTING,
    EMITTING,
    DONE,
    FAILED
};

const char* passStateToString(PassState state);

/**
 * @brief 패스 실패 원인
 */
enum class PassErrorKind : uint8_t {
    NONE,
    CONNECTION,
    ENUMERATION,
    INTERNAL     ///< 분류되지 않은 예외 (잘못된 행, 메모리 부족 등)
};

/**
 * @brief 패스 1회 결과
 *
 * 오류는 패스 전체 실패일 때만 설정됨. 개별 서비스 skip 은 오류가 아님.
 */
struct PassResult {
    PassState finalState = PassState::IDLE;
    PassErrorKind errorKind = PassErrorKind::NONE;
    std::string error;
    std::size_t servicesEmitted = 0;
    std::size_t servicesSkipped = 0;
    std::size_t rowsEmitted = 0;

    bool ok() const { return finalState == PassState::DONE; }
};

/**
 * @brief 서비스 인벤토리 수집 파사드
 *
 * 생성 시 설정값으로 백엔드를 한 번 선택하고, collect() 호출마다
 * 독립된 패스를 실행함. collect()는 const 이며 동시 호출에 안전함
 * (백엔드 클라이언트가 호출별 연결을 사용하는 경우).
 *
 * @example
 * ServiceCollectorConfig config;
 * config.useLiveApi = true;
 * ServiceCollector collector(config, nullptr, std::make_shared<ScmServiceManager>());
 * PassResult result = collector.collect(sink);
 */
class ServiceCollector {
public:
    using Backend = std::variant<core::service::QueryBackend, core::service::LiveHandleBackend>;

    /**
     * @param config 수집기 설정
     * @param queryClient 쿼리 백엔드용 (useLiveApi=false 일 때 필수)
     * @param serviceManager 라이브 백엔드용 (useLiveApi=true 일 때 필수)
     * @throws std::invalid_argument 선택된 백엔드의 의존성이 없을 때
     */
    ServiceCollector(const ServiceCollectorConfig& config,
                     std::shared_ptr<core::service::IServiceQueryClient> queryClient,
                     std::shared_ptr<core::service::IServiceManager> serviceManager);

    ServiceCollector(const ServiceCollector&) = delete;
    ServiceCollector& operator=(const ServiceCollector&) = delete;

    /**
     * @brief 패스 1회 실행
     *
     * 이미 전송된 행은 실패 시에도 회수하지 않음.
     */
    PassResult collect(core::service::IMetricSink& sink) const;

    bool usesLiveApi() const { return config_.useLiveApi; }

    const ServiceCollectorConfig& config() const { return config_; }

private:
    static Backend selectBackend(const ServiceCollectorConfig& config,
                                 std::shared_ptr<core::service::IServiceQueryClient> queryClient,
                                 std::shared_ptr<core::service::IServiceManager> serviceManager);

    const ServiceCollectorConfig config_;
    const Backend backend_;
};

} // namespace service
} // namespace svcmon

#endif // SVCMON_SERVICE_SERVICE_COLLECTOR_HPP
