#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace svcmon::core::service {

/**
 * @brief QueryServiceConfig 결과 중 수집에 필요한 필드
 */
struct RawServiceConfig {
    std::string displayName;
    uint32_t startType = 0;
    std::string serviceStartName;
};

/**
 * @brief QueryServiceStatusEx 결과 중 수집에 필요한 필드
 */
struct RawServiceStatus {
    uint32_t currentState = 0;
    uint32_t processId = 0;
};

/**
 * @brief 열린 서비스 핸들
 *
 * 소멸자에서 핸들을 닫음. 모든 메서드 실패 시 PerServiceException.
 */
class IServiceHandle {
public:
    virtual ~IServiceHandle() = default;

    virtual RawServiceConfig config() = 0;
    virtual RawServiceStatus query() = 0;
};

/**
 * @brief 서비스 관리자 연결
 *
 * 소멸자에서 연결을 해제함. 한 패스 안에서만 사용되며 공유되지 않음.
 */
class IServiceManagerConnection {
public:
    virtual ~IServiceManagerConnection() = default;

    /**
     * @brief 전체 서비스 이름 목록
     *
     * @throws EnumerationException
     */
    virtual std::vector<std::string> listServices() = 0;

    /**
     * @brief 서비스 핸들 열기
     *
     * @throws PerServiceException
     */
    virtual std::unique_ptr<IServiceHandle> openService(const std::string& name) = 0;
};

/**
 * @brief 라이브 서비스 관리자 (SCM) 인터페이스
 *
 * connect()는 호출마다 독립된 연결을 반환해야 함 (패스 간 풀링 금지).
 */
class IServiceManager {
public:
    virtual ~IServiceManager() = default;

    /**
     * @throws ConnectionException
     */
    virtual std::unique_ptr<IServiceManagerConnection> connect() = 0;
};

} // namespace svcmon::core::service
