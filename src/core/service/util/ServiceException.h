#pragma once

#include <stdexcept>
#include <string>

namespace svcmon::core::service {

/**
 * @brief 서비스 수집 관련 예외 기본 클래스
 *
 * 서비스 인벤토리 수집 중 발생하는 오류를 표현하는 예외.
 * std::runtime_error를 상속하여 표준 예외 처리 패턴을 따름.
 */
class ServiceException : public std::runtime_error {
public:
    explicit ServiceException(const std::string& message)
        : std::runtime_error(message) {}

    explicit ServiceException(const char* message)
        : std::runtime_error(message) {}
};

/**
 * @brief 서비스 관리자(SCM) 또는 WMI 연결 실패
 *
 * 패스 전체를 중단시키는 치명적 오류.
 *
 * @example
 * if (!scm) {
 *     throw ConnectionException("OpenSCManager failed");
 * }
 */
class ConnectionException : public ServiceException {
public:
    explicit ConnectionException(const std::string& message)
        : ServiceException("Connection: " + message) {}

    explicit ConnectionException(const char* message)
        : ServiceException(std::string("Connection: ") + message) {}
};

/**
 * @brief 서비스 목록 조회 또는 WQL 쿼리 실행 실패
 *
 * 패스 전체를 중단시키는 치명적 오류.
 */
class EnumerationException : public ServiceException {
public:
    explicit EnumerationException(const std::string& message)
        : ServiceException("Enumeration: " + message) {}

    explicit EnumerationException(const char* message)
        : ServiceException(std::string("Enumeration: ") + message) {}
};

/**
 * @brief 개별 서비스 open/config/query 실패
 *
 * 라이브 핸들 백엔드 내부에서만 처리되며, 해당 서비스만 건너뜀.
 */
class PerServiceException : public ServiceException {
public:
    PerServiceException(const std::string& serviceName, const std::string& message)
        : ServiceException("Service '" + serviceName + "': " + message)
        , serviceName_(serviceName) {}

    const std::string& serviceName() const { return serviceName_; }

private:
    std::string serviceName_;
};

} // namespace svcmon::core::service
