// MetricsServer.h - 간단한 HTTP 메트릭 서버
// Copyright (C) 2025 svcmon Project

#ifndef SVCMON_CORE_MONITORING_METRICSSERVER_H
#define SVCMON_CORE_MONITORING_METRICSSERVER_H

#include "ScrapeHandler.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace svcmon::core::monitoring {

/**
 * @brief 간단한 HTTP 메트릭 서버
 *
 * /metrics 요청마다 ScrapeHandler 로 수집 패스를 1회 실행함.
 * 요청은 서버 스레드에서 순차 처리됨.
 */
class MetricsServer {
public:
#ifdef _WIN32
    using SocketHandle = std::uintptr_t;
#else
    using SocketHandle = int;
#endif

private:
    std::shared_ptr<ScrapeHandler> handler_;
    std::string address_;
    uint16_t port_;
    std::atomic<bool> running_{false};
    std::thread server_thread_;
    SocketHandle server_socket_;

    void serverLoop();
    void handleClient(SocketHandle client_socket);
    std::string buildHttpResponse(const std::string& body,
                                  const std::string& content_type = "text/plain; version=0.0.4") const;
    std::string buildErrorResponse(const std::string& status, const std::string& body) const;
    void closeServerSocket();
    void abortStart();

public:
    /**
     * @brief MetricsServer 생성자
     *
     * @param handler 스크레이프 처리기
     * @param address 바인딩 주소 (기본값: 0.0.0.0)
     * @param port 포트 번호 (기본값: 9182)
     */
    explicit MetricsServer(std::shared_ptr<ScrapeHandler> handler,
                           std::string address = "0.0.0.0",
                           uint16_t port = 9182);

    ~MetricsServer();

    // 복사 금지
    MetricsServer(const MetricsServer&) = delete;
    MetricsServer& operator=(const MetricsServer&) = delete;

    /**
     * @brief 서버 시작
     *
     * @return true이면 성공, false이면 실패
     */
    bool start();

    /**
     * @brief 서버 중지
     */
    void stop();

    bool isRunning() const { return running_; }

    uint16_t getPort() const { return port_; }

    const std::string& getAddress() const { return address_; }
};

} // namespace svcmon::core::monitoring

#endif // SVCMON_CORE_MONITORING_METRICSSERVER_H
