// MetricsServer.cpp
// Copyright (C) 2025 svcmon Project

#include "MetricsServer.h"
#include <spdlog/spdlog.h>

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

#include <sstream>
#include <stdexcept>

namespace svcmon::core::monitoring {

namespace {

#ifdef _WIN32
constexpr MetricsServer::SocketHandle kInvalidSocket = static_cast<MetricsServer::SocketHandle>(INVALID_SOCKET);

std::string lastSocketError() {
    return "WSA error " + std::to_string(WSAGetLastError());
}

void closeSocket(MetricsServer::SocketHandle s) {
    closesocket(static_cast<SOCKET>(s));
}
#else
constexpr MetricsServer::SocketHandle kInvalidSocket = -1;

std::string lastSocketError() {
    return strerror(errno);
}

void closeSocket(MetricsServer::SocketHandle s) {
    close(s);
}
#endif

} // namespace

MetricsServer::MetricsServer(std::shared_ptr<ScrapeHandler> handler, std::string address, uint16_t port)
    : handler_(std::move(handler))
    , address_(std::move(address))
    , port_(port)
    , server_socket_(kInvalidSocket) {
}

MetricsServer::~MetricsServer() {
    stop();
}

void MetricsServer::closeServerSocket() {
    if (server_socket_ != kInvalidSocket) {
        closeSocket(server_socket_);
        server_socket_ = kInvalidSocket;
    }
}

void MetricsServer::abortStart() {
    closeServerSocket();
#ifdef _WIN32
    // start() 의 WSAStartup 과 짝을 맞춤
    WSACleanup();
#endif
}

bool MetricsServer::start() {
    if (running_) {
        spdlog::warn("MetricsServer already running on port {}", port_);
        return false;
    }

    if (!handler_) {
        spdlog::error("MetricsServer has no scrape handler");
        return false;
    }

#ifdef _WIN32
    WSADATA wsa_data;
    if (WSAStartup(MAKEWORD(2, 2), &wsa_data) != 0) {
        spdlog::error("WSAStartup failed: {}", lastSocketError());
        return false;
    }
#endif

    // TCP 소켓 생성
    server_socket_ = static_cast<SocketHandle>(socket(AF_INET, SOCK_STREAM, 0));
    if (server_socket_ == kInvalidSocket) {
        spdlog::error("Failed to create socket: {}", lastSocketError());
        abortStart();
        return false;
    }

    // SO_REUSEADDR 설정 (빠른 재시작 허용)
    int opt = 1;
    if (setsockopt(server_socket_, SOL_SOCKET, SO_REUSEADDR,
                   reinterpret_cast<const char*>(&opt), sizeof(opt)) < 0) {
        spdlog::warn("Failed to set SO_REUSEADDR: {}", lastSocketError());
    }

    struct sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_port = htons(port_);
    if (inet_pton(AF_INET, address_.c_str(), &address.sin_addr) != 1) {
        spdlog::error("Invalid listen address: {}", address_);
        abortStart();
        return false;
    }

    if (bind(server_socket_, reinterpret_cast<struct sockaddr*>(&address), sizeof(address)) < 0) {
        spdlog::error("Failed to bind to {}:{}: {}", address_, port_, lastSocketError());
        abortStart();
        return false;
    }

    if (listen(server_socket_, 10) < 0) {
        spdlog::error("Failed to listen on port {}: {}", port_, lastSocketError());
        abortStart();
        return false;
    }

    running_ = true;
    server_thread_ = std::thread(&MetricsServer::serverLoop, this);

    spdlog::info("MetricsServer started on http://{}:{}/metrics", address_, port_);
    return true;
}

void MetricsServer::stop() {
    if (!running_) {
        return;
    }

    running_ = false;

    // 서버 소켓 닫기 (accept() 블로킹 해제)
    if (server_socket_ != kInvalidSocket) {
#ifdef _WIN32
        shutdown(server_socket_, SD_BOTH);
#else
        shutdown(server_socket_, SHUT_RDWR);
#endif
        closeServerSocket();
    }

    if (server_thread_.joinable()) {
        server_thread_.join();
    }

#ifdef _WIN32
    WSACleanup();
#endif

    spdlog::info("MetricsServer stopped");
}

void MetricsServer::serverLoop() {
    spdlog::debug("MetricsServer loop started");

    while (running_) {
        struct sockaddr_in client_addr{};
        socklen_t client_len = sizeof(client_addr);

        const auto client_socket = static_cast<SocketHandle>(
            accept(server_socket_, reinterpret_cast<struct sockaddr*>(&client_addr), &client_len));

        if (client_socket == kInvalidSocket) {
            if (running_) {
                spdlog::error("Failed to accept connection: {}", lastSocketError());
            }
            break;
        }

        handleClient(client_socket);
        closeSocket(client_socket);
    }

    spdlog::debug("MetricsServer loop stopped");
}

void MetricsServer::handleClient(SocketHandle client_socket) {
    // HTTP 요청 읽기 (요청 라인만 사용)
    char buffer[4096];
    const auto bytes_read = recv(client_socket, buffer, sizeof(buffer) - 1, 0);

    if (bytes_read < 0) {
        spdlog::error("Failed to read from client: {}", lastSocketError());
        return;
    }

    buffer[bytes_read] = '\0';
    std::string request(buffer);

    std::istringstream iss(request);
    std::string method, path, version;
    iss >> method >> path >> version;

    // 쿼리 문자열 제거
    const auto query_pos = path.find('?');
    if (query_pos != std::string::npos) {
        path.erase(query_pos);
    }

    spdlog::debug("Received request: {} {}", method, path);

    std::string response;

    if (method == "GET" && path == "/metrics") {
        try {
            response = buildHttpResponse(handler_->scrape());
        } catch (const std::exception& e) {
            spdlog::error("Scrape failed: {}", e.what());
            response = buildErrorResponse("500 Internal Server Error", "500 Internal Server Error\n");
        }
    } else if (method == "GET" && path == "/") {
        std::string body = R"(
<html>
<head><title>svcmon Service Exporter</title></head>
<body>
<h1>svcmon Service Exporter</h1>
<p>Metrics are available at <a href="/metrics">/metrics</a></p>
</body>
</html>
)";
        response = buildHttpResponse(body, "text/html");
    } else {
        response = buildErrorResponse("404 Not Found", "404 Not Found\n");
    }

    const auto bytes_sent = send(client_socket, response.c_str(), static_cast<int>(response.size()), 0);
    if (bytes_sent < 0) {
        spdlog::error("Failed to send response: {}", lastSocketError());
    }
}

std::string MetricsServer::buildErrorResponse(const std::string& status, const std::string& body) const {
    std::string response = "HTTP/1.1 " + status + "\r\n";
    response += "Content-Type: text/plain\r\n";
    response += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    response += "Connection: close\r\n\r\n";
    response += body;
    return response;
}

std::string MetricsServer::buildHttpResponse(const std::string& body, const std::string& content_type) const {
    std::ostringstream oss;
    oss << "HTTP/1.1 200 OK\r\n";
    oss << "Content-Type: " << content_type << "\r\n";
    oss << "Content-Length: " << body.size() << "\r\n";
    oss << "Connection: close\r\n";
    oss << "\r\n";
    oss << body;
    return oss.str();
}

} // namespace svcmon::core::monitoring
