#pragma once

#include "core/service/interfaces/IServiceQueryClient.h"

#include <string>

namespace svcmon::core::service::windows {

/**
 * @brief WMI (ROOT\CIMV2) 기반 Win32_Service 조회
 *
 * queryServices() 호출마다 COM 초기화, 연결, 쿼리, 해제를 수행함.
 * 호출 스레드 단위로 독립적이므로 동시 호출에 안전함.
 */
class WmiServiceQueryClient : public IServiceQueryClient {
public:
    explicit WmiServiceQueryClient(std::string wmiNamespace = "ROOT\\CIMV2");
    ~WmiServiceQueryClient() override = default;

    std::vector<RawQueryService> queryServices(const std::string& wql) override;

private:
    std::string wmiNamespace_;
};

} // namespace svcmon::core::service::windows
