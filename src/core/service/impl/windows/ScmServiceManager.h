#pragma once

#include "core/service/interfaces/IServiceManager.h"

namespace svcmon::core::service::windows {

/**
 * @brief Service Control Manager 구현체
 *
 * connect() 마다 OpenSCManagerW 로 새 연결을 열며,
 * 연결/서비스 핸들은 각 객체 소멸 시 CloseServiceHandle 로 닫힘.
 */
class ScmServiceManager : public IServiceManager {
public:
    ScmServiceManager() = default;
    ~ScmServiceManager() override = default;

    std::unique_ptr<IServiceManagerConnection> connect() override;
};

} // namespace svcmon::core::service::windows
