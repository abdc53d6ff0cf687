#include "ScmServiceManager.h"
#include "WideString.h"
#include "core/service/util/ServiceEnums.h"
#include "core/service/util/ServiceException.h"

#include <windows.h>
#include <winsvc.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <type_traits>
#include <vector>

namespace svcmon::core::service::windows {

static_assert(kApiStateStopped == SERVICE_STOPPED);
static_assert(kApiStateStartPending == SERVICE_START_PENDING);
static_assert(kApiStateStopPending == SERVICE_STOP_PENDING);
static_assert(kApiStateRunning == SERVICE_RUNNING);
static_assert(kApiStateContinuePending == SERVICE_CONTINUE_PENDING);
static_assert(kApiStatePausePending == SERVICE_PAUSE_PENDING);
static_assert(kApiStatePaused == SERVICE_PAUSED);
static_assert(kApiStartBoot == SERVICE_BOOT_START);
static_assert(kApiStartSystem == SERVICE_SYSTEM_START);
static_assert(kApiStartAuto == SERVICE_AUTO_START);
static_assert(kApiStartDemand == SERVICE_DEMAND_START);
static_assert(kApiStartDisabled == SERVICE_DISABLED);

namespace {

struct ScHandleCloser {
    void operator()(SC_HANDLE handle) const {
        if (handle != nullptr) {
            CloseServiceHandle(handle);
        }
    }
};

using ScHandle = std::unique_ptr<std::remove_pointer_t<SC_HANDLE>, ScHandleCloser>;

std::string errorText(const char* call) {
    return std::string(call) + " failed. Error: " + std::to_string(GetLastError());
}

/**
 * @brief 열린 서비스 핸들 (소멸 시 닫힘)
 */
class ScmServiceHandle : public IServiceHandle {
public:
    ScmServiceHandle(std::string name, ScHandle handle)
        : name_(std::move(name))
        , handle_(std::move(handle)) {}

    RawServiceConfig config() override {
        DWORD needed = 0;
        if (!QueryServiceConfigW(handle_.get(), nullptr, 0, &needed)
            && GetLastError() != ERROR_INSUFFICIENT_BUFFER) {
            throw PerServiceException(name_, errorText("QueryServiceConfigW"));
        }

        std::vector<BYTE> buffer(std::max<DWORD>(needed, sizeof(QUERY_SERVICE_CONFIGW)));
        auto* cfg = reinterpret_cast<QUERY_SERVICE_CONFIGW*>(buffer.data());
        if (!QueryServiceConfigW(handle_.get(), cfg, static_cast<DWORD>(buffer.size()), &needed)) {
            throw PerServiceException(name_, errorText("QueryServiceConfigW"));
        }

        RawServiceConfig result;
        result.displayName = toUtf8(cfg->lpDisplayName);
        result.startType = cfg->dwStartType;
        result.serviceStartName = toUtf8(cfg->lpServiceStartName);
        return result;
    }

    RawServiceStatus query() override {
        SERVICE_STATUS_PROCESS ssp{};
        DWORD needed = 0;
        if (!QueryServiceStatusEx(handle_.get(), SC_STATUS_PROCESS_INFO,
                                  reinterpret_cast<LPBYTE>(&ssp), sizeof(ssp), &needed)) {
            throw PerServiceException(name_, errorText("QueryServiceStatusEx"));
        }

        RawServiceStatus result;
        result.currentState = ssp.dwCurrentState;
        result.processId = ssp.dwProcessId;
        return result;
    }

private:
    std::string name_;
    ScHandle handle_;
};

/**
 * @brief SCM 연결 (소멸 시 닫힘)
 */
class ScmConnection : public IServiceManagerConnection {
public:
    explicit ScmConnection(ScHandle scm)
        : scm_(std::move(scm)) {}

    std::vector<std::string> listServices() override {
        std::vector<std::string> names;
        std::vector<BYTE> buffer;
        DWORD resume = 0;

        for (;;) {
            DWORD needed = 0;
            DWORD returned = 0;
            const BOOL ok = EnumServicesStatusExW(
                scm_.get(),
                SC_ENUM_PROCESS_INFO,
                SERVICE_WIN32,
                SERVICE_STATE_ALL,
                buffer.empty() ? nullptr : buffer.data(),
                static_cast<DWORD>(buffer.size()),
                &needed,
                &returned,
                &resume,
                nullptr);

            if (!ok && GetLastError() != ERROR_MORE_DATA) {
                throw EnumerationException(errorText("EnumServicesStatusExW"));
            }

            const auto* entries = reinterpret_cast<const ENUM_SERVICE_STATUS_PROCESSW*>(buffer.data());
            for (DWORD i = 0; i < returned; ++i) {
                names.push_back(toUtf8(entries[i].lpServiceName));
            }

            if (ok) {
                break;
            }
            buffer.resize(std::max<size_t>(buffer.size(), needed));
        }

        return names;
    }

    std::unique_ptr<IServiceHandle> openService(const std::string& name) override {
        const std::wstring wide = toWide(name);
        ScHandle handle(OpenServiceW(scm_.get(), wide.c_str(),
                                     SERVICE_QUERY_CONFIG | SERVICE_QUERY_STATUS));
        if (!handle) {
            throw PerServiceException(name, errorText("OpenServiceW"));
        }
        return std::make_unique<ScmServiceHandle>(name, std::move(handle));
    }

private:
    ScHandle scm_;
};

} // namespace

std::unique_ptr<IServiceManagerConnection> ScmServiceManager::connect() {
    ScHandle scm(OpenSCManagerW(nullptr, nullptr, SC_MANAGER_CONNECT | SC_MANAGER_ENUMERATE_SERVICE));
    if (!scm) {
        throw ConnectionException(errorText("OpenSCManagerW"));
    }

    spdlog::trace("Connected to service control manager");
    return std::make_unique<ScmConnection>(std::move(scm));
}

} // namespace svcmon::core::service::windows
