#include "LiveHandleBackend.h"
#include "core/service/util/ServiceEnums.h"
#include "core/service/util/ServiceException.h"

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace svcmon::core::service {

LiveHandleBackend::LiveHandleBackend(std::shared_ptr<IServiceManager> manager)
    : manager_(std::move(manager)) {
    if (!manager_) {
        throw std::invalid_argument("LiveHandleBackend requires a service manager");
    }
}

dto::BackendResult LiveHandleBackend::fetch() const {
    // 연결은 이 스코프를 벗어나면 해제됨
    std::unique_ptr<IServiceManagerConnection> connection = manager_->connect();
    if (!connection) {
        throw ConnectionException("service manager returned no connection");
    }

    const std::vector<std::string> names = connection->listServices();

    dto::BackendResult result;
    result.records.reserve(names.size());

    for (const auto& name : names) {
        auto record = queryService(*connection, name);
        if (!record) {
            ++result.skipped;
            continue;
        }
        result.records.push_back(std::move(*record));
    }

    spdlog::debug("Live service query: {} collected, {} skipped of {}",
                  result.records.size(), result.skipped, names.size());
    return result;
}

std::optional<dto::ServiceRecord> LiveHandleBackend::queryService(
    IServiceManagerConnection& connection,
    const std::string& name) const {

    try {
        std::unique_ptr<IServiceHandle> handle = connection.openService(name);
        if (!handle) {
            spdlog::debug("Skipping service {}: no handle", name);
            return std::nullopt;
        }

        const RawServiceConfig config = handle->config();
        const RawServiceStatus status = handle->query();

        dto::ServiceRecord record;
        record.name = name;
        record.displayName = config.displayName;
        record.processId = status.processId;
        record.runAs = config.serviceStartName;
        record.state = stateFromApiCode(status.currentState);
        record.startMode = startModeFromApiCode(config.startType);
        // SCM 에는 Status 개념이 없음
        record.status = std::nullopt;
        return record;
    } catch (const PerServiceException& e) {
        spdlog::debug("Skipping service {}: {}", name, e.what());
        return std::nullopt;
    }
}

} // namespace svcmon::core::service
