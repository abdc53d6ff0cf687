#include "QueryBackend.h"
#include "core/service/util/ServiceEnums.h"
#include "core/service/util/ServiceException.h"

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace svcmon::core::service {

QueryBackend::QueryBackend(std::shared_ptr<IServiceQueryClient> client, std::string filter)
    : client_(std::move(client))
    , filter_(std::move(filter)) {
    if (!client_) {
        throw std::invalid_argument("QueryBackend requires a query client");
    }
}

std::string QueryBackend::buildQuery(const std::string& filter) {
    std::string query =
        "SELECT DisplayName, Name, ProcessId, State, Status, StartMode, StartName FROM Win32_Service";
    if (!filter.empty()) {
        query += " WHERE " + filter;
    }
    return query;
}

dto::ServiceRecord QueryBackend::normalize(const RawQueryService& raw) {
    dto::ServiceRecord record;
    record.name = raw.name;
    record.displayName = raw.displayName;
    record.processId = raw.processId;
    record.runAs = raw.startName.value_or("");
    record.state = stateFromQueryValue(raw.state);
    record.startMode = startModeFromQueryValue(raw.startMode);
    record.status = statusFromQueryValue(raw.status);
    return record;
}

dto::BackendResult QueryBackend::fetch() const {
    const std::string query = buildQuery(filter_);
    spdlog::debug("Executing service query: {}", query);

    // 예외는 그대로 전파 (부분 결과 없음)
    const auto rawServices = client_->queryServices(query);

    dto::BackendResult result;
    result.records.reserve(rawServices.size());
    for (const auto& raw : rawServices) {
        result.records.push_back(normalize(raw));
    }

    spdlog::debug("Service query returned {} entries", result.records.size());
    return result;
}

} // namespace svcmon::core::service
