#include "svcmon/service/ServiceCollector.hpp"
#include "core/service/impl/RowEmitter.h"
#include "core/service/util/ServiceException.h"

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace svcmon {
namespace service {

using namespace svcmon::core::service;

const char* passStateToString(PassState state) {
    switch (state) {
        case PassState::IDLE:              return "idle";
        case PassState::SELECTING_BACKEND: return "selecting-backend";
        case PassState::COLLECTING:        return "collecting";
        case PassState::EMITTING:          return "emitting";
        case PassState::DONE:              return "done";
        case PassState::FAILED:            return "failed";
        default:                           return "unknown";
    }
}

ServiceCollector::ServiceCollector(const ServiceCollectorConfig& config,
                                   std::shared_ptr<IServiceQueryClient> queryClient,
                                   std::shared_ptr<IServiceManager> serviceManager)
    : config_(config)
    , backend_(selectBackend(config, std::move(queryClient), std::move(serviceManager))) {

    if (config_.useLiveApi) {
        spdlog::warn("WMI collection is disabled.");
    }
    if (config_.filter.empty()) {
        spdlog::warn("No where-clause specified for service collector. "
                     "This will generate a very large number of metrics!");
    }
}

ServiceCollector::Backend ServiceCollector::selectBackend(
    const ServiceCollectorConfig& config,
    std::shared_ptr<IServiceQueryClient> queryClient,
    std::shared_ptr<IServiceManager> serviceManager) {

    if (config.useLiveApi) {
        return LiveHandleBackend(std::move(serviceManager));
    }
    return QueryBackend(std::move(queryClient), config.filter);
}

PassResult ServiceCollector::collect(IMetricSink& sink) const {
    PassResult result;
    result.finalState = PassState::SELECTING_BACKEND;

    try {
        result.finalState = PassState::COLLECTING;
        const dto::BackendResult fetched = std::visit(
            [](const auto& backend) { return backend.fetch(); }, backend_);

        result.finalState = PassState::EMITTING;
        result.servicesSkipped = fetched.skipped;
        for (const auto& record : fetched.records) {
            result.rowsEmitted += emitRows(record, sink);
            ++result.servicesEmitted;
        }

        result.finalState = PassState::DONE;
    } catch (const ConnectionException& e) {
        result.finalState = PassState::FAILED;
        result.errorKind = PassErrorKind::CONNECTION;
        result.error = e.what();
    } catch (const EnumerationException& e) {
        result.finalState = PassState::FAILED;
        result.errorKind = PassErrorKind::ENUMERATION;
        result.error = e.what();
    } catch (const std::exception& e) {
        // 백엔드/싱크의 그 밖의 오류도 패스 실패로 보고
        result.finalState = PassState::FAILED;
        result.errorKind = PassErrorKind::INTERNAL;
        result.error = e.what();
    }

    if (!result.ok()) {
        spdlog::error("failed collecting service metrics: {}", result.error);
        return result;
    }

    spdlog::debug("Service pass {}: {} services, {} rows, {} skipped",
                  passStateToString(result.finalState),
                  result.servicesEmitted, result.rowsEmitted, result.servicesSkipped);
    return result;
}

} // namespace service
} // namespace svcmon
