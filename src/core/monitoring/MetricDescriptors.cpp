// MetricDescriptors.cpp
// Copyright (C) 2025 svcmon Project

#include "MetricDescriptors.h"

namespace svcmon::core::monitoring {

using service::dto::MetricKind;

namespace {
constexpr const char* kSubsystem = "service";
}

std::string buildFQName(const std::string& ns, const std::string& subsystem, const std::string& name) {
    std::string result;
    for (const auto* part : {&ns, &subsystem, &name}) {
        if (part->empty()) {
            continue;
        }
        if (!result.empty()) {
            result += '_';
        }
        result += *part;
    }
    return result;
}

MetricDescriptor describe(MetricKind kind, const std::string& ns) {
    switch (kind) {
        case MetricKind::Info:
            return {buildFQName(ns, kSubsystem, "info"),
                    "A metric with a constant '1' value labeled with service information",
                    {"name", "display_name", "process_id", "run_as"}};
        case MetricKind::State:
            return {buildFQName(ns, kSubsystem, "state"),
                    "The state of the service (State)",
                    {"name", "state"}};
        case MetricKind::StartMode:
            return {buildFQName(ns, kSubsystem, "start_mode"),
                    "The start mode of the service (StartMode)",
                    {"name", "start_mode"}};
        case MetricKind::Status:
            return {buildFQName(ns, kSubsystem, "status"),
                    "The status of the service (Status)",
                    {"name", "status"}};
    }
    return {buildFQName(ns, kSubsystem, metricKindToString(kind)), "", {}};
}

} // namespace svcmon::core::monitoring
