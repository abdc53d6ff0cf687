#include "ServiceEnums.h"

namespace svcmon::core::service {

namespace {

template <typename E, std::size_t N>
std::optional<E> matchLabel(const std::array<E, N>& values, std::string_view raw) {
    const std::string lowered = toLowerAscii(raw);
    for (const auto value : values) {
        if (toLabel(value) == lowered) {
            return value;
        }
    }
    return std::nullopt;
}

} // namespace

std::string_view toLabel(ServiceState state) {
    switch (state) {
        case ServiceState::Stopped:         return "stopped";
        case ServiceState::StartPending:    return "start pending";
        case ServiceState::StopPending:     return "stop pending";
        case ServiceState::Running:         return "running";
        case ServiceState::ContinuePending: return "continue pending";
        case ServiceState::PausePending:    return "pause pending";
        case ServiceState::Paused:          return "paused";
        case ServiceState::Unknown:         return "unknown";
    }
    return "unknown";
}

std::string_view toLabel(StartMode mode) {
    switch (mode) {
        case StartMode::Boot:     return "boot";
        case StartMode::System:   return "system";
        case StartMode::Auto:     return "auto";
        case StartMode::Manual:   return "manual";
        case StartMode::Disabled: return "disabled";
    }
    return "";
}

std::string_view toLabel(ServiceStatus status) {
    switch (status) {
        case ServiceStatus::Ok:         return "ok";
        case ServiceStatus::Error:      return "error";
        case ServiceStatus::Degraded:   return "degraded";
        case ServiceStatus::Unknown:    return "unknown";
        case ServiceStatus::PredFail:   return "pred fail";
        case ServiceStatus::Starting:   return "starting";
        case ServiceStatus::Stopping:   return "stopping";
        case ServiceStatus::Service:    return "service";
        case ServiceStatus::Stressed:   return "stressed";
        case ServiceStatus::NonRecover: return "nonrecover";
        case ServiceStatus::NoContact:  return "no contact";
        case ServiceStatus::LostComm:   return "lost comm";
    }
    return "unknown";
}

ServiceState stateFromQueryValue(std::string_view raw) {
    return matchLabel(kAllStates, raw).value_or(ServiceState::Unknown);
}

std::optional<StartMode> startModeFromQueryValue(std::string_view raw) {
    return matchLabel(kAllStartModes, raw);
}

ServiceStatus statusFromQueryValue(std::string_view raw) {
    return matchLabel(kAllStatuses, raw).value_or(ServiceStatus::Unknown);
}

ServiceState stateFromApiCode(uint32_t code) {
    switch (code) {
        case kApiStateStopped:         return ServiceState::Stopped;
        case kApiStateStartPending:    return ServiceState::StartPending;
        case kApiStateStopPending:     return ServiceState::StopPending;
        case kApiStateRunning:         return ServiceState::Running;
        case kApiStateContinuePending: return ServiceState::ContinuePending;
        case kApiStatePausePending:    return ServiceState::PausePending;
        case kApiStatePaused:          return ServiceState::Paused;
        default:                       return ServiceState::Unknown;
    }
}

std::optional<StartMode> startModeFromApiCode(uint32_t code) {
    switch (code) {
        case kApiStartBoot:     return StartMode::Boot;
        case kApiStartSystem:   return StartMode::System;
        case kApiStartAuto:     return StartMode::Auto;
        case kApiStartDemand:   return StartMode::Manual;
        case kApiStartDisabled: return StartMode::Disabled;
        default:                return std::nullopt;
    }
}

std::string toLowerAscii(std::string_view value) {
    std::string result(value);
    for (auto& c : result) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return result;
}

} // namespace svcmon::core::service
