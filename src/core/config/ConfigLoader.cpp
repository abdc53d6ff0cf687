#include "ConfigLoader.h"
#include <cstdint>
#include <fstream>

namespace svcmon {
namespace config {

namespace {

constexpr int kMinPort = 1;
constexpr int kMaxPort = 65535;

} // namespace

nlohmann::json::json_pointer ConfigLoader::toPointer(const std::string& key_path) {
    std::string pointer = "/";
    for (const char c : key_path) {
        pointer += (c == '.') ? '/' : c;
    }
    return nlohmann::json::json_pointer(pointer);
}

bool ConfigLoader::accept(nlohmann::json parsed, const std::string& source) {
    if (parsed.is_discarded()) {
        spdlog::error("Invalid JSON in configuration {}", source);
        return false;
    }
    if (!parsed.is_object()) {
        spdlog::error("Configuration {} must be a JSON object", source);
        return false;
    }

    config_ = std::move(parsed);
    spdlog::info("Configuration loaded from {}", source);
    return true;
}

bool ConfigLoader::loadFromFile(const std::filesystem::path& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        spdlog::error("Configuration file not found or unreadable: {}", file_path.string());
        return false;
    }

    return accept(nlohmann::json::parse(file, nullptr, false), file_path.string());
}

bool ConfigLoader::loadFromString(const std::string& json_str) {
    return accept(nlohmann::json::parse(json_str, nullptr, false), "string");
}

bool ConfigLoader::hasKey(const std::string& key_path) const {
    if (!config_.is_object() || key_path.empty()) {
        return false;
    }
    return config_.contains(toPointer(key_path));
}

ExporterConfig ConfigLoader::toExporterConfig() const {
    ExporterConfig result;
    if (!isLoaded()) {
        return result;
    }

    result.servicesWhere = getValue("collector.service.services_where", result.servicesWhere);
    result.disableWmi = getValue("collector.service.disable_wmi", result.disableWmi);
    result.listenAddress = getValue("web.listen_address", result.listenAddress);
    result.metricNamespace = getValue("metrics.namespace", result.metricNamespace);
    result.logLevel = getValue("log.level", result.logLevel);
    result.logFile = getValue("log.file", result.logFile);

    if (hasKey("web.port")) {
        const auto& port = config_.at(toPointer("web.port"));
        // 정수가 아니거나 범위 밖이면 축소 변환 없이 기본값 유지
        bool valid = false;
        if (port.is_number_unsigned()) {
            const auto value = port.get<uint64_t>();
            valid = value >= static_cast<uint64_t>(kMinPort) && value <= static_cast<uint64_t>(kMaxPort);
        } else if (port.is_number_integer()) {
            const auto value = port.get<int64_t>();
            valid = value >= kMinPort && value <= kMaxPort;
        }

        if (valid) {
            result.port = static_cast<uint16_t>(port.get<int64_t>());
        } else {
            spdlog::warn("web.port {} is not a valid port, keeping {}", port.dump(), result.port);
        }
    }

    return result;
}

} // namespace config
} // namespace svcmon
