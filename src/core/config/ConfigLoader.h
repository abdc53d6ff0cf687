#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace svcmon {
namespace config {

/**
 * @brief 익스포터 실행 설정
 *
 * 기본값은 설정 파일이 없을 때 그대로 사용됨.
 */
struct ExporterConfig {
    /// collector.service.services_where - WQL WHERE 절 (WMI 백엔드 전용)
    std::string servicesWhere;

    /// collector.service.disable_wmi - true 이면 SCM API 사용
    bool disableWmi = true;

    /// web.listen_address
    std::string listenAddress = "0.0.0.0";

    /// web.port
    uint16_t port = 9182;

    /// metrics.namespace
    std::string metricNamespace = "windows";

    /// log.level (trace|debug|info|warn|error|critical|off)
    std::string logLevel = "info";

    /// log.file - 빈 문자열이면 콘솔만 사용
    std::string logFile;
};

/**
 * @brief 익스포터 JSON 설정 로더
 *
 * 키 경로는 '.' 으로 구분하며 내부적으로 JSON pointer 로 변환됨
 * ("web.port" -> "/web/port"). 키가 없거나 타입이 다르면 기본값이 유지됨.
 */
class ConfigLoader {
public:
    /**
     * @return 파일이 없거나 JSON 파싱 실패 시 false (기존 설정 유지)
     */
    bool loadFromFile(const std::filesystem::path& file_path);

    bool loadFromString(const std::string& json_str);

    const nlohmann::json& getJson() const { return config_; }

    /**
     * @brief 키 경로로 값 조회
     *
     * 예: getValue<bool>("collector.service.disable_wmi", true)
     */
    template<typename T>
    T getValue(const std::string& key_path, const T& default_value = T{}) const;

    bool hasKey(const std::string& key_path) const;

    bool isLoaded() const { return !config_.is_null(); }

    /**
     * @brief 로드된 JSON 을 ExporterConfig 로 변환
     *
     * 로드되지 않았으면 기본값 반환.
     */
    ExporterConfig toExporterConfig() const;

private:
    nlohmann::json config_;

    static nlohmann::json::json_pointer toPointer(const std::string& key_path);
    bool accept(nlohmann::json parsed, const std::string& source);
};

template<typename T>
T ConfigLoader::getValue(const std::string& key_path, const T& default_value) const {
    if (!hasKey(key_path)) {
        return default_value;
    }

    try {
        return config_.at(toPointer(key_path)).template get<T>();
    } catch (const nlohmann::json::type_error& e) {
        spdlog::warn("Config key '{}' has unexpected type, using default: {}", key_path, e.what());
        return default_value;
    }
}

} // namespace config
} // namespace svcmon
