#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/async.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace svcmon::core::logging {

inline constexpr const char* kLoggerName = "svcmon_logger";
inline constexpr const char* kLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";

/**
 * 로그 레벨 문자열 파싱
 *
 * 알 수 없는 값이면 info 로 대체.
 */
inline spdlog::level::level_enum parse_level(const std::string& level) {
    const auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        return spdlog::level::info;
    }
    return parsed;
}

/**
 * 콘솔 sink + (선택) 파일 sink
 *
 * 파일은 이어쓰기 모드로 열림.
 */
inline std::vector<spdlog::sink_ptr> make_sinks(const std::string& log_file) {
    std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stdout_color_sink_mt>()};
    if (!log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
    }
    return sinks;
}

/**
 * 비동기 로거를 만들어 spdlog 기본 로거로 등록
 *
 * main() 에서 설정 로드 직후 한 번 호출. 이후 spdlog::info() 등은 모두
 * 이 로거를 거침. err 이상은 즉시, 나머지는 3초마다 flush.
 *
 * @throws spdlog::spdlog_ex 로그 파일을 열 수 없을 때
 */
inline void initialize_async_logger(const std::string& level, const std::string& log_file) {
    try {
        // 큐 8192, 워커 1개
        spdlog::init_thread_pool(8192, 1);

        auto sinks = make_sinks(log_file);
        auto logger = std::make_shared<spdlog::async_logger>(
            kLoggerName, sinks.begin(), sinks.end(),
            spdlog::thread_pool(), spdlog::async_overflow_policy::block);

        logger->set_pattern(kLogPattern);
        logger->set_level(parse_level(level));
        logger->flush_on(spdlog::level::err);
        logger->set_error_handler([](const std::string& msg) {
            std::cerr << "svcmon logger error: " << msg << std::endl;
        });

        spdlog::set_default_logger(logger);
        spdlog::flush_every(std::chrono::seconds(3));

        spdlog::info("Logger ready (level={}, file={})",
                     spdlog::level::to_string_view(logger->level()),
                     log_file.empty() ? "none" : log_file);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "svcmon logger setup failed: " << ex.what() << std::endl;
        throw;
    }
}

/**
 * 큐에 남은 메시지를 모두 처리하고 sink 를 닫음
 */
inline void shutdown_logger() {
    spdlog::shutdown();
}

}  // namespace svcmon::core::logging
