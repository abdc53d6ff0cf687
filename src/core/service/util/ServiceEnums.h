#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace svcmon::core::service {

/**
 * @brief 서비스 상태 (canonical)
 *
 * 라벨 순서는 kAllStates 순서와 동일하며 exposition 순서로 사용됨.
 */
enum class ServiceState : uint8_t {
    Stopped,
    StartPending,
    StopPending,
    Running,
    ContinuePending,
    PausePending,
    Paused,
    Unknown
};

/**
 * @brief 서비스 시작 모드 (canonical)
 *
 * unknown 멤버가 없으므로 매핑 실패는 std::nullopt 로 표현됨.
 */
enum class StartMode : uint8_t {
    Boot,
    System,
    Auto,
    Manual,
    Disabled
};

/**
 * @brief Win32_Service.Status 값 (canonical)
 */
enum class ServiceStatus : uint8_t {
    Ok,
    Error,
    Degraded,
    Unknown,
    PredFail,
    Starting,
    Stopping,
    Service,
    Stressed,
    NonRecover,
    NoContact,
    LostComm
};

inline constexpr std::array<ServiceState, 8> kAllStates = {
    ServiceState::Stopped,
    ServiceState::StartPending,
    ServiceState::StopPending,
    ServiceState::Running,
    ServiceState::ContinuePending,
    ServiceState::PausePending,
    ServiceState::Paused,
    ServiceState::Unknown,
};

inline constexpr std::array<StartMode, 5> kAllStartModes = {
    StartMode::Boot,
    StartMode::System,
    StartMode::Auto,
    StartMode::Manual,
    StartMode::Disabled,
};

inline constexpr std::array<ServiceStatus, 12> kAllStatuses = {
    ServiceStatus::Ok,
    ServiceStatus::Error,
    ServiceStatus::Degraded,
    ServiceStatus::Unknown,
    ServiceStatus::PredFail,
    ServiceStatus::Starting,
    ServiceStatus::Stopping,
    ServiceStatus::Service,
    ServiceStatus::Stressed,
    ServiceStatus::NonRecover,
    ServiceStatus::NoContact,
    ServiceStatus::LostComm,
};

// SCM 숫자 코드 (winsvc.h 의 SERVICE_* 값과 동일)
inline constexpr uint32_t kApiStateStopped = 0x1;
inline constexpr uint32_t kApiStateStartPending = 0x2;
inline constexpr uint32_t kApiStateStopPending = 0x3;
inline constexpr uint32_t kApiStateRunning = 0x4;
inline constexpr uint32_t kApiStateContinuePending = 0x5;
inline constexpr uint32_t kApiStatePausePending = 0x6;
inline constexpr uint32_t kApiStatePaused = 0x7;

inline constexpr uint32_t kApiStartBoot = 0x0;
inline constexpr uint32_t kApiStartSystem = 0x1;
inline constexpr uint32_t kApiStartAuto = 0x2;
inline constexpr uint32_t kApiStartDemand = 0x3;
inline constexpr uint32_t kApiStartDisabled = 0x4;

/**
 * @brief canonical 라벨 문자열 반환
 */
std::string_view toLabel(ServiceState state);
std::string_view toLabel(StartMode mode);
std::string_view toLabel(ServiceStatus status);

/**
 * @brief WMI 문자열 값을 canonical 상태로 변환 (대소문자 무시)
 *
 * @param raw Win32_Service.State 값 (예: "Running", "Start Pending")
 * @return 매칭되지 않으면 ServiceState::Unknown
 */
ServiceState stateFromQueryValue(std::string_view raw);

/**
 * @brief WMI StartMode 문자열 변환
 *
 * @return 매칭되지 않으면 std::nullopt (모든 start_mode 행이 0)
 */
std::optional<StartMode> startModeFromQueryValue(std::string_view raw);

/**
 * @brief WMI Status 문자열 변환
 *
 * @return 매칭되지 않으면 ServiceStatus::Unknown
 */
ServiceStatus statusFromQueryValue(std::string_view raw);

/**
 * @brief SERVICE_STATUS_PROCESS::dwCurrentState 변환
 *
 * @return 1..7 이외의 코드는 ServiceState::Unknown
 */
ServiceState stateFromApiCode(uint32_t code);

/**
 * @brief QUERY_SERVICE_CONFIG::dwStartType 변환
 *
 * @return 0..4 이외의 코드는 std::nullopt
 */
std::optional<StartMode> startModeFromApiCode(uint32_t code);

/**
 * @brief ASCII 소문자 변환 (서비스 이름 라벨용)
 *
 * 서비스 이름은 레지스트리 키 이름이라 사실상 ASCII. A-Z 만 변환하고
 * 그 외 바이트(UTF-8 멀티바이트 포함)는 그대로 둠.
 */
std::string toLowerAscii(std::string_view value);

} // namespace svcmon::core::service
