#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace svcmon::core::service {

/**
 * @brief Win32_Service 조회 결과 1건 (정규화 전)
 */
struct RawQueryService {
    std::string name;
    std::string displayName;
    uint32_t processId = 0;
    std::string state;
    std::string status;
    std::string startMode;
    std::optional<std::string> startName;  ///< WMI NULL 이면 std::nullopt
};

/**
 * @brief 선언적 쿼리 소스 (WMI) 인터페이스
 *
 * 한 번의 호출로 전체 결과를 반환하며 부분 결과는 허용하지 않음.
 */
class IServiceQueryClient {
public:
    virtual ~IServiceQueryClient() = default;

    /**
     * @brief WQL 쿼리 실행
     *
     * @param wql 완성된 WQL 문장
     * @return 조회된 서비스 목록 (0건 가능)
     * @throws ConnectionException 쿼리 소스 연결 실패
     * @throws EnumerationException 쿼리 실행 실패
     */
    virtual std::vector<RawQueryService> queryServices(const std::string& wql) = 0;
};

} // namespace svcmon::core::service
