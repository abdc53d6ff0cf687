// PrometheusTextSink.h - 메트릭 행을 Prometheus 텍스트 포맷으로 변환
// Copyright (C) 2025 svcmon Project

#ifndef SVCMON_CORE_MONITORING_PROMETHEUSTEXTSINK_H
#define SVCMON_CORE_MONITORING_PROMETHEUSTEXTSINK_H

#include "core/service/interfaces/IMetricSink.h"

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace svcmon::core::monitoring {

/**
 * @brief 메트릭 라벨 (순서 유지)
 */
using Labels = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Prometheus 텍스트 exposition 싱크
 *
 * 스크레이프 1회당 하나씩 생성하여 사용함 (스레드 안전하지 않음).
 * 행은 패밀리별로 모아 두었다가 render() 시 HELP/TYPE 과 함께 출력됨.
 * 패밀리 출력 순서는 처음 등장한 순서.
 */
class PrometheusTextSink : public service::IMetricSink {
private:
    struct Family {
        std::string name;
        std::string help;
        std::string type;
        std::vector<std::string> samples;
    };

    std::string namespace_;
    std::vector<Family> families_;
    std::map<std::string, std::size_t> family_index_;
    std::size_t sample_count_{0};

    Family& getOrCreateFamily(const std::string& name, const std::string& help, const std::string& type);
    void addSample(Family& family, const Labels& labels, double value);

public:
    /**
     * @param ns 메트릭 namespace (기본값: "windows")
     */
    explicit PrometheusTextSink(std::string ns = "windows");

    /**
     * @brief 서비스 메트릭 행 추가
     *
     * @throws std::invalid_argument 라벨 개수가 descriptor 와 다를 때
     */
    void send(const service::dto::MetricRow& row) override;

    /**
     * @brief 임의의 gauge 샘플 추가 (수집기 메타 메트릭용)
     */
    void addGauge(const std::string& name, const std::string& help, const Labels& labels, double value);

    /**
     * @brief Prometheus 포맷으로 내보내기
     */
    std::string render() const;

    std::size_t sampleCount() const { return sample_count_; }

    const std::string& metricNamespace() const { return namespace_; }

    static std::string escapeLabelValue(const std::string& value);
    static std::string formatValue(double value);
    static std::string labelsToString(const Labels& labels);
};

} // namespace svcmon::core::monitoring

#endif // SVCMON_CORE_MONITORING_PROMETHEUSTEXTSINK_H
