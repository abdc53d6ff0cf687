#pragma once

#include "core/service/dto/MetricRow.h"

namespace svcmon::core::service {

/**
 * @brief 메트릭 행 수신 인터페이스
 *
 * 행은 생성 순서대로 한 번씩 전달됨. 버퍼링/백프레셔는 구현체 책임.
 */
class IMetricSink {
public:
    virtual ~IMetricSink() = default;

    virtual void send(const dto::MetricRow& row) = 0;
};

} // namespace svcmon::core::service
