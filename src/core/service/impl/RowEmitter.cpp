#include "RowEmitter.h"

#include <string>

namespace svcmon::core::service {

namespace {

void appendOneHot(std::vector<dto::MetricRow>& rows,
                  dto::MetricKind kind,
                  const std::string& name,
                  const std::vector<OneHotEntry>& entries) {
    for (const auto& [label, indicator] : entries) {
        rows.emplace_back(kind, indicator, std::vector<std::string>{name, std::string(label)});
    }
}

} // namespace

std::vector<dto::MetricRow> buildRows(const dto::ServiceRecord& record) {
    std::vector<dto::MetricRow> rows;
    rows.reserve(kRowsPerService);

    const std::string name = toLowerAscii(record.name);

    rows.emplace_back(dto::MetricKind::Info, 1.0, std::vector<std::string>{
        name,
        record.displayName,
        std::to_string(record.processId),
        record.runAs,
    });

    appendOneHot(rows, dto::MetricKind::State, name,
                 oneHot(kAllStates, std::optional<ServiceState>(record.state)));
    appendOneHot(rows, dto::MetricKind::StartMode, name,
                 oneHot(kAllStartModes, record.startMode));
    appendOneHot(rows, dto::MetricKind::Status, name,
                 oneHot(kAllStatuses, record.status));

    return rows;
}

std::size_t emitRows(const dto::ServiceRecord& record, IMetricSink& sink) {
    const auto rows = buildRows(record);
    for (const auto& row : rows) {
        sink.send(row);
    }
    return rows.size();
}

} // namespace svcmon::core::service
