// ScrapeHandler.cpp
// Copyright (C) 2025 svcmon Project

#include "ScrapeHandler.h"
#include "MetricDescriptors.h"
#include "PrometheusTextSink.h"

#include <chrono>
#include <stdexcept>

namespace svcmon::core::monitoring {

ScrapeHandler::ScrapeHandler(std::shared_ptr<const svcmon::service::ServiceCollector> collector, std::string ns)
    : collector_(std::move(collector))
    , namespace_(std::move(ns)) {
    if (!collector_) {
        throw std::invalid_argument("ScrapeHandler requires a collector");
    }
}

std::string ScrapeHandler::scrape() const {
    svcmon::service::PassResult result;
    return scrape(result);
}

std::string ScrapeHandler::scrape(svcmon::service::PassResult& result) const {
    PrometheusTextSink sink(namespace_);

    const auto start = std::chrono::steady_clock::now();
    result = collector_->collect(sink);
    const auto duration = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    const Labels labels{{"collector", "service"}};
    sink.addGauge(buildFQName(namespace_, "exporter", "collector_duration_seconds"),
                  "Duration of a collection.", labels, duration);
    sink.addGauge(buildFQName(namespace_, "exporter", "collector_success"),
                  "Whether the collector was successful.", labels, result.ok() ? 1.0 : 0.0);

    return sink.render();
}

} // namespace svcmon::core::monitoring
