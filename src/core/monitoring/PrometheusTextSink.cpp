// PrometheusTextSink.cpp
// Copyright (C) 2025 svcmon Project

#include "PrometheusTextSink.h"
#include "MetricDescriptors.h"

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace svcmon::core::monitoring {

PrometheusTextSink::PrometheusTextSink(std::string ns)
    : namespace_(std::move(ns)) {
}

std::string PrometheusTextSink::escapeLabelValue(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (const char c : value) {
        switch (c) {
            case '\\': escaped += "\\\\"; break;
            case '"':  escaped += "\\\""; break;
            case '\n': escaped += "\\n"; break;
            default:   escaped += c; break;
        }
    }
    return escaped;
}

std::string PrometheusTextSink::formatValue(double value) {
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::isinf(value)) {
        return value > 0 ? "+Inf" : "-Inf";
    }
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

std::string PrometheusTextSink::labelsToString(const Labels& labels) {
    if (labels.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& [key, value] : labels) {
        if (!first) {
            oss << ",";
        }
        oss << key << "=\"" << escapeLabelValue(value) << "\"";
        first = false;
    }
    oss << "}";
    return oss.str();
}

PrometheusTextSink::Family& PrometheusTextSink::getOrCreateFamily(
    const std::string& name,
    const std::string& help,
    const std::string& type) {

    auto it = family_index_.find(name);
    if (it != family_index_.end()) {
        return families_[it->second];
    }

    family_index_[name] = families_.size();
    families_.push_back(Family{name, help, type, {}});
    return families_.back();
}

void PrometheusTextSink::addSample(Family& family, const Labels& labels, double value) {
    family.samples.push_back(family.name + labelsToString(labels) + " " + formatValue(value));
    ++sample_count_;
}

void PrometheusTextSink::send(const service::dto::MetricRow& row) {
    const MetricDescriptor descriptor = describe(row.kind, namespace_);
    if (descriptor.labelNames.size() != row.labelValues.size()) {
        throw std::invalid_argument(
            "label count mismatch for " + descriptor.name + ": expected " +
            std::to_string(descriptor.labelNames.size()) + ", got " +
            std::to_string(row.labelValues.size()));
    }

    Labels labels;
    labels.reserve(row.labelValues.size());
    for (std::size_t i = 0; i < row.labelValues.size(); ++i) {
        labels.emplace_back(descriptor.labelNames[i], row.labelValues[i]);
    }

    auto& family = getOrCreateFamily(descriptor.name, descriptor.help, "gauge");
    addSample(family, labels, row.value);
}

void PrometheusTextSink::addGauge(const std::string& name,
                                  const std::string& help,
                                  const Labels& labels,
                                  double value) {
    auto& family = getOrCreateFamily(name, help, "gauge");
    addSample(family, labels, value);
}

std::string PrometheusTextSink::render() const {
    std::ostringstream oss;

    for (const auto& family : families_) {
        if (!family.help.empty()) {
            oss << "# HELP " << family.name << " " << family.help << "\n";
        }
        oss << "# TYPE " << family.name << " " << family.type << "\n";

        for (const auto& sample : family.samples) {
            oss << sample << "\n";
        }
    }

    return oss.str();
}

} // namespace svcmon::core::monitoring
