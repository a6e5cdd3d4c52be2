// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "metrics.hpp"

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

namespace trestle::relay {

std::string Metrics::series_key(const std::string& name, const Labels& labels) {
    if (labels.empty()) {
        return name;
    }
    const auto format_label = [](std::string* out, const std::pair<std::string, std::string>& label) {
        absl::StrAppend(out, label.first, "=\"", label.second, "\"");
    };
    return absl::StrCat(name, "{", absl::StrJoin(labels, ",", format_label), "}");
}

Gauge& Metrics::gauge(const std::string& name, const Labels& labels) {
    std::scoped_lock lock{mutex_};
    auto& gauge{gauges_[std::make_pair(name, series_key(name, labels))]};
    if (!gauge) {
        gauge = std::make_unique<Gauge>();
    }
    return *gauge;
}

double Metrics::value(const std::string& name, const Labels& labels) const {
    std::scoped_lock lock{mutex_};
    const auto it{gauges_.find(std::make_pair(name, series_key(name, labels)))};
    return it == gauges_.end() ? 0.0 : it->second->value();
}

std::string Metrics::render() const {
    std::scoped_lock lock{mutex_};
    std::string text;
    std::string last_name;
    for (const auto& [key, gauge] : gauges_) {
        const auto& [name, series]{key};
        if (name != last_name) {
            absl::StrAppend(&text, "# TYPE ", name, " gauge\n");
            last_name = name;
        }
        absl::StrAppend(&text, series, " ", gauge->value(), "\n");
    }
    return text;
}

}  // namespace trestle::relay
