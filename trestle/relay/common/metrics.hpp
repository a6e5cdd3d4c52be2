// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <absl/container/btree_map.h>

namespace trestle::relay {

class Gauge {
  public:
    void set(double value) noexcept { value_.store(value, std::memory_order_relaxed); }
    double value() const noexcept { return value_.load(std::memory_order_relaxed); }

  private:
    std::atomic<double> value_{0.0};
};

using Labels = std::vector<std::pair<std::string, std::string>>;

//! Registry of the gauges exported by the relay pipelines
class Metrics {
  public:
    Metrics() = default;

    Metrics(const Metrics&) = delete;
    Metrics& operator=(const Metrics&) = delete;

    //! Gauge registered under name and labels, created on first use. References stay valid.
    Gauge& gauge(const std::string& name, const Labels& labels = {});

    //! Current value of a registered gauge, 0 when unknown
    double value(const std::string& name, const Labels& labels = {}) const;

    //! Prometheus text exposition of every gauge
    std::string render() const;

  private:
    static std::string series_key(const std::string& name, const Labels& labels);

    mutable std::mutex mutex_;
    // keyed by metric name, then by series name (metric name with its labels)
    absl::btree_map<std::pair<std::string, std::string>, std::unique_ptr<Gauge>> gauges_;
};

}  // namespace trestle::relay
