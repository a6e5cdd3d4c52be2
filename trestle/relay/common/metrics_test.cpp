// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "metrics.hpp"

#include <catch2/catch.hpp>

namespace trestle::relay {

TEST_CASE("Metrics gauges", "[relay][common]") {
    Metrics metrics;
    CHECK(metrics.value("unknown") == 0);

    Gauge& gauge{metrics.gauge("best_block", {{"chain", "Millau"}})};
    gauge.set(12);
    CHECK(metrics.value("best_block", {{"chain", "Millau"}}) == 12);
    CHECK(&metrics.gauge("best_block", {{"chain", "Millau"}}) == &gauge);
    CHECK(metrics.value("best_block", {{"chain", "Rialto"}}) == 0);
    CHECK(metrics.value("best_block") == 0);
}

TEST_CASE("Metrics text exposition", "[relay][common]") {
    Metrics metrics;
    CHECK(metrics.render().empty());

    metrics.gauge("lane_state_nonces", {{"lane", "0x00000000"}, {"type", "source_latest_generated"}}).set(5);
    metrics.gauge("lane_state_nonces", {{"lane", "0x00000000"}, {"type", "target_latest_received"}}).set(3);
    metrics.gauge("finality_best_block_at_source").set(8);

    CHECK(metrics.render() ==
          "# TYPE finality_best_block_at_source gauge\n"
          "finality_best_block_at_source 8\n"
          "# TYPE lane_state_nonces gauge\n"
          "lane_state_nonces{lane=\"0x00000000\",type=\"source_latest_generated\"} 5\n"
          "lane_state_nonces{lane=\"0x00000000\",type=\"target_latest_received\"} 3\n");
}

}  // namespace trestle::relay
