// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <iostream>

#include <catch2/catch.hpp>

#include <trestle/infra/test_util/log.hpp>

namespace trestle::log {

TEST_CASE("Log verbosity filtering", "[infra][log]") {
    test_util::SetLogVerbosityGuard guard{Level::kWarning};
    CHECK(test_verbosity(Level::kCritical));
    CHECK(test_verbosity(Level::kWarning));
    CHECK_FALSE(test_verbosity(Level::kInfo));
    CHECK_FALSE(test_verbosity(Level::kTrace));
}

TEST_CASE("Log buffer prints key value arguments", "[infra][log]") {
    test_util::SetLogVerbosityGuard guard{Level::kInfo};
    std::stringstream captured;
    test_util::StreamSwap swap{std::cerr, captured};

    SECTION("enabled level") {
        Info{"Submitted finality proof", {"number", "42", "hash", "0xab"}};
        const std::string line{captured.str()};
        CHECK(line.find("INFO") != std::string::npos);
        CHECK(line.find("Submitted finality proof") != std::string::npos);
        CHECK(line.find("42") != std::string::npos);
        CHECK(line.find("0xab") != std::string::npos);
    }

    SECTION("filtered level") {
        Debug{"Not printed", {"k", "v"}};
        TRESTLE_TRACE << "Not printed either";
        CHECK(captured.str().empty());
    }
}

}  // namespace trestle::log
