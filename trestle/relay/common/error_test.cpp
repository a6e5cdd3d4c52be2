// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "error.hpp"

#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>
#include <catch2/catch.hpp>

#include <trestle/infra/common/decoding_exception.hpp>
#include <trestle/infra/concurrency/timeout.hpp>

namespace trestle::relay {

TEST_CASE("Relay errors are classified", "[relay][common]") {
    CHECK(classify(std::make_exception_ptr(RelayError{ErrorKind::kNotInitialized, "not initialized"})) ==
          ErrorKind::kNotInitialized);
    CHECK(classify(std::make_exception_ptr(boost::system::system_error{boost::asio::error::connection_reset})) ==
          ErrorKind::kTransientNetwork);
    CHECK(classify(std::make_exception_ptr(concurrency::TimeoutExpiredError{})) == ErrorKind::kTransientNetwork);
    CHECK(classify(std::make_exception_ptr(DecodingException{DecodingError::kInputTooShort, "short"})) ==
          ErrorKind::kDecode);
    CHECK(classify(std::make_exception_ptr(std::logic_error{"bug"})) == ErrorKind::kFatal);
    CHECK(classify(std::make_exception_ptr(42)) == ErrorKind::kFatal);
}

TEST_CASE("Error kinds map to actions", "[relay][common]") {
    CHECK(action_for(ErrorKind::kTransientNetwork) == ErrorAction::kRetry);
    CHECK(action_for(ErrorKind::kProofConstruction) == ErrorAction::kRetry);
    CHECK(action_for(ErrorKind::kCapacityExceeded) == ErrorAction::kRetry);
    CHECK(action_for(ErrorKind::kTransactionLost) == ErrorAction::kRetry);
    CHECK(action_for(ErrorKind::kDecode) == ErrorAction::kSkip);
    CHECK(action_for(ErrorKind::kPayment) == ErrorAction::kSkip);
    CHECK(action_for(ErrorKind::kNotInitialized) == ErrorAction::kHalt);
    CHECK(action_for(ErrorKind::kOrderingViolation) == ErrorAction::kHalt);
    CHECK(action_for(ErrorKind::kFatal) == ErrorAction::kHalt);
}

TEST_CASE("Error messages", "[relay][common]") {
    CHECK(what(std::make_exception_ptr(RelayError{ErrorKind::kFatal, "boom"})) == "boom");
    CHECK(what(std::make_exception_ptr(42)) == "unknown exception");
}

}  // namespace trestle::relay
