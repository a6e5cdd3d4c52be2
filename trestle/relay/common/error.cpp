// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "error.hpp"

#include <boost/system/system_error.hpp>

#include <trestle/infra/common/decoding_exception.hpp>
#include <trestle/infra/concurrency/timeout.hpp>

namespace trestle::relay {

ErrorKind classify(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const RelayError& e) {
        return e.kind();
    } catch (const boost::system::system_error&) {
        return ErrorKind::kTransientNetwork;
    } catch (const concurrency::TimeoutExpiredError&) {
        return ErrorKind::kTransientNetwork;
    } catch (const DecodingException&) {
        return ErrorKind::kDecode;
    } catch (const std::exception&) {
        return ErrorKind::kFatal;
    } catch (...) {
        return ErrorKind::kFatal;
    }
}

ErrorAction action_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kTransientNetwork:
        case ErrorKind::kProofConstruction:
        case ErrorKind::kCapacityExceeded:
        case ErrorKind::kTransactionLost:
            return ErrorAction::kRetry;
        case ErrorKind::kDecode:
        case ErrorKind::kPayment:
            return ErrorAction::kSkip;
        case ErrorKind::kNotInitialized:
        case ErrorKind::kOrderingViolation:
        case ErrorKind::kFatal:
            return ErrorAction::kHalt;
    }
    return ErrorAction::kHalt;
}

std::string what(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}

}  // namespace trestle::relay
