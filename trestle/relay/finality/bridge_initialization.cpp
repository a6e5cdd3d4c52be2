// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "bridge_initialization.hpp"

#include <absl/strings/str_cat.h>

#include <trestle/infra/common/log.hpp>
#include <trestle/relay/common/error.hpp>

namespace trestle::relay {

Task<InitializationOutcome> initialize_bridge(FinalitySource& source, FinalityTarget& target, bool dry_run) {
    if (co_await target.is_initialized()) {
        TRESTLE_INFO_M("Bridge is already initialized", {"source", source.name(), "target", target.name()});
        co_return InitializationOutcome::kAlreadyInitialized;
    }

    const auto data{co_await source.prepare_initialization_data()};
    TRESTLE_INFO_M("Initializing bridge", {"source", source.name(), "target", target.name(), "header",
                                           data.header.id().to_string(), "set_id",
                                           std::to_string(data.authority_set.set_id), "authorities",
                                           std::to_string(data.authority_set.authorities.size())});
    if (dry_run) {
        co_return InitializationOutcome::kDryRun;
    }

    auto tracker{co_await target.initialize(data)};
    const auto status{co_await tracker->wait()};
    if (!status.finalized()) {
        throw RelayError{ErrorKind::kTransactionLost,
                         absl::StrCat("initialization of ", source.name(), " light client at ", target.name(),
                                      " failed")};
    }
    TRESTLE_INFO_M("Bridge initialized", {"source", source.name(), "target", target.name()});
    co_return InitializationOutcome::kInitialized;
}

}  // namespace trestle::relay
