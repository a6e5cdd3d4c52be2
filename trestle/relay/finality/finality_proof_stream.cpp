// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "finality_proof_stream.hpp"

#include <magic_enum.hpp>

#include <trestle/infra/common/log.hpp>

namespace trestle::relay {

Task<finality::Justification> FinalityProofStream::next() {
    while (true) {
        if (!subscription_) {
            subscription_ = co_await source_.subscribe();
            TRESTLE_DEBUG_M("Subscribed to finality proofs", {"source", source_.name()});
        }

        const auto encoded{co_await subscription_->next()};
        if (!encoded) {
            TRESTLE_WARN_M("Finality proofs subscription lost", {"source", source_.name()});
            subscription_.reset();
            ++resubscriptions_;
            co_await source_.reconnect();
            continue;
        }

        ByteView view{*encoded};
        finality::Justification justification;
        if (const auto result{codec::decode(view, justification)}; !result) {
            TRESTLE_WARN_M("Skipped malformed finality proof",
                           {"source", source_.name(), "error", std::string{magic_enum::enum_name(result.error())}});
            continue;
        }
        co_return justification;
    }
}

}  // namespace trestle::relay
