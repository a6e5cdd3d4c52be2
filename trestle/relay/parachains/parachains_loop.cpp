// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "parachains_loop.hpp"

#include <utility>
#include <variant>

#include <absl/strings/str_cat.h>

#include <trestle/infra/common/log.hpp>
#include <trestle/infra/concurrency/awaitable_wait_for_one.hpp>
#include <trestle/infra/concurrency/timeout.hpp>
#include <trestle/relay/common/relay_loop.hpp>
#include <trestle/relay/common/retry.hpp>

namespace trestle::relay {

namespace {

    constexpr size_t kUpdatesBufferSize{16};

}  // namespace

ParachainsLoop::ParachainsLoop(const boost::asio::any_io_executor& executor, ParachainsSource& source,
                               ParachainsTarget& target, ParachainsSyncParams params, Metrics* metrics)
    : source_{source},
      target_{target},
      params_{std::move(params)},
      metrics_{metrics},
      updates_{executor, kUpdatesBufferSize} {}

Task<ErrorKind> ParachainsLoop::run() {
    using namespace concurrency::awaitable_wait_for_one;

    TRESTLE_INFO_M("Starting parachains relay", {"source", source_.name(), "target", target_.name(),
                                                 "parachains", std::to_string(params_.parachains.size())});
    const FixedIntervalRetry retry_policy{params_.timing.retry_interval};
    const auto result{co_await (run_relay_loop("parachains", retry_policy, params_.timing.tick,
                                               [this]() -> Task<void> { co_await poll_heads(); }) ||
                                run_submissions())};
    if (result.index() == 0) {
        co_return std::get<0>(result);
    }
    co_return submissions_halted_.value_or(ErrorKind::kFatal);
}

Task<void> ParachainsLoop::run_submissions() {
    const FixedIntervalRetry retry_policy{params_.timing.retry_interval};
    submissions_halted_ = co_await run_relay_loop("parachains-submission", retry_policy, std::chrono::milliseconds{0},
                                                  [this]() -> Task<void> { co_await submit_next_head(); });
}

Task<void> ParachainsLoop::poll_heads() {
    const auto relay_block{co_await target_.best_finalized_relay_block()};
    if (!relay_block) {
        co_return;
    }
    for (const ParaId para_id : params_.parachains) {
        const AvailableHead head{co_await source_.parachain_head(*relay_block, para_id)};
        if (head.is_available()) {
            update_metrics("parachains_best_head_at_source", para_id, head.id->number);
        }
        co_await updates_.send(AvailableHeadUpdate{para_id, *relay_block, head});
    }
}

Task<HeadSubmissionOutcome> ParachainsLoop::submit_next_head() {
    const AvailableHeadUpdate update{co_await updates_.receive()};
    co_return co_await submit_head(update);
}

std::optional<AvailableHeadUpdate> ParachainsLoop::cached_head(ParaId para_id) const {
    const auto it{cache_.find(para_id)};
    if (it == cache_.end() || !it->second.update.head.is_available()) {
        return std::nullopt;
    }
    return it->second.update;
}

Task<HeadSubmissionOutcome> ParachainsLoop::submit_head(const AvailableHeadUpdate& update) {
    const std::string para{std::to_string(update.para_id)};
    if (update.head.status == AvailableHead::Status::kUnavailable) {
        TRESTLE_DEBUG_M("Parachain head is unavailable at source", {"source", source_.name(), "para_id", para});
        co_return HeadSubmissionOutcome::kUnavailable;
    }
    auto& cached{cache_[update.para_id]};
    if (cached.update != update) {
        cached = CachedHead{update, std::nullopt};
    }
    if (!update.head.is_available()) {
        TRESTLE_TRACE_M("Parachain has no head at source", {"source", source_.name(), "para_id", para});
        co_return HeadSubmissionOutcome::kMissing;
    }

    const HeaderId& head{*update.head.id};
    const auto at_target{co_await target_.parachain_head(update.para_id)};
    if (at_target) {
        update_metrics("parachains_best_head_at_target", update.para_id, at_target->head.number);
        if (at_target->head.hash == head.hash || at_target->at_relay_block_number >= update.at_relay_block.number) {
            TRESTLE_TRACE_M("Parachain head is up to date at target",
                            {"target", target_.name(), "para_id", para, "head", at_target->head.to_string()});
            cache_.erase(update.para_id);
            co_return HeadSubmissionOutcome::kUpToDate;
        }
    }

    const ParaHeadProof proof{co_await head_proof(update)};
    if (params_.dry_run) {
        TRESTLE_INFO_M("Dry run: not submitting parachain head",
                       {"target", target_.name(), "para_id", para, "head", head.to_string()});
        co_return HeadSubmissionOutcome::kDryRun;
    }

    TRESTLE_INFO_M("Submitting parachain head", {"source", source_.name(), "target", target_.name(), "para_id", para,
                                                 "head", head.to_string(), "relay_block",
                                                 update.at_relay_block.to_string()});
    auto tracker{co_await target_.submit_head_proof(update.at_relay_block, {update.para_id, head.hash}, proof.proof)};
    co_await track(std::move(tracker), update);
    cache_.erase(update.para_id);
    co_return HeadSubmissionOutcome::kSubmitted;
}

Task<ParaHeadProof> ParachainsLoop::head_proof(const AvailableHeadUpdate& update) {
    CachedHead& cached{cache_[update.para_id]};
    if (cached.proof) {
        TRESTLE_TRACE_M("Reusing parachain head proof",
                        {"para_id", std::to_string(update.para_id), "relay_block", update.at_relay_block.to_string()});
        co_return *cached.proof;
    }
    ParaHeadProof proof{co_await source_.prove_parachain_head(update.at_relay_block, update.para_id)};
    if (proof.head_hash != update.head.id->hash) {
        // both are read at the same relay block
        throw RelayError{ErrorKind::kProofConstruction,
                         absl::StrCat("proven head of parachain ", update.para_id, " differs from the head read")};
    }
    cached.proof = proof;
    co_return proof;
}

Task<void> ParachainsLoop::track(std::unique_ptr<TransactionTracker> tracker, const AvailableHeadUpdate& update) {
    using namespace concurrency::awaitable_wait_for_one;

    const auto result{co_await (tracker->wait() || concurrency::timeout(params_.timing.stall_timeout))};
    if (!std::get<0>(result).finalized()) {
        throw RelayError{ErrorKind::kTransactionLost,
                         absl::StrCat("head of parachain ", update.para_id, " lost at ", target_.name())};
    }
    const auto at_target{co_await target_.parachain_head(update.para_id)};
    if (!at_target || at_target->head != *update.head.id) {
        throw RelayError{ErrorKind::kTransactionLost,
                         absl::StrCat("head of parachain ", update.para_id, " not imported by ", target_.name())};
    }
    update_metrics("parachains_best_head_at_target", update.para_id, at_target->head.number);
    TRESTLE_INFO_M("Parachain head imported", {"target", target_.name(), "para_id", std::to_string(update.para_id),
                                               "head", at_target->head.to_string()});
}

void ParachainsLoop::update_metrics(const char* name, ParaId para_id, BlockNum number) {
    if (!metrics_) {
        return;
    }
    metrics_->gauge(name, {{"para_id", std::to_string(para_id)}, {"target", target_.name()}})
        .set(static_cast<double>(number));
}

}  // namespace trestle::relay
