// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "finality_loop.hpp"

#include <exception>
#include <map>
#include <variant>

#include <absl/strings/str_cat.h>
#include <boost/system/errc.hpp>
#include <boost/system/system_error.hpp>

#include <trestle/infra/common/log.hpp>
#include <trestle/infra/concurrency/awaitable_wait_for_one.hpp>
#include <trestle/infra/concurrency/sleep.hpp>
#include <trestle/infra/concurrency/timeout.hpp>
#include <trestle/relay/common/relay_loop.hpp>
#include <trestle/relay/common/retry.hpp>
#include <trestle/relay/finality/finality_proof_stream.hpp>

namespace trestle::relay {

namespace {

    //! Streamed justifications waiting for the next iteration
    constexpr size_t kStreamedProofsBufferSize{64};

}  // namespace

FinalityLoop::FinalityLoop(const boost::asio::any_io_executor& executor, FinalitySource& source,
                           FinalityTarget& target, FinalitySyncParams params, Metrics* metrics)
    : source_{source},
      target_{target},
      params_{params},
      metrics_{metrics},
      streamed_proofs_{executor, kStreamedProofsBufferSize} {}

Task<ErrorKind> FinalityLoop::run() {
    using namespace concurrency::awaitable_wait_for_one;

    TRESTLE_INFO_M("Starting finality relay", {"source", source_.name(), "target", target_.name()});
    const FixedIntervalRetry retry_policy{params_.timing.retry_interval};
    const auto result{co_await (run_relay_loop("finality", retry_policy, params_.timing.tick,
                                               [this]() -> Task<void> { co_await run_iteration(); }) ||
                                read_proofs())};
    co_return std::get<0>(result);
}

Task<void> FinalityLoop::read_proofs() {
    FinalityProofStream stream{source_};
    while (true) {
        std::exception_ptr error;
        try {
            auto justification{co_await stream.next()};
            co_await streamed_proofs_.send(std::move(justification));
        } catch (const boost::system::system_error& ex) {
            if (ex.code() == boost::system::errc::operation_canceled) {
                throw;
            }
            error = std::current_exception();
        } catch (const std::exception&) {
            error = std::current_exception();
        }
        if (error) {
            TRESTLE_WARN_M("Finality proofs stream failed", {"source", source_.name(), "error", what(error)});
            stream.reset();
            co_await sleep(params_.timing.retry_interval);
        }
    }
}

Task<IterationOutcome> FinalityLoop::run_iteration() {
    const BlockNum best_at_source{co_await source_.best_finalized_number()};
    const auto best_at_target{co_await target_.best_finalized_source_id()};
    if (!best_at_target) {
        throw RelayError{ErrorKind::kNotInitialized,
                         absl::StrCat("light client of ", source_.name(), " is not initialized at ", target_.name())};
    }

    const bool same_fork{co_await is_on_same_fork(*best_at_target)};
    update_metrics(best_at_source, best_at_target->number, same_fork);
    if (!same_fork) {
        co_return IterationOutcome::kForkDetected;
    }
    TRESTLE_TRACE_M("Finality sync state", {"source", source_.name(), "at_source", std::to_string(best_at_source),
                                            "at_target", std::to_string(best_at_target->number)});

    if (submitted_ && best_at_target->number < submitted_->number) {
        if (std::chrono::steady_clock::now() - submitted_->at < params_.timing.stall_timeout) {
            co_return IterationOutcome::kWaitingForSubmitted;
        }
        TRESTLE_WARN_M("Submitted finality proof is not imported in time, submitting again",
                       {"source", source_.name(), "number", std::to_string(submitted_->number)});
        submitted_.reset();
    }

    drain_streamed_proofs();
    if (best_at_source <= best_at_target->number) {
        prune_recent_proofs(best_at_target->number);
        co_return IterationOutcome::kIdle;
    }

    const auto selected{co_await select_header_to_submit(best_at_target->number, best_at_source)};
    if (!selected) {
        co_return IterationOutcome::kNoProof;
    }
    if (params_.dry_run) {
        TRESTLE_INFO_M("Dry run: not submitting finality proof",
                       {"source", source_.name(), "target", target_.name(), "header", selected->header.id().to_string()});
        co_return IterationOutcome::kDryRun;
    }
    co_await submit_and_track(*selected);
    co_return IterationOutcome::kSubmitted;
}

Task<std::optional<JustifiedHeader>> FinalityLoop::select_header_to_submit(BlockNum best_at_target,
                                                                           BlockNum best_at_source) {
    std::optional<JustifiedHeader> selected;
    // hashes of the headers in range, to match the streamed justifications against
    std::map<BlockNum, Hash> headers_in_range;
    for (BlockNum number{best_at_target + 1}; number <= best_at_source; ++number) {
        auto [header, justification]{co_await source_.header_and_proof(number)};
        if (is_mandatory(header)) {
            if (!justification) {
                throw RelayError{ErrorKind::kProofConstruction,
                                 absl::StrCat("mandatory header ", number, " of ", source_.name(),
                                              " has no justification")};
            }
            TRESTLE_DEBUG_M("Selected mandatory header", {"source", source_.name(), "number", std::to_string(number)});
            co_return JustifiedHeader{std::move(header), std::move(*justification)};
        }
        if (params_.headers_to_relay == HeadersToRelay::kMandatory) {
            continue;
        }
        headers_in_range.emplace(number, header.hash());
        if (justification) {
            selected = JustifiedHeader{std::move(header), std::move(*justification)};
        }
    }
    if (params_.headers_to_relay == HeadersToRelay::kMandatory) {
        co_return std::nullopt;
    }

    // a streamed justification may prove a better header than the persistent ones
    const BlockNum best_selected{selected ? selected->header.number : best_at_target};
    for (auto it{recent_proofs_.rbegin()}; it != recent_proofs_.rend(); ++it) {
        const HeaderId& target{it->commit.target};
        if (target.number <= best_selected) {
            continue;
        }
        const auto header_it{headers_in_range.find(target.number)};
        if (header_it == headers_in_range.end() || header_it->second != target.hash) {
            continue;
        }
        auto streamed{co_await source_.header_and_proof(target.number)};
        selected = JustifiedHeader{std::move(streamed.header), *it};
        break;
    }

    prune_recent_proofs(selected ? selected->header.number : best_at_target);
    co_return selected;
}

Task<bool> FinalityLoop::is_on_same_fork(const HeaderId& best_at_target) {
    const auto at_source{co_await source_.header_and_proof(best_at_target.number)};
    const Hash hash_at_source{at_source.header.hash()};
    if (hash_at_source == best_at_target.hash) {
        co_return true;
    }
    TRESTLE_ERROR_M("Source and target have different headers at the same height",
                    {"source", source_.name(), "target", target_.name(), "number",
                     std::to_string(best_at_target.number), "at_source", hash_at_source.to_hex(), "at_target",
                     best_at_target.hash.to_hex()});
    co_return false;
}

Task<void> FinalityLoop::submit_and_track(const JustifiedHeader& selected) {
    using namespace concurrency::awaitable_wait_for_one;

    const HeaderId id{selected.header.id()};
    TRESTLE_INFO_M("Submitting finality proof", {"source", source_.name(), "target", target_.name(), "header",
                                                 id.to_string(), "mandatory",
                                                 is_mandatory(selected.header) ? "true" : "false"});
    auto tracker{co_await target_.submit_finality_proof(selected.header, selected.justification)};
    submitted_ = Submitted{id.number, std::chrono::steady_clock::now()};

    const auto result{co_await (tracker->wait() || concurrency::timeout(params_.timing.stall_timeout))};
    const TrackedTransactionStatus& status{std::get<0>(result)};
    if (!status.finalized()) {
        submitted_.reset();
        throw RelayError{ErrorKind::kTransactionLost,
                         absl::StrCat("finality proof of ", id.to_string(), " lost at ", target_.name())};
    }

    // a finalized transaction may still have failed to import the header
    const auto best_at_target{co_await target_.best_finalized_source_id()};
    if (!best_at_target || best_at_target->number < id.number) {
        submitted_.reset();
        throw RelayError{ErrorKind::kTransactionLost,
                         absl::StrCat("finality proof of ", id.to_string(), " did not advance the light client at ",
                                      target_.name())};
    }
    TRESTLE_INFO_M("Synced headers", {"source", source_.name(), "target", target_.name(), "best",
                                      best_at_target->to_string()});
}

void FinalityLoop::drain_streamed_proofs() {
    while (auto justification{streamed_proofs_.try_receive()}) {
        recent_proofs_.push_back(std::move(*justification));
    }
}

void FinalityLoop::prune_recent_proofs(BlockNum oldest_to_keep) {
    std::erase_if(recent_proofs_, [&](const finality::Justification& justification) {
        return justification.commit.target.number <= oldest_to_keep;
    });
    while (recent_proofs_.size() > params_.recent_finality_proofs_limit) {
        recent_proofs_.pop_front();
    }
}

void FinalityLoop::update_metrics(BlockNum best_at_source, BlockNum best_at_target, bool same_fork) {
    if (!metrics_) {
        return;
    }
    const Labels labels{{"source", source_.name()}, {"target", target_.name()}};
    metrics_->gauge("finality_best_block_at_source", labels).set(static_cast<double>(best_at_source));
    metrics_->gauge("finality_best_block_at_target", labels).set(static_cast<double>(best_at_target));
    metrics_->gauge("finality_is_using_same_fork", labels).set(same_fork ? 1.0 : 0.0);
}

}  // namespace trestle::relay
