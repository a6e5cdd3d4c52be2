// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <deque>
#include <optional>

#include <boost/asio/any_io_executor.hpp>

#include <trestle/core/finality/justification.hpp>
#include <trestle/core/types/header.hpp>
#include <trestle/infra/concurrency/channel.hpp>
#include <trestle/infra/concurrency/task.hpp>
#include <trestle/relay/common/bridge_config.hpp>
#include <trestle/relay/common/error.hpp>
#include <trestle/relay/common/metrics.hpp>
#include <trestle/relay/finality/finality_clients.hpp>

namespace trestle::relay {

struct FinalitySyncParams {
    LoopTiming timing;
    HeadersToRelay headers_to_relay{HeadersToRelay::kAll};
    //! Justifications read from the stream kept while no header needs them
    size_t recent_finality_proofs_limit{256};
    bool dry_run{false};
};

struct JustifiedHeader {
    Header header;
    finality::Justification justification;

    friend bool operator==(const JustifiedHeader&, const JustifiedHeader&) = default;
};

enum class IterationOutcome {
    kIdle,                 // Target knows the best finalized source header
    kSubmitted,            // A header has been submitted and the light client advanced
    kWaitingForSubmitted,  // The previously submitted header is not yet imported
    kForkDetected,         // Source and target disagree on the finalized chain
    kNoProof,              // Newer headers exist but none can be proven yet
    kDryRun,               // A header was selected, its transaction not submitted
};

//! Relays the finalized headers of source into the light client at target
class FinalityLoop {
  public:
    FinalityLoop(const boost::asio::any_io_executor& executor, FinalitySource& source, FinalityTarget& target,
                 FinalitySyncParams params, Metrics* metrics = nullptr);

    //! Runs until cancelled, or until an error halts the loop, returning its kind
    Task<ErrorKind> run();

    Task<IterationOutcome> run_iteration();

    //! Picks the header to submit among (best_at_target, best_at_source]: the first mandatory header,
    //! otherwise the newest one with a persistent or a recently streamed justification
    Task<std::optional<JustifiedHeader>> select_header_to_submit(BlockNum best_at_target, BlockNum best_at_source);

    //! Justifications read from the source stream, consumed by the iterations
    concurrency::Channel<finality::Justification>& streamed_proofs() noexcept { return streamed_proofs_; }

    size_t recent_proofs_count() const noexcept { return recent_proofs_.size(); }

  private:
    struct Submitted {
        BlockNum number{0};
        std::chrono::steady_clock::time_point at;
    };

    Task<void> read_proofs();
    Task<bool> is_on_same_fork(const HeaderId& best_at_target);
    Task<void> submit_and_track(const JustifiedHeader& selected);
    void drain_streamed_proofs();
    void prune_recent_proofs(BlockNum oldest_to_keep);
    void update_metrics(BlockNum best_at_source, BlockNum best_at_target, bool same_fork);

    FinalitySource& source_;
    FinalityTarget& target_;
    FinalitySyncParams params_;
    Metrics* metrics_;

    concurrency::Channel<finality::Justification> streamed_proofs_;
    std::deque<finality::Justification> recent_proofs_;
    std::optional<Submitted> submitted_;
};

}  // namespace trestle::relay
