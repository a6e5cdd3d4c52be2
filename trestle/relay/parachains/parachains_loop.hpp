// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <map>
#include <optional>
#include <vector>

#include <boost/asio/any_io_executor.hpp>

#include <trestle/infra/concurrency/channel.hpp>
#include <trestle/infra/concurrency/task.hpp>
#include <trestle/relay/common/bridge_config.hpp>
#include <trestle/relay/common/error.hpp>
#include <trestle/relay/common/metrics.hpp>
#include <trestle/relay/parachains/parachains_clients.hpp>

namespace trestle::relay {

struct ParachainsSyncParams {
    std::vector<ParaId> parachains;
    LoopTiming timing;
    bool dry_run{false};
};

//! Head of a parachain at a relay block finalized at target
struct AvailableHeadUpdate {
    ParaId para_id{0};
    HeaderId at_relay_block;
    AvailableHead head;

    friend bool operator==(const AvailableHeadUpdate&, const AvailableHeadUpdate&) = default;
};

enum class HeadSubmissionOutcome {
    kUnavailable,  // Source refused to report the head
    kMissing,      // No head to submit
    kUpToDate,     // Target already knows the head
    kSubmitted,
    kDryRun,
};

//! Relays the heads of parachains from their relay chain to target. A polling task reads the heads
//! available at source and feeds them over a channel to the submission task, the only owner of the
//! cache of heads waiting for submission.
class ParachainsLoop {
  public:
    ParachainsLoop(const boost::asio::any_io_executor& executor, ParachainsSource& source, ParachainsTarget& target,
                   ParachainsSyncParams params, Metrics* metrics = nullptr);

    //! Runs both tasks until cancelled, or until an error halts one of them, returning its kind
    Task<ErrorKind> run();

    //! Reads the heads at the best relay block finalized at target and sends them to the submission task
    Task<void> poll_heads();

    //! Waits for the next head update and submits the head when target needs it
    Task<HeadSubmissionOutcome> submit_next_head();

    //! Head waiting for submission, std::nullopt when there is none
    std::optional<AvailableHeadUpdate> cached_head(ParaId para_id) const;

  private:
    //! Head waiting for submission with its proof, kept until the head is imported
    struct CachedHead {
        AvailableHeadUpdate update;
        std::optional<ParaHeadProof> proof;
    };

    Task<void> run_submissions();
    Task<ParaHeadProof> head_proof(const AvailableHeadUpdate& update);
    Task<HeadSubmissionOutcome> submit_head(const AvailableHeadUpdate& update);
    Task<void> track(std::unique_ptr<TransactionTracker> tracker, const AvailableHeadUpdate& update);
    void update_metrics(const char* name, ParaId para_id, BlockNum number);

    ParachainsSource& source_;
    ParachainsTarget& target_;
    ParachainsSyncParams params_;
    Metrics* metrics_;

    concurrency::Channel<AvailableHeadUpdate> updates_;
    std::map<ParaId, CachedHead> cache_;
    std::optional<ErrorKind> submissions_halted_;
};

}  // namespace trestle::relay
