// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <trestle/core/types/header.hpp>
#include <trestle/core/types/parachains.hpp>
#include <trestle/infra/concurrency/task.hpp>
#include <trestle/relay/common/chain_client.hpp>

namespace trestle::relay {

//! Parachain head as reported by the relay chain at some block
struct AvailableHead {
    enum class Status {
        kUnavailable,  // Source refuses to report the head now, nothing must be updated
        kMissing,      // Parachain has no head at the relay chain
        kAvailable,
    };

    Status status{Status::kMissing};
    std::optional<HeaderId> id;

    bool is_available() const noexcept { return status == Status::kAvailable; }

    static AvailableHead unavailable() { return {Status::kUnavailable, std::nullopt}; }
    static AvailableHead missing() { return {Status::kMissing, std::nullopt}; }
    static AvailableHead available(const HeaderId& id) { return {Status::kAvailable, id}; }

    friend bool operator==(const AvailableHead&, const AvailableHead&) = default;
};

struct ParaHeadProof {
    ParaHeadsProof proof;
    Hash head_hash;
};

//! Best parachain head known to the target
struct ParaHeadAtTarget {
    HeaderId head;
    //! Relay block the head has been proven at
    BlockNum at_relay_block_number{0};

    friend bool operator==(const ParaHeadAtTarget&, const ParaHeadAtTarget&) = default;
};

//! Relay chain storing the parachain heads
class ParachainsSource {
  public:
    virtual ~ParachainsSource() = default;

    virtual const std::string& name() const = 0;

    virtual Task<AvailableHead> parachain_head(const HeaderId& at_relay_block, ParaId para_id) = 0;

    //! Storage proof of the parachain head at the relay block and the hash of the proven head
    virtual Task<ParaHeadProof> prove_parachain_head(const HeaderId& at_relay_block, ParaId para_id) = 0;
};

//! Chain importing the parachain heads
class ParachainsTarget {
  public:
    virtual ~ParachainsTarget() = default;

    virtual const std::string& name() const = 0;

    //! Best relay block finalized by the relay chain light client. Throws RelayError{kNotInitialized}
    //! while the light client has no state.
    virtual Task<std::optional<HeaderId>> best_finalized_relay_block() = 0;

    virtual Task<std::optional<ParaHeadAtTarget>> parachain_head(ParaId para_id) = 0;

    virtual Task<std::unique_ptr<TransactionTracker>> submit_head_proof(const HeaderId& at_relay_block,
                                                                        const ParaHeadUpdate& update,
                                                                        const ParaHeadsProof& proof) = 0;
};

class ChainParachainsSource : public ParachainsSource {
  public:
    explicit ChainParachainsSource(ChainClient& client, std::string paras_module_name = "Paras")
        : client_{client}, paras_module_name_{std::move(paras_module_name)} {}

    const std::string& name() const override { return client_.chain_name(); }

    Task<AvailableHead> parachain_head(const HeaderId& at_relay_block, ParaId para_id) override;
    Task<ParaHeadProof> prove_parachain_head(const HeaderId& at_relay_block, ParaId para_id) override;

  private:
    //! Encoded head stored at the relay block, std::nullopt when the parachain has none
    Task<std::optional<ParaHead>> read_head(const HeaderId& at_relay_block, ParaId para_id);

    ChainClient& client_;
    std::string paras_module_name_;
};

class ChainParachainsTarget : public ParachainsTarget {
  public:
    ChainParachainsTarget(ChainClient& client, const AccountId& relayer) : client_{client}, relayer_{relayer} {}

    const std::string& name() const override { return client_.chain_name(); }

    Task<std::optional<HeaderId>> best_finalized_relay_block() override;
    Task<std::optional<ParaHeadAtTarget>> parachain_head(ParaId para_id) override;
    Task<std::unique_ptr<TransactionTracker>> submit_head_proof(const HeaderId& at_relay_block,
                                                                const ParaHeadUpdate& update,
                                                                const ParaHeadsProof& proof) override;

  private:
    ChainClient& client_;
    AccountId relayer_;
};

}  // namespace trestle::relay
