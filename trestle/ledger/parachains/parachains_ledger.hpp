// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <trestle/core/state/kv_store.hpp>
#include <trestle/core/types/parachains.hpp>
#include <trestle/ledger/common/header_chain.hpp>
#include <trestle/ledger/common/operating_mode.hpp>
#include <trestle/ledger/common/origin.hpp>
#include <trestle/ledger/common/owned_module.hpp>

namespace trestle::ledger {

// Outcome of the parachain heads ledger calls
enum class [[nodiscard]] ParachainsResult {
    kOk,

    kBadOrigin,
    kHalted,

    kNotInitialized,                // Relay chain light client has no state yet
    kUnknownRelayChainBlock,        // Relay block not imported by the relay chain light client
    kInvalidRelayChainBlockNumber,  // Relay block imported with another number
    kInvalidStorageProof,           // Root mismatch, duplicate or unused proof nodes
};

struct ParachainsConfig {
    std::string module_name{"BridgeParachains"};
    //! Name of the module storing parachain heads at the bridged relay chain
    std::string paras_module_name{"Paras"};
    //! Size of the imported heads ring buffer of every parachain
    uint32_t heads_to_keep{64};
    size_t max_para_head_size{1024};
    //! Parachains whose heads are imported, all when empty
    std::vector<ParaId> tracked_parachains;
};

//! Key of the head of a parachain in the storage of its relay chain
Bytes parachain_head_storage_key(std::string_view paras_module_name, ParaId para_id);

//! On-chain store of parachain heads proven against finalized headers of their relay chain
class ParachainsLedger {
  public:
    ParachainsLedger(state::KeyValueStore& store, ParachainsConfig config, const HeaderChain& relay_chain);
    ~ParachainsLedger();

    ParachainsLedger(const ParachainsLedger&) = delete;
    ParachainsLedger& operator=(const ParachainsLedger&) = delete;

    //! Imports heads read from a storage proof of the relay chain state at at_relay_block.
    //! Heads that are missing, mismatching, untracked or obsolete are skipped without failing the call.
    ParachainsResult submit_parachain_heads(const Origin& origin, const HeaderId& at_relay_block,
                                            const std::vector<ParaHeadUpdate>& parachains,
                                            const ParaHeadsProof& proof);

    ParachainsResult set_operating_mode(const Origin& origin, BasicOperatingMode mode);
    ParachainsResult set_owner(const Origin& origin, const std::optional<AccountId>& new_owner);

    //! Whether an update would be skipped because a better or equal head is already known
    bool is_obsolete(ParaId para_id, BlockNum at_relay_block_number, const Hash& head_hash) const;

    std::optional<ParaInfo> best_parachain_info(ParaId para_id) const;
    std::optional<ParaStoredHeaderData> parachain_head(ParaId para_id, const Hash& head_hash) const;
    std::optional<HeaderId> best_parachain_head_id(ParaId para_id) const;

    BasicOperatingMode operating_mode() const;

    //! Imported heads of one parachain seen as the finalized headers of a bridged chain
    class ParachainHeaderChain : public HeaderChain {
      public:
        ParachainHeaderChain(const ParachainsLedger& ledger, ParaId para_id) : ledger_{ledger}, para_id_{para_id} {}

        std::optional<HeaderId> best_finalized() const override { return ledger_.best_parachain_head_id(para_id_); }
        std::optional<StoredHeaderData> finalized_header(const Hash& header_hash) const override;

      private:
        const ParachainsLedger& ledger_;
        ParaId para_id_;
    };

    ParachainHeaderChain header_chain(ParaId para_id) const { return {*this, para_id}; }

    const ParachainsConfig& config() const noexcept { return config_; }

  private:
    struct Storage;

    bool is_tracked(ParaId para_id) const;
    void update_parachain_head(state::KeyValueStore& state, ParaId para_id, const std::optional<ParaInfo>& stored,
                               BlockNum at_relay_block_number, const ParaStoredHeaderData& data,
                               const Hash& head_hash) const;

    state::KeyValueStore& store_;
    ParachainsConfig config_;
    const HeaderChain& relay_chain_;
    OwnedModule owned_;
    std::unique_ptr<const Storage> storage_;
};

}  // namespace trestle::ledger
