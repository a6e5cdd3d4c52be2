// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <string>

#include <trestle/core/codec/decode.hpp>
#include <trestle/core/finality/justification.hpp>
#include <trestle/core/state/kv_store.hpp>
#include <trestle/core/types/header.hpp>
#include <trestle/infra/common/secp256k1_context.hpp>
#include <trestle/ledger/common/header_chain.hpp>
#include <trestle/ledger/common/operating_mode.hpp>
#include <trestle/ledger/common/origin.hpp>
#include <trestle/ledger/common/owned_module.hpp>

namespace trestle::ledger {

//! Bootstrap state of the light client: any finalized header with the authority set finalizing its successors
struct InitializationData {
    Header header;
    AuthoritySet authority_set;
    BasicOperatingMode operating_mode{BasicOperatingMode::kNormal};

    friend bool operator==(const InitializationData&, const InitializationData&) = default;
};

// Outcome of the header chain ledger calls
enum class [[nodiscard]] HeaderChainResult {
    kOk,

    kBadOrigin,  // Signed origin required, or owner/root for administrative calls
    kHalted,     // Module operations halted by the owner

    kNotInitialized,
    kAlreadyInitialized,
    kTooManyAuthoritiesInSet,

    kOldHeader,                   // Header number not above the best finalized one
    kInvalidAuthoritySetId,       // Submitter assumed another authority set
    kUnsupportedScheduledChange,  // Forced change or scheduled change with a delay
    kInvalidJustification,
};

struct HeaderChainConfig {
    std::string module_name{"BridgeFinality"};
    //! Size of the imported headers ring buffer
    uint32_t headers_to_keep{1024};
    size_t max_authorities{256};
};

//! On-chain light client of a bridged chain, importing headers proven final by authority set justifications
class HeaderChainLedger : public HeaderChain {
  public:
    HeaderChainLedger(state::KeyValueStore& store, HeaderChainConfig config, const SecP256K1Context& secp256k1);
    ~HeaderChainLedger() override;

    // Not copyable nor movable
    HeaderChainLedger(const HeaderChainLedger&) = delete;
    HeaderChainLedger& operator=(const HeaderChainLedger&) = delete;

    HeaderChainResult initialize(const Origin& origin, const InitializationData& init_data);

    //! Imports header proven final by justification, signed by the authority set current_set_id
    HeaderChainResult submit_finality_proof(const Origin& origin, const Header& header,
                                            const finality::Justification& justification, uint64_t current_set_id);

    HeaderChainResult set_operating_mode(const Origin& origin, BasicOperatingMode mode);
    HeaderChainResult set_owner(const Origin& origin, const std::optional<AccountId>& new_owner);

    //! Cheap check rejecting obsolete submissions before they get included into a block
    HeaderChainResult check_obsolete(BlockNum number, std::optional<uint64_t> current_set_id) const;

    bool is_initialized() const;

    std::optional<HeaderId> best_finalized() const override;
    std::optional<StoredHeaderData> finalized_header(const Hash& header_hash) const override;

    std::optional<Hash> initial_hash() const;
    std::optional<AuthoritySet> current_authority_set() const;
    BasicOperatingMode operating_mode() const;
    std::optional<AccountId> owner() const { return owned_.owner(store_); }

    const HeaderChainConfig& config() const noexcept { return config_; }

  private:
    struct Storage;

    HeaderChainResult do_submit_finality_proof(state::KeyValueStore& state, const Header& header,
                                               const finality::Justification& justification,
                                               uint64_t current_set_id) const;
    HeaderChainResult try_enact_authority_change(state::KeyValueStore& state, const Header& header,
                                                 uint64_t current_set_id) const;
    void insert_header(state::KeyValueStore& state, const Header& header, const Hash& hash) const;

    state::KeyValueStore& store_;
    HeaderChainConfig config_;
    const SecP256K1Context& secp256k1_;
    OwnedModule owned_;
    std::unique_ptr<const Storage> storage_;
};

}  // namespace trestle::ledger

namespace trestle::codec {

void encode(Bytes& to, const ledger::InitializationData& data);

DecodingResult decode(ByteView& from, ledger::InitializationData& to, Leftover mode = Leftover::kProhibit) noexcept;

}  // namespace trestle::codec
