// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "header_chain_ledger.hpp"

#include <magic_enum.hpp>

#include <trestle/core/codec/encode_vector.hpp>
#include <trestle/core/state/storage.hpp>
#include <trestle/infra/common/ensure.hpp>
#include <trestle/infra/common/log.hpp>
#include <trestle/ledger/common/transactional.hpp>

namespace trestle::ledger {

struct HeaderChainLedger::Storage {
    explicit Storage(const std::string& module)
        : best_finalized{module, "BestFinalized"},
          initial_hash{module, "InitialHash"},
          current_authority_set{module, "CurrentAuthoritySet"},
          imported_hashes_pointer{module, "ImportedHashesPointer"},
          imported_hashes{module, "ImportedHashes"},
          imported_headers{module, "ImportedHeaders"},
          operating_mode{module, "PalletOperatingMode"} {}

    state::StorageValue<HeaderId> best_finalized;
    state::StorageValue<Hash> initial_hash;
    state::StorageValue<AuthoritySet> current_authority_set;
    state::StorageValue<uint32_t> imported_hashes_pointer;
    state::StorageMap<uint32_t, Hash> imported_hashes;
    state::StorageMap<Hash, StoredHeaderData> imported_headers;
    state::StorageValue<BasicOperatingMode> operating_mode;
};

HeaderChainLedger::HeaderChainLedger(state::KeyValueStore& store, HeaderChainConfig config,
                                     const SecP256K1Context& secp256k1)
    : store_{store},
      config_{std::move(config)},
      secp256k1_{secp256k1},
      owned_{config_.module_name},
      storage_{std::make_unique<Storage>(config_.module_name)} {
    ensure(config_.headers_to_keep > 0, "headers_to_keep must be positive");
}

HeaderChainLedger::~HeaderChainLedger() = default;

HeaderChainResult HeaderChainLedger::initialize(const Origin& origin, const InitializationData& init_data) {
    return transactional<HeaderChainResult>(store_, [&](state::KeyValueStore& state) {
        if (!owned_.is_owner_or_root(state, origin)) {
            return HeaderChainResult::kBadOrigin;
        }
        if (storage_->best_finalized.exists(state)) {
            return HeaderChainResult::kAlreadyInitialized;
        }
        if (init_data.authority_set.authorities.size() > config_.max_authorities) {
            TRESTLE_ERROR_M("Failed to initialize bridge: too many authorities",
                            {"module", config_.module_name,
                             "count", std::to_string(init_data.authority_set.authorities.size()),
                             "max", std::to_string(config_.max_authorities)});
            return HeaderChainResult::kTooManyAuthoritiesInSet;
        }

        const Hash hash{init_data.header.hash()};
        storage_->initial_hash.put(state, hash);
        storage_->imported_hashes_pointer.put(state, 0);
        insert_header(state, init_data.header, hash);
        storage_->current_authority_set.put(state, init_data.authority_set);
        storage_->operating_mode.put(state, init_data.operating_mode);

        TRESTLE_INFO_M("Header chain initialized", {"module", config_.module_name,
                                                    "header", HeaderId{init_data.header.number, hash}.to_string(),
                                                    "set_id", std::to_string(init_data.authority_set.set_id)});
        return HeaderChainResult::kOk;
    });
}

HeaderChainResult HeaderChainLedger::submit_finality_proof(const Origin& origin, const Header& header,
                                                           const finality::Justification& justification,
                                                           uint64_t current_set_id) {
    const auto result{transactional<HeaderChainResult>(store_, [&](state::KeyValueStore& state) {
        if (storage_->operating_mode.get_or_default(state) == BasicOperatingMode::kHalted) {
            return HeaderChainResult::kHalted;
        }
        if (origin.is_root()) {
            return HeaderChainResult::kBadOrigin;
        }
        return do_submit_finality_proof(state, header, justification, current_set_id);
    })};
    if (result != HeaderChainResult::kOk) {
        TRESTLE_DEBUG_M("Rejected finality proof", {"module", config_.module_name,
                                                    "number", std::to_string(header.number),
                                                    "result", std::string{magic_enum::enum_name(result)}});
    }
    return result;
}

HeaderChainResult HeaderChainLedger::do_submit_finality_proof(state::KeyValueStore& state, const Header& header,
                                                              const finality::Justification& justification,
                                                              uint64_t current_set_id) const {
    if (const auto res{check_obsolete(header.number, current_set_id)}; res != HeaderChainResult::kOk) {
        return res;
    }

    const auto authority_set{storage_->current_authority_set.get(state)};
    if (!authority_set) {
        return HeaderChainResult::kNotInitialized;
    }
    const Hash hash{header.hash()};
    if (const auto verified{finality::verify_justification({header.number, hash}, *authority_set, justification,
                                                           secp256k1_)};
        !verified) {
        TRESTLE_ERROR_M("Received invalid justification",
                        {"module", config_.module_name, "hash", hash.to_hex(),
                         "error", std::string{magic_enum::enum_name(verified.error())}});
        return HeaderChainResult::kInvalidJustification;
    }

    if (const auto res{try_enact_authority_change(state, header, authority_set->set_id)};
        res != HeaderChainResult::kOk) {
        return res;
    }
    insert_header(state, header, hash);

    TRESTLE_INFO_M("Imported finalized header", {"module", config_.module_name,
                                                 "header", HeaderId{header.number, hash}.to_string()});
    return HeaderChainResult::kOk;
}

HeaderChainResult HeaderChainLedger::try_enact_authority_change(state::KeyValueStore& state, const Header& header,
                                                                uint64_t current_set_id) const {
    if (header.digest.forced_change) {
        return HeaderChainResult::kUnsupportedScheduledChange;
    }
    const auto& change{header.digest.scheduled_change};
    if (!change) {
        return HeaderChainResult::kOk;
    }
    if (change->delay != 0) {
        return HeaderChainResult::kUnsupportedScheduledChange;
    }
    if (change->next_authorities.size() > config_.max_authorities) {
        return HeaderChainResult::kTooManyAuthoritiesInSet;
    }

    // A scheduled change with no delay is enacted by the header announcing it
    storage_->current_authority_set.put(state, AuthoritySet{change->next_authorities, current_set_id + 1});
    TRESTLE_INFO_M("Transitioned authority set", {"module", config_.module_name,
                                                  "old_set_id", std::to_string(current_set_id),
                                                  "new_set_id", std::to_string(current_set_id + 1)});
    return HeaderChainResult::kOk;
}

void HeaderChainLedger::insert_header(state::KeyValueStore& state, const Header& header, const Hash& hash) const {
    const uint32_t index{storage_->imported_hashes_pointer.get_or_default(state)};
    const auto pruning{storage_->imported_hashes.get(state, index)};

    storage_->best_finalized.put(state, HeaderId{header.number, hash});
    storage_->imported_headers.put(state, hash, StoredHeaderData{header.number, header.state_root});
    storage_->imported_hashes.put(state, index, hash);
    storage_->imported_hashes_pointer.put(state, (index + 1) % config_.headers_to_keep);

    if (pruning) {
        TRESTLE_TRACE_M("Pruning old header", {"module", config_.module_name, "hash", pruning->to_hex()});
        storage_->imported_headers.erase(state, *pruning);
    }
}

HeaderChainResult HeaderChainLedger::set_operating_mode(const Origin& origin, BasicOperatingMode mode) {
    return transactional<HeaderChainResult>(store_, [&](state::KeyValueStore& state) {
        if (!owned_.is_owner_or_root(state, origin)) {
            return HeaderChainResult::kBadOrigin;
        }
        storage_->operating_mode.put(state, mode);
        TRESTLE_INFO_M("Operating mode changed", {"module", config_.module_name,
                                                  "mode", std::string{magic_enum::enum_name(mode)}});
        return HeaderChainResult::kOk;
    });
}

HeaderChainResult HeaderChainLedger::set_owner(const Origin& origin, const std::optional<AccountId>& new_owner) {
    return transactional<HeaderChainResult>(store_, [&](state::KeyValueStore& state) {
        if (!owned_.is_owner_or_root(state, origin)) {
            return HeaderChainResult::kBadOrigin;
        }
        owned_.put_owner(state, new_owner);
        return HeaderChainResult::kOk;
    });
}

HeaderChainResult HeaderChainLedger::check_obsolete(BlockNum number, std::optional<uint64_t> current_set_id) const {
    const auto best{storage_->best_finalized.get(store_)};
    if (!best) {
        return HeaderChainResult::kNotInitialized;
    }
    if (number <= best->number) {
        return HeaderChainResult::kOldHeader;
    }
    if (current_set_id) {
        const auto set{storage_->current_authority_set.get(store_)};
        if (!set || set->set_id != *current_set_id) {
            return HeaderChainResult::kInvalidAuthoritySetId;
        }
    }
    return HeaderChainResult::kOk;
}

bool HeaderChainLedger::is_initialized() const {
    return storage_->best_finalized.exists(store_);
}

std::optional<HeaderId> HeaderChainLedger::best_finalized() const {
    return storage_->best_finalized.get(store_);
}

std::optional<StoredHeaderData> HeaderChainLedger::finalized_header(const Hash& header_hash) const {
    return storage_->imported_headers.get(store_, header_hash);
}

std::optional<Hash> HeaderChainLedger::initial_hash() const {
    return storage_->initial_hash.get(store_);
}

std::optional<AuthoritySet> HeaderChainLedger::current_authority_set() const {
    return storage_->current_authority_set.get(store_);
}

BasicOperatingMode HeaderChainLedger::operating_mode() const {
    return storage_->operating_mode.get_or_default(store_);
}

}  // namespace trestle::ledger

namespace trestle::codec {

void encode(Bytes& to, const ledger::InitializationData& data) {
    encode(to, data.header);
    encode(to, data.authority_set);
    encode(to, data.operating_mode);
}

DecodingResult decode(ByteView& from, ledger::InitializationData& to, Leftover mode) noexcept {
    return decode(from, mode, to.header, to.authority_set, to.operating_mode);
}

}  // namespace trestle::codec
