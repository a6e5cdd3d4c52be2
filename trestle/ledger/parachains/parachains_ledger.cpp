// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "parachains_ledger.hpp"

#include <algorithm>

#include <magic_enum.hpp>

#include <trestle/core/codec/encode.hpp>
#include <trestle/core/state/storage.hpp>
#include <trestle/infra/common/ensure.hpp>
#include <trestle/infra/common/log.hpp>
#include <trestle/ledger/common/transactional.hpp>

namespace trestle::ledger {

Bytes parachain_head_storage_key(std::string_view paras_module_name, ParaId para_id) {
    Bytes encoded_para_id;
    codec::encode(encoded_para_id, para_id);
    return state::storage_map_key(paras_module_name, "Heads", encoded_para_id);
}

struct ParachainsLedger::Storage {
    explicit Storage(const std::string& module)
        : paras_info{module, "ParasInfo"},
          imported_para_heads{module, "ImportedParaHeads"},
          imported_para_hashes{module, "ImportedParaHashes"},
          operating_mode{module, "PalletOperatingMode"} {}

    state::StorageMap<ParaId, ParaInfo> paras_info;
    state::StorageDoubleMap<ParaId, Hash, ParaStoredHeaderData> imported_para_heads;
    state::StorageDoubleMap<ParaId, uint32_t, Hash> imported_para_hashes;
    state::StorageValue<BasicOperatingMode> operating_mode;
};

ParachainsLedger::ParachainsLedger(state::KeyValueStore& store, ParachainsConfig config,
                                   const HeaderChain& relay_chain)
    : store_{store},
      config_{std::move(config)},
      relay_chain_{relay_chain},
      owned_{config_.module_name},
      storage_{std::make_unique<Storage>(config_.module_name)} {
    ensure(config_.heads_to_keep > 0, "heads_to_keep must be positive");
}

ParachainsLedger::~ParachainsLedger() = default;

ParachainsResult ParachainsLedger::submit_parachain_heads(const Origin& origin, const HeaderId& at_relay_block,
                                                          const std::vector<ParaHeadUpdate>& parachains,
                                                          const ParaHeadsProof& proof) {
    const auto result{transactional<ParachainsResult>(store_, [&](state::KeyValueStore& state) {
        if (storage_->operating_mode.get_or_default(state) == BasicOperatingMode::kHalted) {
            return ParachainsResult::kHalted;
        }
        if (origin.is_root()) {
            return ParachainsResult::kBadOrigin;
        }
        if (!relay_chain_.best_finalized()) {
            return ParachainsResult::kNotInitialized;
        }
        const auto relay_block{relay_chain_.finalized_header(at_relay_block.hash)};
        if (!relay_block) {
            return ParachainsResult::kUnknownRelayChainBlock;
        }
        if (relay_block->number != at_relay_block.number) {
            return ParachainsResult::kInvalidRelayChainBlockNumber;
        }

        auto checker{relay_chain_.parse_finalized_storage_proof(at_relay_block.hash, proof.storage_proof)};
        if (!checker) {
            return ParachainsResult::kInvalidStorageProof;
        }

        for (const auto& [para_id, head_hash] : parachains) {
            const auto read{checker->read_value(parachain_head_storage_key(config_.paras_module_name, para_id))};
            if (!read || !*read) {
                TRESTLE_TRACE_M("Parachain head is missing in proof", {"para_id", std::to_string(para_id)});
                continue;
            }
            ByteView encoded{**read};
            ParaHead head;
            if (!codec::decode(encoded, head)) {
                TRESTLE_TRACE_M("Parachain head entry is malformed", {"para_id", std::to_string(para_id)});
                continue;
            }

            const Hash actual_hash{Hash::of(head)};
            if (actual_hash != head_hash) {
                TRESTLE_TRACE_M("Submitter specified invalid parachain head hash",
                                {"para_id", std::to_string(para_id), "hash", head_hash.to_hex(),
                                 "actual", actual_hash.to_hex()});
                continue;
            }
            if (!is_tracked(para_id)) {
                TRESTLE_TRACE_M("Parachain is not tracked", {"para_id", std::to_string(para_id)});
                continue;
            }
            if (head.size() > config_.max_para_head_size) {
                TRESTLE_TRACE_M("Parachain head is too large",
                                {"para_id", std::to_string(para_id), "size", std::to_string(head.size())});
                continue;
            }
            Header para_header;
            ByteView head_view{head};
            if (!codec::decode(head_view, para_header)) {
                TRESTLE_TRACE_M("Parachain head cannot be decoded", {"para_id", std::to_string(para_id)});
                continue;
            }

            const auto stored{storage_->paras_info.get(state, para_id)};
            if (stored && (stored->best_head_hash.at_relay_block_number >= at_relay_block.number ||
                           stored->best_head_hash.head_hash == head_hash)) {
                TRESTLE_TRACE_M("Rejected obsolete parachain head",
                                {"para_id", std::to_string(para_id), "hash", head_hash.to_hex()});
                continue;
            }
            update_parachain_head(state, para_id, stored, at_relay_block.number,
                                  ParaStoredHeaderData{para_header.number, para_header.state_root}, head_hash);
        }

        // Heads may have been accepted, still the proof must not carry dead weight
        if (!checker->ensure_no_unused_nodes()) {
            return ParachainsResult::kInvalidStorageProof;
        }
        return ParachainsResult::kOk;
    })};
    if (result != ParachainsResult::kOk) {
        TRESTLE_DEBUG_M("Rejected parachain heads", {"relay_block", at_relay_block.to_string(),
                                                     "result", std::string{magic_enum::enum_name(result)}});
    }
    return result;
}

void ParachainsLedger::update_parachain_head(state::KeyValueStore& state, ParaId para_id,
                                             const std::optional<ParaInfo>& stored, BlockNum at_relay_block_number,
                                             const ParaStoredHeaderData& data, const Hash& head_hash) const {
    const uint32_t position{stored ? stored->next_imported_hash_position : 0};
    const auto hash_to_prune{storage_->imported_para_hashes.get(state, para_id, position)};

    storage_->paras_info.put(state, para_id,
                             ParaInfo{BestParaHeadHash{at_relay_block_number, head_hash},
                                      (position + 1) % config_.heads_to_keep});
    storage_->imported_para_hashes.put(state, para_id, position, head_hash);
    storage_->imported_para_heads.put(state, para_id, head_hash, data);
    TRESTLE_DEBUG_M("Updated parachain head", {"para_id", std::to_string(para_id),
                                               "number", std::to_string(data.number), "hash", head_hash.to_hex()});

    if (hash_to_prune) {
        TRESTLE_TRACE_M("Pruning old parachain head", {"para_id", std::to_string(para_id),
                                                       "hash", hash_to_prune->to_hex()});
        storage_->imported_para_heads.erase(state, para_id, *hash_to_prune);
    }
}

bool ParachainsLedger::is_tracked(ParaId para_id) const {
    return config_.tracked_parachains.empty() ||
           std::ranges::find(config_.tracked_parachains, para_id) != config_.tracked_parachains.end();
}

ParachainsResult ParachainsLedger::set_operating_mode(const Origin& origin, BasicOperatingMode mode) {
    return transactional<ParachainsResult>(store_, [&](state::KeyValueStore& state) {
        if (!owned_.is_owner_or_root(state, origin)) {
            return ParachainsResult::kBadOrigin;
        }
        storage_->operating_mode.put(state, mode);
        return ParachainsResult::kOk;
    });
}

ParachainsResult ParachainsLedger::set_owner(const Origin& origin, const std::optional<AccountId>& new_owner) {
    return transactional<ParachainsResult>(store_, [&](state::KeyValueStore& state) {
        if (!owned_.is_owner_or_root(state, origin)) {
            return ParachainsResult::kBadOrigin;
        }
        owned_.put_owner(state, new_owner);
        return ParachainsResult::kOk;
    });
}

bool ParachainsLedger::is_obsolete(ParaId para_id, BlockNum at_relay_block_number, const Hash& head_hash) const {
    const auto stored{storage_->paras_info.get(store_, para_id)};
    return stored && (stored->best_head_hash.at_relay_block_number >= at_relay_block_number ||
                      stored->best_head_hash.head_hash == head_hash);
}

std::optional<ParaInfo> ParachainsLedger::best_parachain_info(ParaId para_id) const {
    return storage_->paras_info.get(store_, para_id);
}

std::optional<ParaStoredHeaderData> ParachainsLedger::parachain_head(ParaId para_id, const Hash& head_hash) const {
    return storage_->imported_para_heads.get(store_, para_id, head_hash);
}

std::optional<HeaderId> ParachainsLedger::best_parachain_head_id(ParaId para_id) const {
    const auto info{best_parachain_info(para_id)};
    if (!info) {
        return std::nullopt;
    }
    const auto head{parachain_head(para_id, info->best_head_hash.head_hash)};
    if (!head) {
        return std::nullopt;
    }
    return HeaderId{head->number, info->best_head_hash.head_hash};
}

BasicOperatingMode ParachainsLedger::operating_mode() const {
    return storage_->operating_mode.get_or_default(store_);
}

std::optional<StoredHeaderData> ParachainsLedger::ParachainHeaderChain::finalized_header(
    const Hash& header_hash) const {
    const auto head{ledger_.parachain_head(para_id_, header_hash)};
    if (!head) {
        return std::nullopt;
    }
    return StoredHeaderData{head->number, head->state_root};
}

}  // namespace trestle::ledger
