// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "messages_ledger.hpp"

#include <algorithm>

#include <magic_enum.hpp>

#include <trestle/core/codec/encode.hpp>
#include <trestle/core/state/storage.hpp>
#include <trestle/infra/common/log.hpp>
#include <trestle/ledger/common/transactional.hpp>
#include <trestle/ledger/messages/outbound_lane.hpp>
#include <trestle/ledger/messages/proofs.hpp>

namespace trestle::ledger {

namespace {

    MessagesResult to_messages_result(ReceptionResult result) {
        switch (result) {
            case ReceptionResult::kOk:
                return MessagesResult::kOk;
            case ReceptionResult::kInvalidNonce:
                return MessagesResult::kInvalidNonce;
            case ReceptionResult::kTooManyUnrewardedRelayers:
                return MessagesResult::kTooManyUnrewardedRelayers;
            case ReceptionResult::kTooManyUnconfirmedMessages:
                return MessagesResult::kTooManyUnconfirmedMessages;
        }
        return MessagesResult::kInvalidNonce;
    }

    MessagesResult to_messages_result(ReceptionConfirmationError error) {
        switch (error) {
            case ReceptionConfirmationError::kFailedToConfirmFutureMessages:
                return MessagesResult::kFailedToConfirmFutureMessages;
            case ReceptionConfirmationError::kEmptyUnrewardedRelayerEntry:
                return MessagesResult::kEmptyUnrewardedRelayerEntry;
            case ReceptionConfirmationError::kNonConsecutiveUnrewardedRelayerEntries:
                return MessagesResult::kNonConsecutiveUnrewardedRelayerEntries;
            case ReceptionConfirmationError::kTryingToConfirmMoreMessagesThanExpected:
                return MessagesResult::kTryingToConfirmMoreMessagesThanExpected;
        }
        return MessagesResult::kFailedToConfirmFutureMessages;
    }

    std::string to_string(MessagesResult result) { return std::string{magic_enum::enum_name(result)}; }

}  // namespace

struct MessagesLedger::Storage {
    explicit Storage(const std::string& module)
        : outbound_lanes{module, "OutboundLanes"},
          outbound_messages{module, "OutboundMessages"},
          inbound_lanes{module, "InboundLanes"},
          operating_mode{module, "PalletOperatingMode"} {}

    state::StorageMap<LaneId, OutboundLaneData> outbound_lanes;
    state::StorageMap<MessageKey, Bytes> outbound_messages;
    state::StorageMap<LaneId, InboundLaneData> inbound_lanes;
    state::StorageValue<MessagesOperatingMode> operating_mode;
};

MessagesLedger::MessagesLedger(state::KeyValueStore& store, MessagesConfig config, const HeaderChain& bridged_chain,
                               MessageDispatch& dispatch, DeliveryConfirmationPayments& payments)
    : store_{store},
      config_{std::move(config)},
      bridged_chain_{bridged_chain},
      dispatch_{dispatch},
      payments_{payments},
      owned_{config_.module_name},
      storage_{std::make_unique<Storage>(config_.module_name)} {}

MessagesLedger::~MessagesLedger() = default;

tl::expected<SendMessageArtifacts, MessagesResult> MessagesLedger::send_message(const LaneId& lane,
                                                                                 ByteView payload) {
    SendMessageArtifacts artifacts;
    const auto result{transactional<MessagesResult>(store_, [&](state::KeyValueStore& state) {
        if (storage_->operating_mode.get_or_default(state) != MessagesOperatingMode::kNormal) {
            return MessagesResult::kNotOperatingNormally;
        }
        if (!is_active_lane(lane)) {
            return MessagesResult::kInactiveOutboundLane;
        }
        if (payload.size() > config_.max_message_size) {
            return MessagesResult::kMessageTooLarge;
        }

        auto data{storage_->outbound_lanes.get_or_default(state, lane)};
        artifacts.nonce = note_sent_message(data);
        artifacts.enqueued_messages = data.queued_messages().size();
        storage_->outbound_messages.put(state, MessageKey{lane, artifacts.nonce}, Bytes{payload});
        storage_->outbound_lanes.put(state, lane, data);
        return MessagesResult::kOk;
    })};
    if (result != MessagesResult::kOk) {
        TRESTLE_DEBUG_M("Rejected outbound message", {"lane", trestle::to_string(lane), "result", to_string(result)});
        return tl::unexpected{result};
    }
    TRESTLE_DEBUG_M("Accepted outbound message", {"lane", trestle::to_string(lane),
                                                  "nonce", std::to_string(artifacts.nonce),
                                                  "enqueued", std::to_string(artifacts.enqueued_messages)});
    return artifacts;
}

MessagesResult MessagesLedger::receive_messages_proof(const Origin& origin,
                                                      const AccountId& relayer_id_at_bridged_chain,
                                                      const MessagesProof& proof, MessageNonce messages_count,
                                                      const Weight& dispatch_weight) {
    const auto result{transactional<MessagesResult>(store_, [&](state::KeyValueStore& state) {
        if (storage_->operating_mode.get_or_default(state) == MessagesOperatingMode::kHalted) {
            return MessagesResult::kHalted;
        }
        if (origin.is_root()) {
            return MessagesResult::kBadOrigin;
        }
        return receive_messages(state, relayer_id_at_bridged_chain, proof, messages_count, dispatch_weight);
    })};
    if (result != MessagesResult::kOk) {
        TRESTLE_DEBUG_M("Rejected messages proof", {"lane", trestle::to_string(proof.lane),
                                                    "begin", std::to_string(proof.nonces_start),
                                                    "end", std::to_string(proof.nonces_end),
                                                    "result", to_string(result)});
    }
    return result;
}

MessagesResult MessagesLedger::receive_messages(state::KeyValueStore& state,
                                                const AccountId& relayer_id_at_bridged_chain,
                                                const MessagesProof& proof, MessageNonce messages_count,
                                                const Weight& dispatch_weight) {
    if (messages_count > config_.inbound_limits.max_unconfirmed_messages) {
        return MessagesResult::kTooManyMessagesInTheProof;
    }
    if (!dispatch_.is_active()) {
        return MessagesResult::kMessageDispatchInactive;
    }

    const auto proved{verify_messages_proof(bridged_chain_, config_.bridged_module_name, proof, messages_count)};
    if (!proved) {
        TRESTLE_TRACE_M("Invalid messages proof", {"error", std::string{magic_enum::enum_name(proved.error())}});
        return MessagesResult::kInvalidMessagesProof;
    }

    auto data{storage_->inbound_lanes.get_or_default(state, proof.lane)};
    if (proved->lane_state) {
        if (const auto confirmed{receive_state_update(data, *proved->lane_state)}) {
            TRESTLE_TRACE_M("Received outbound lane state", {"lane", trestle::to_string(proof.lane),
                                                             "confirmed", std::to_string(*confirmed)});
        }
    }

    // the whole batch is checked before the first message is dispatched
    Weight required_dispatch_weight;
    InboundLaneData checked{data};
    for (const auto& message : proved->messages) {
        const auto reception{check_message_reception(checked, config_.inbound_limits, relayer_id_at_bridged_chain,
                                                     message.key.nonce)};
        if (reception != ReceptionResult::kOk) {
            return to_messages_result(reception);
        }
        note_received_message(checked, relayer_id_at_bridged_chain, message.key.nonce, true);
        required_dispatch_weight = required_dispatch_weight.saturating_add(dispatch_.dispatch_weight(message));
    }
    if (required_dispatch_weight.any_gt(dispatch_weight)) {
        return MessagesResult::kInsufficientDispatchWeight;
    }

    for (const auto& message : proved->messages) {
        const bool dispatched{dispatch_.dispatch(state, message)};
        note_received_message(data, relayer_id_at_bridged_chain, message.key.nonce, dispatched);
        TRESTLE_TRACE_M("Received message", {"lane", trestle::to_string(proof.lane),
                                             "nonce", std::to_string(message.key.nonce),
                                             "dispatched", dispatched ? "true" : "false"});
    }

    storage_->inbound_lanes.put(state, proof.lane, data);
    TRESTLE_DEBUG_M("Received messages", {"lane", trestle::to_string(proof.lane),
                                          "count", std::to_string(proved->messages.size()),
                                          "last_delivered", std::to_string(data.last_delivered_nonce())});
    return MessagesResult::kOk;
}

MessagesResult MessagesLedger::receive_messages_delivery_proof(const Origin& origin,
                                                               const MessagesDeliveryProof& proof,
                                                               const UnrewardedRelayersState& relayers_state) {
    const auto result{transactional<MessagesResult>(store_, [&](state::KeyValueStore& state) {
        if (storage_->operating_mode.get_or_default(state) == MessagesOperatingMode::kHalted) {
            return MessagesResult::kHalted;
        }
        if (origin.is_root()) {
            return MessagesResult::kBadOrigin;
        }
        return confirm_messages(state, *origin.signer(), proof, relayers_state);
    })};
    if (result != MessagesResult::kOk) {
        TRESTLE_DEBUG_M("Rejected messages delivery proof", {"lane", trestle::to_string(proof.lane),
                                                             "result", to_string(result)});
    }
    return result;
}

MessagesResult MessagesLedger::confirm_messages(state::KeyValueStore& state, const AccountId& confirmation_relayer,
                                                const MessagesDeliveryProof& proof,
                                                const UnrewardedRelayersState& relayers_state) {
    const auto lane_data{verify_messages_delivery_proof(bridged_chain_, config_.bridged_module_name, proof)};
    if (!lane_data) {
        TRESTLE_TRACE_M("Invalid messages delivery proof",
                        {"error", std::string{magic_enum::enum_name(lane_data.error())}});
        return MessagesResult::kInvalidMessagesDeliveryProof;
    }
    if (UnrewardedRelayersState::from(*lane_data) != relayers_state) {
        return MessagesResult::kInvalidUnrewardedRelayersState;
    }

    auto data{storage_->outbound_lanes.get_or_default(state, proof.lane)};
    const auto confirmed{confirm_delivery(data, relayers_state.total_messages, lane_data->last_delivered_nonce(),
                                          lane_data->relayers)};
    if (!confirmed) {
        return to_messages_result(confirmed.error());
    }
    if (!*confirmed) {
        // every proven delivery is already known
        return MessagesResult::kOk;
    }

    storage_->outbound_lanes.put(state, proof.lane, data);
    const NonceRange received_range{(*confirmed)->begin, (*confirmed)->end};
    const MessageNonce rewarded_relayers{
        payments_.pay_reward(state, proof.lane, lane_data->relayers, confirmation_relayer, received_range)};
    TRESTLE_DEBUG_M("Confirmed messages delivery", {"lane", trestle::to_string(proof.lane),
                                                    "begin", std::to_string(received_range.begin),
                                                    "end", std::to_string(received_range.end),
                                                    "rewarded_relayers", std::to_string(rewarded_relayers)});
    return MessagesResult::kOk;
}

MessagesResult MessagesLedger::set_operating_mode(const Origin& origin, MessagesOperatingMode mode) {
    return transactional<MessagesResult>(store_, [&](state::KeyValueStore& state) {
        if (!owned_.is_owner_or_root(state, origin)) {
            return MessagesResult::kBadOrigin;
        }
        storage_->operating_mode.put(state, mode);
        TRESTLE_INFO_M("Messages operating mode changed", {"mode", std::string{magic_enum::enum_name(mode)}});
        return MessagesResult::kOk;
    });
}

MessagesResult MessagesLedger::set_owner(const Origin& origin, const std::optional<AccountId>& new_owner) {
    return transactional<MessagesResult>(store_, [&](state::KeyValueStore& state) {
        if (!owned_.is_owner_or_root(state, origin)) {
            return MessagesResult::kBadOrigin;
        }
        owned_.put_owner(state, new_owner);
        return MessagesResult::kOk;
    });
}

Weight MessagesLedger::on_idle(BlockNum block_number, const Weight& remaining_weight) {
    const auto& lanes{config_.active_lanes};
    const Weight minimal_weight{config_.db_read_weight.saturating_add(config_.db_write_weight.saturating_mul(2))};
    if (lanes.empty() || minimal_weight.any_gt(remaining_weight)) {
        return Weight::zero();
    }

    Weight unused_weight{remaining_weight};
    const size_t first_lane_index{static_cast<size_t>(block_number % lanes.size())};
    size_t lane_index{first_lane_index};
    do {
        const Weight spent{prune_messages(lanes[lane_index], unused_weight)};
        unused_weight = unused_weight.saturating_sub(spent);
        lane_index = (lane_index + 1) % lanes.size();
    } while (lane_index != first_lane_index && minimal_weight.all_lte(unused_weight));

    return remaining_weight.saturating_sub(unused_weight);
}

Weight MessagesLedger::prune_messages(const LaneId& lane, const Weight& remaining_weight) {
    Weight spent_weight{config_.db_read_weight};
    auto data{storage_->outbound_lanes.get_or_default(store_, lane)};

    // keep room for the final lane data write
    const Weight reserved{config_.db_write_weight};
    MessageNonce pruned_messages{0};
    while (data.oldest_unpruned_nonce <= data.latest_received_nonce &&
           spent_weight.saturating_add(config_.db_write_weight).saturating_add(reserved).all_lte(remaining_weight)) {
        storage_->outbound_messages.erase(store_, MessageKey{lane, data.oldest_unpruned_nonce});
        spent_weight = spent_weight.saturating_add(config_.db_write_weight);
        ++data.oldest_unpruned_nonce;
        ++pruned_messages;
    }

    if (pruned_messages > 0) {
        storage_->outbound_lanes.put(store_, lane, data);
        spent_weight = spent_weight.saturating_add(config_.db_write_weight);
        TRESTLE_TRACE_M("Pruned confirmed messages", {"lane", trestle::to_string(lane),
                                                      "count", std::to_string(pruned_messages),
                                                      "oldest_unpruned", std::to_string(data.oldest_unpruned_nonce)});
    }
    return spent_weight;
}

bool MessagesLedger::is_active_lane(const LaneId& lane) const {
    return std::ranges::find(config_.active_lanes, lane) != config_.active_lanes.end();
}

OutboundLaneData MessagesLedger::outbound_lane_data(const LaneId& lane) const {
    return storage_->outbound_lanes.get_or_default(store_, lane);
}

InboundLaneData MessagesLedger::inbound_lane_data(const LaneId& lane) const {
    return storage_->inbound_lanes.get_or_default(store_, lane);
}

std::optional<Bytes> MessagesLedger::outbound_message_payload(const LaneId& lane, MessageNonce nonce) const {
    return storage_->outbound_messages.get(store_, MessageKey{lane, nonce});
}

std::vector<Weight> MessagesLedger::inbound_message_details(const std::vector<Message>& messages) const {
    std::vector<Weight> weights;
    weights.reserve(messages.size());
    for (const auto& message : messages) {
        weights.push_back(dispatch_.dispatch_weight(message));
    }
    return weights;
}

MessagesOperatingMode MessagesLedger::operating_mode() const {
    return storage_->operating_mode.get_or_default(store_);
}

}  // namespace trestle::ledger
