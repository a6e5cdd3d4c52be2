// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <gmock/gmock.h>

#include <trestle/relay/messages/messages_clients.hpp>

namespace trestle::relay::test {

class MockMessagesSource : public MessagesSource {  // NOLINT
  public:
    explicit MockMessagesSource(std::string name = "Source", LaneId lane = {0, 0, 0, 1})
        : name_{std::move(name)}, lane_{lane} {}

    const std::string& name() const override { return name_; }
    const LaneId& lane() const override { return lane_; }

    MOCK_METHOD((Task<HeaderId>), best_header_id, (), (override));
    MOCK_METHOD((Task<std::optional<HeaderId>>), best_finalized_target_header, (const HeaderId&), (override));
    MOCK_METHOD((Task<OutboundLaneData>), outbound_lane_data, (const HeaderId&), (override));
    MOCK_METHOD((Task<std::vector<Message>>), messages, (const HeaderId&, const NonceRange&), (override));
    MOCK_METHOD((Task<PreparedMessagesProof>), prove_messages, (const HeaderId&, const NonceRange&, bool),
                (override));
    MOCK_METHOD((Task<std::unique_ptr<TransactionTracker>>), submit_delivery_proof,
                (const MessagesDeliveryProof&, const UnrewardedRelayersState&), (override));
    MOCK_METHOD((Task<Balance>), relayer_reward, (const AccountId&), (override));

  private:
    std::string name_;
    LaneId lane_;
};

class MockMessagesTarget : public MessagesTarget {  // NOLINT
  public:
    explicit MockMessagesTarget(std::string name = "Target") : name_{std::move(name)} {}

    const std::string& name() const override { return name_; }

    MOCK_METHOD((Task<HeaderId>), best_header_id, (), (override));
    MOCK_METHOD((Task<std::optional<HeaderId>>), best_finalized_source_header, (const HeaderId&), (override));
    MOCK_METHOD((Task<InboundLaneData>), inbound_lane_data, (const HeaderId&), (override));
    MOCK_METHOD((Task<std::vector<Weight>>), dispatch_weights, (const std::vector<Message>&), (override));
    MOCK_METHOD((Task<MessagesDeliveryProof>), prove_delivery, (const HeaderId&), (override));
    MOCK_METHOD((Task<std::unique_ptr<TransactionTracker>>), submit_messages_proof,
                (const MessagesProof&, MessageNonce, const Weight&), (override));

  private:
    std::string name_;
};

}  // namespace trestle::relay::test
