// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <gmock/gmock.h>

#include <trestle/relay/finality/finality_clients.hpp>

namespace trestle::relay::test {

class MockTransactionTracker : public TransactionTracker {  // NOLINT
  public:
    MOCK_METHOD((Task<TrackedTransactionStatus>), wait, (), (override));
};

class MockFinalitySubscription : public FinalitySubscription {  // NOLINT
  public:
    MOCK_METHOD((Task<std::optional<Bytes>>), next, (), (override));
};

class MockFinalitySource : public FinalitySource {  // NOLINT
  public:
    explicit MockFinalitySource(std::string name = "Source") : name_{std::move(name)} {}

    const std::string& name() const override { return name_; }

    MOCK_METHOD((Task<BlockNum>), best_finalized_number, (), (override));
    MOCK_METHOD((Task<HeaderAndProof>), header_and_proof, (BlockNum), (override));
    MOCK_METHOD((Task<std::unique_ptr<FinalitySubscription>>), subscribe, (), (override));
    MOCK_METHOD((Task<void>), reconnect, (), (override));
    MOCK_METHOD((Task<ledger::InitializationData>), prepare_initialization_data, (), (override));

  private:
    std::string name_;
};

class MockFinalityTarget : public FinalityTarget {  // NOLINT
  public:
    explicit MockFinalityTarget(std::string name = "Target") : name_{std::move(name)} {}

    const std::string& name() const override { return name_; }

    MOCK_METHOD((Task<std::optional<HeaderId>>), best_finalized_source_id, (), (override));
    MOCK_METHOD((Task<std::unique_ptr<TransactionTracker>>), initialize, (const ledger::InitializationData&),
                (override));
    MOCK_METHOD((Task<std::unique_ptr<TransactionTracker>>), submit_finality_proof,
                (const Header&, const finality::Justification&), (override));

  private:
    std::string name_;
};

//! Tracker resolving immediately with status
inline std::unique_ptr<TransactionTracker> make_resolved_tracker(TrackedTransactionStatus status) {
    auto tracker{std::make_unique<MockTransactionTracker>()};
    EXPECT_CALL(*tracker, wait()).WillRepeatedly(testing::InvokeWithoutArgs([status]() -> Task<TrackedTransactionStatus> {
        co_return status;
    }));
    return tracker;
}

}  // namespace trestle::relay::test
