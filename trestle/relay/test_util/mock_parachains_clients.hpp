// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <gmock/gmock.h>

#include <trestle/relay/parachains/parachains_clients.hpp>

namespace trestle::relay::test {

class MockParachainsSource : public ParachainsSource {  // NOLINT
  public:
    explicit MockParachainsSource(std::string name = "Relay") : name_{std::move(name)} {}

    const std::string& name() const override { return name_; }

    MOCK_METHOD((Task<AvailableHead>), parachain_head, (const HeaderId&, ParaId), (override));
    MOCK_METHOD((Task<ParaHeadProof>), prove_parachain_head, (const HeaderId&, ParaId), (override));

  private:
    std::string name_;
};

class MockParachainsTarget : public ParachainsTarget {  // NOLINT
  public:
    explicit MockParachainsTarget(std::string name = "Target") : name_{std::move(name)} {}

    const std::string& name() const override { return name_; }

    MOCK_METHOD((Task<std::optional<HeaderId>>), best_finalized_relay_block, (), (override));
    MOCK_METHOD((Task<std::optional<ParaHeadAtTarget>>), parachain_head, (ParaId), (override));
    MOCK_METHOD((Task<std::unique_ptr<TransactionTracker>>), submit_head_proof,
                (const HeaderId&, const ParaHeadUpdate&, const ParaHeadsProof&), (override));

  private:
    std::string name_;
};

}  // namespace trestle::relay::test
