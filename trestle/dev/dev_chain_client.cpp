// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "dev_chain_client.hpp"

#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>

#include <trestle/infra/common/log.hpp>
#include <trestle/relay/common/error.hpp>

namespace trestle::dev {

namespace {

    class DevTransactionTracker : public relay::TransactionTracker {
      public:
        explicit DevTransactionTracker(TransactionWatch watch) : watch_{std::move(watch)} {}

        Task<relay::TrackedTransactionStatus> wait() override {
            const TransactionOutcome outcome{co_await watch_->receive()};
            if (outcome.status == TransactionOutcome::Status::kFinalized && outcome.block) {
                co_return relay::TrackedTransactionStatus::finalized_at(*outcome.block);
            }
            TRESTLE_DEBUG_M("Transaction lost", {"error", outcome.error});
            co_return relay::TrackedTransactionStatus::lost();
        }

      private:
        TransactionWatch watch_;
    };

    class DevFinalitySubscription : public relay::FinalitySubscription {
      public:
        explicit DevFinalitySubscription(JustificationSubscription subscription)
            : subscription_{std::move(subscription)} {}

        Task<std::optional<Bytes>> next() override {
            if (subscription_->dropped) {
                co_return std::nullopt;
            }
            try {
                co_return co_await subscription_->channel.receive();
            } catch (const boost::system::system_error&) {
                if (!subscription_->dropped) {
                    throw;
                }
            }
            co_return std::nullopt;
        }

      private:
        JustificationSubscription subscription_;
    };

}  // namespace

void DevChainClient::check_connection() {
    if (chain_.take_request_failure()) {
        throw boost::system::system_error{boost::asio::error::connection_reset,
                                          "connection to " + chain_.name() + " lost"};
    }
}

template <class Result>
Result DevChainClient::with_known_block(const std::function<Result()>& read) {
    check_connection();
    try {
        return read();
    } catch (const UnknownBlockError& ex) {
        throw relay::RelayError{relay::ErrorKind::kProofConstruction, ex.what()};
    }
}

Task<HeaderId> DevChainClient::best_finalized_header_id() {
    check_connection();
    co_return chain_.best_finalized_header_id();
}

Task<HeaderId> DevChainClient::best_header_id() {
    check_connection();
    co_return chain_.best_header_id();
}

Task<std::optional<Header>> DevChainClient::header_by_hash(const Hash& hash) {
    check_connection();
    co_return chain_.header_by_hash(hash);
}

Task<std::optional<Header>> DevChainClient::header_by_number(BlockNum number) {
    check_connection();
    co_return chain_.header_by_number(number);
}

Task<std::optional<finality::Justification>> DevChainClient::justification(BlockNum number) {
    check_connection();
    co_return chain_.justification(number);
}

Task<std::optional<Bytes>> DevChainClient::storage_value(const Hash& at, const Bytes& key) {
    co_return with_known_block<std::optional<Bytes>>([&] { return chain_.storage_value(at, key); });
}

Task<trie::StorageProof> DevChainClient::prove_storage(const Hash& at, const std::vector<Bytes>& keys) {
    co_return with_known_block<trie::StorageProof>([&] { return chain_.prove_storage(at, keys); });
}

Task<Bytes> DevChainClient::state_call(const Hash& at, std::string_view method, const Bytes& args) {
    co_return with_known_block<Bytes>([&] { return chain_.state_call(at, method, args); });
}

Task<std::unique_ptr<relay::FinalitySubscription>> DevChainClient::subscribe_finality_justifications() {
    check_connection();
    co_return std::make_unique<DevFinalitySubscription>(chain_.subscribe_justifications());
}

Task<std::unique_ptr<relay::TransactionTracker>> DevChainClient::submit_and_watch(
    const ledger::Transaction& transaction) {
    check_connection();
    Bytes encoded;
    codec::encode(encoded, transaction);
    co_return std::make_unique<DevTransactionTracker>(chain_.submit(encoded));
}

Task<void> DevChainClient::reconnect() {
    ++reconnections_;
    TRESTLE_INFO_M("Reconnected to chain", {"chain", chain_.name(), "reconnections", std::to_string(reconnections_)});
    co_return;
}

}  // namespace trestle::dev
