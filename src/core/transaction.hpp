#pragma once

/// @file src/core/transaction.hpp
/// @brief Staged call state and the all-or-nothing call wrapper.
///
/// A call runs against a copy of the committed state. Asset pulls,
/// custody pushes and sink notifications are recorded, not executed, until
/// the body returns. `commit` then:
///   1. pulls the aggregate amount from the payer (InsufficientFunds if refused)
///   2. moves the staged state and events into place
///   3. executes the recorded outbound calls, still under the guard
///   4. publishes the events to subscribers

#include "mvault/multivault.hpp"
#include "mvault/error.hpp"

#include "log.hpp"
#include "reentrancy_guard.hpp"

#include <fmt/core.h>

#include <stdexcept>
#include <type_traits>
#include <variant>
#include <vector>

namespace mvault::core {

/// Value leaving the ledger after commit.
struct Payout {
    Address to;
    Uint256 amount;
};

/// Sink bookkeeping preceding a protocol-fee transfer.
struct ClaimableNotice {
    Epoch   epoch = 0;
    Uint256 amount;
};

using Outbound = std::variant<Payout, ClaimableNotice>;

struct MultiVault::Transaction {
    Transaction(const State& committed, Epoch now) : staged(committed), epoch(now) {}

    State              staged;
    Epoch              epoch;
    std::vector<Event> events;
    Address            payer;
    Uint256            pull_amount;
    std::vector<Outbound> outbound;

    /// Add `amount` to the single aggregate pull from `from`.
    void charge(const Address& from, const Uint256& amount) {
        if (pull_amount != 0 && from != payer) {
            throw std::logic_error("Transaction::charge: one payer per call");
        }
        payer = from;
        pull_amount += amount;
    }

    void pay(const Address& to, const Uint256& amount) {
        if (amount != 0) {
            outbound.emplace_back(Payout{to, amount});
        }
    }

    void notify_claimable(Epoch settled, const Uint256& amount) {
        outbound.emplace_back(ClaimableNotice{settled, amount});
    }

    void emit(Event event) { events.push_back(std::move(event)); }

    /// Fee engine bound to the staged configuration.
    [[nodiscard]] fees::FeeEngine fee_engine(const curve::CurveRegistry& curves) const {
        return fees::FeeEngine(staged.config, curves);
    }
};

template <typename Body>
auto MultiVault::transact(std::string_view operation, Body&& body) {
    detail::ReentrancyGuard guard(entered_);
    const bool verbose = state_.config.verbose;

    try {
        Transaction tx(state_, sink_.current_epoch());
        if constexpr (std::is_void_v<std::invoke_result_t<Body&, Transaction&>>) {
            body(tx);
            commit(tx, operation);
        } else {
            auto result = body(tx);
            commit(tx, operation);
            return result;
        }
    } catch (const LedgerError& e) {
        detail::log_line(verbose, "{} rejected: {}", operation, e.what());
        throw;
    } catch (const std::overflow_error& e) {
        detail::log_line(verbose, "{} rejected: overflow: {}", operation, e.what());
        throw LedgerError(ErrorCode::ArithmeticOverflow,
                          fmt::format("{}: {}", operation, e.what()));
    } catch (const std::range_error& e) {
        detail::log_line(verbose, "{} rejected: range: {}", operation, e.what());
        throw LedgerError(ErrorCode::ArithmeticOverflow,
                          fmt::format("{}: {}", operation, e.what()));
    }
}

} // namespace mvault::core
