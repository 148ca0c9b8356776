/// @file src/core/events.cpp
/// @brief Event names and one-line rendering.

#include "mvault/events.hpp"
#include "mvault/format.hpp"

#include <fmt/core.h>

#include <iterator>

namespace mvault {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

[[nodiscard]] std::string render_fees(const fees::FeesBreakdown& f) {
    return fmt::format("raw={} shares={} net={} delta={} entry={} exit={} protocol={} "
                       "wallet={} fraction={}",
                       f.raw_assets, f.shares, f.assets_for_receiver, f.assets_delta,
                       f.entry_fee, f.exit_fee, f.protocol_fee,
                       f.atom_wallet_fee, f.atom_deposit_fraction);
}

} // anonymous namespace

std::string_view event_name(const Event& event) noexcept {
    static constexpr std::string_view NAMES[] = {
        "AtomCreated",
        "TripleCreated",
        "Deposited",
        "Redeemed",
        "SharePriceChanged",
        "ProtocolFeeAccrued",
        "ProtocolFeeTransferred",
        "AtomWalletDepositFeeCollected",
        "AtomWalletDepositFeesClaimed",
        "ApprovalTypeUpdated",
        "UtilizationUpdated",
        "PausedChanged",
        "ConfigSynced",
    };
    static_assert(std::size(NAMES) == std::variant_size_v<Event>);
    if (event.valueless_by_exception()) {
        return "Invalid";
    }
    return NAMES[event.index()];
}

std::string to_string(const Event& event) {
    const std::string body = std::visit(Overloaded{
        [](const AtomCreated& e) {
            return fmt::format("creator={} term={} bytes={} wallet={}",
                               e.creator, e.term, e.data.size(), e.atom_wallet);
        },
        [](const TripleCreated& e) {
            return fmt::format("creator={} term={} s={} p={} o={} counter={}",
                               e.creator, e.term, e.subject, e.predicate,
                               e.object, e.counter);
        },
        [](const Deposited& e) {
            return fmt::format("sender={} receiver={} term={} curve={} type={} "
                               "before=({}, {}) after=({}, {}) {}",
                               e.sender, e.receiver, e.term, e.curve, e.vault_type,
                               e.before.total_assets, e.before.total_shares,
                               e.after.total_assets, e.after.total_shares,
                               render_fees(e.fees));
        },
        [](const Redeemed& e) {
            return fmt::format("sender={} receiver={} term={} curve={} type={} "
                               "before=({}, {}) after=({}, {}) {}",
                               e.sender, e.receiver, e.term, e.curve, e.vault_type,
                               e.before.total_assets, e.before.total_shares,
                               e.after.total_assets, e.after.total_shares,
                               render_fees(e.fees));
        },
        [](const SharePriceChanged& e) {
            return fmt::format("term={} curve={} type={} price={} assets={} shares={}",
                               e.term, e.curve, e.vault_type, e.share_price,
                               e.total_assets, e.total_shares);
        },
        [](const ProtocolFeeAccrued& e) {
            return fmt::format("epoch={} sender={} amount={}", e.epoch, e.sender, e.amount);
        },
        [](const ProtocolFeeTransferred& e) {
            return fmt::format("epoch={} destination={} amount={}",
                               e.epoch, e.destination, e.amount);
        },
        [](const AtomWalletDepositFeeCollected& e) {
            return fmt::format("term={} sender={} wallet={} amount={}",
                               e.term, e.sender, e.atom_wallet, e.amount);
        },
        [](const AtomWalletDepositFeesClaimed& e) {
            return fmt::format("term={} wallet={} amount={}",
                               e.term, e.atom_wallet, e.amount);
        },
        [](const ApprovalTypeUpdated& e) {
            return fmt::format("owner={} delegate={} approval={}",
                               e.owner, e.delegate, e.approval);
        },
        [](const UtilizationUpdated& e) {
            return fmt::format("account={} epoch={} delta={} total={} user={}",
                               e.account, e.epoch, e.delta,
                               e.total_utilization, e.user_utilization);
        },
        [](const PausedChanged& e) {
            return fmt::format("paused={} by={}", e.paused, e.by);
        },
        [](const ConfigSynced& e) {
            return fmt::format("version {} -> {}", e.old_version, e.new_version);
        },
    }, event);

    return fmt::format("{} {}", event_name(event), body);
}

} // namespace mvault
