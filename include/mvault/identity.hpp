#pragma once

/// @file include/mvault/identity.hpp
/// @brief Deterministic term identifiers.
///
/// # Module: Identity
///
/// ## Responsibility
/// Derive the 32-byte identifiers that key every vault:
///
///     atom_id(data)          = H(data)
///     triple_id(s, p, o)     = H(s ‖ p ‖ o)
///     counter_id(triple)     = H(COUNTER_SALT ‖ triple)
///
/// where H is SHA-256 and COUNTER_SALT = H("COUNTER_SALT").
///
/// ## Guarantees
/// - Pure: identical input always yields the identical id
/// - `triple_id` is order-sensitive (swapping subject and object changes it)
/// - Counter ids are recognised by the ledger's reverse map, never by value
///
/// ## NOT Responsible For
/// - Deciding whether an id is registered (see multivault.hpp)

#include "mvault/types.hpp"

#include <span>

namespace mvault::identity {

/// Term id derivation. All methods are static; the class holds no state.
class Identity {
public:
    Identity() = delete;

    /// Id of an atom carrying `data`.
    [[nodiscard]] static TermId atom_id(std::span<const std::uint8_t> data);

    /// Convenience overload for textual atom payloads.
    [[nodiscard]] static TermId atom_id(std::string_view data);

    /// Id of the triple (subject, predicate, object), in that order.
    [[nodiscard]] static TermId triple_id(const TermId& subject,
                                          const TermId& predicate,
                                          const TermId& object);

    /// Id of the counter-triple mirroring `triple`.
    [[nodiscard]] static TermId counter_id(const TermId& triple);

    /// The 32-byte counter salt (H("COUNTER_SALT")).
    [[nodiscard]] static const TermId& counter_salt();
};

} // namespace mvault::identity
