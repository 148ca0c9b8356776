/**
 * @file  prop_identity.cpp
 * @brief Property: term ids are deterministic, order-sensitive and hex round-trip
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_identity
 */

#include <rapidcheck.h>

#include "mvault/identity.hpp"

#include <cstdint>
#include <span>
#include <vector>

using namespace mvault;
using namespace mvault::identity;

static TermId id_of(const std::vector<std::uint8_t>& data) {
    return Identity::atom_id(std::span<const std::uint8_t>(data));
}

int main() {
    rc::check(
        "atom_id is deterministic and separates distinct payloads",
        [](const std::vector<std::uint8_t>& a, const std::vector<std::uint8_t>& b) {
            RC_ASSERT(id_of(a) == id_of(a));
            if (a != b) {
                RC_ASSERT(id_of(a) != id_of(b));
            }
        });

    rc::check(
        "triple_id depends on position",
        [](const std::vector<std::uint8_t>& s, const std::vector<std::uint8_t>& o) {
            RC_PRE(s != o);
            const TermId subject = id_of(s);
            const TermId object  = id_of(o);
            const TermId pred    = Identity::atom_id("predicate");
            RC_ASSERT(Identity::triple_id(subject, pred, object)
                      != Identity::triple_id(object, pred, subject));
        });

    rc::check(
        "counter_id differs from its triple and is stable",
        [](const std::vector<std::uint8_t>& data) {
            const TermId t = Identity::triple_id(id_of(data), id_of(data), id_of(data));
            RC_ASSERT(Identity::counter_id(t) != t);
            RC_ASSERT(Identity::counter_id(t) == Identity::counter_id(t));
        });

    rc::check(
        "to_hex / from_hex round-trip",
        [](const std::vector<std::uint8_t>& data) {
            const TermId id = id_of(data);
            const auto parsed = TermId::from_hex(id.to_hex());
            RC_ASSERT(parsed.has_value());
            RC_ASSERT(*parsed == id);
        });

    return 0;
}
