/// @file src/identity/identity.cpp
/// @brief Term id derivation.

#include "mvault/identity.hpp"
#include "mvault/constants.hpp"

#include "digest.hpp"

namespace mvault::identity {

namespace {

[[nodiscard]] std::span<const std::uint8_t> view(const TermId& id) noexcept {
    return {id.bytes.data(), id.bytes.size()};
}

[[nodiscard]] TermId to_term(const Digest& digest) noexcept {
    TermId id;
    id.bytes = digest;
    return id;
}

} // anonymous namespace

TermId Identity::atom_id(std::span<const std::uint8_t> data) {
    return to_term(sha256({data}));
}

TermId Identity::atom_id(std::string_view data) {
    const Bytes bytes(data.begin(), data.end());
    return atom_id(std::span<const std::uint8_t>(bytes));
}

TermId Identity::triple_id(const TermId& subject,
                           const TermId& predicate,
                           const TermId& object) {
    return to_term(sha256({view(subject), view(predicate), view(object)}));
}

TermId Identity::counter_id(const TermId& triple) {
    return to_term(sha256({view(counter_salt()), view(triple)}));
}

const TermId& Identity::counter_salt() {
    static const TermId salt = atom_id(constants::COUNTER_SALT_SEED);
    return salt;
}

} // namespace mvault::identity
