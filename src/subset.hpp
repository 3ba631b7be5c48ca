#pragma once
#include <optional>
#include <string_view>
#include <cstddef>
#include "model.hpp"
#include "identity.hpp"

// Windows are bounded views over a sorted collection. Both constructors return
// exactly min(W, collection.size()) entries. With more than W entries the winner
// always sits at offset W/2 (floor) of a winner window.

// Pre-target window: first floor(W/2) + last ceil(W/2), or the whole collection.
Window make_wrap_window(const Collection& collection, std::size_t W);

// Window around collection[winnerIndex], wrapping at either end.
// winnerIndex must be < collection.size().
Window make_winner_window(const Collection& collection, std::size_t winnerIndex, std::size_t W);

// Lookup by normalized identity, falls back to the wrap window when the
// identity has no unique match.
Window make_winner_window(const Collection& collection, std::string_view winnerIdentity, std::size_t W, const IdentityNormalizer& normalize);

// Index of the single entry whose normalized identity equals the normalized
// target. Zero or several matches -> nullopt.
std::optional<std::size_t> find_winner_index(const Collection& collection, std::string_view winnerIdentity, const IdentityNormalizer& normalize);

// Offset of the winner inside a winner window built for a collection of this size.
inline std::size_t winner_offset_for(std::size_t collectionSize, std::size_t winnerIndex, std::size_t W)
{
    return collectionSize <= W ? winnerIndex : W / 2;
}
