#include "subset.hpp"
#include <algorithm>

namespace
{
    inline void append_range(std::vector<Entry>& out, const Collection& c, std::size_t from, std::size_t to)
    {
        out.insert(out.end(), c.begin() + std::ptrdiff_t(from), c.begin() + std::ptrdiff_t(to));
    }
} // namespace

Window make_wrap_window(const Collection& collection, std::size_t W)
{
    Window w;
    w.kind = WindowKind::Wrap;
    const std::size_t n = collection.size();

    if (n <= W)
    {
        w.branch = WindowBranch::Whole;
        w.entries = collection;
        return w;
    }

    const std::size_t head = W / 2;
    const std::size_t tail = W - head;
    w.branch = WindowBranch::Halves;
    w.entries.reserve(W);
    append_range(w.entries, collection, 0, head);
    append_range(w.entries, collection, n - tail, n);
    return w;
}

Window make_winner_window(const Collection& collection, std::size_t winnerIndex, std::size_t W)
{
    Window w;
    w.kind = WindowKind::Winner;
    const std::size_t n = collection.size();
    if (winnerIndex >= n)
        return make_wrap_window(collection, W);

    if (n <= W)
    {
        w.branch = WindowBranch::Whole;
        w.entries = collection;
        w.winnerOffset = winnerIndex;
        return w;
    }

    const std::size_t half = W / 2;
    w.entries.reserve(W);
    w.winnerOffset = half;

    if (winnerIndex < half)
    {
        // start = winnerIndex - half < 0
        const std::size_t back = half - winnerIndex;
        w.branch = WindowBranch::NegativeStart;
        append_range(w.entries, collection, n - back, n);
        append_range(w.entries, collection, 0, W - back);
    }
    else if (winnerIndex - half + W > n)
    {
        const std::size_t start = winnerIndex - half;
        w.branch = WindowBranch::Overflow;
        append_range(w.entries, collection, start, n);
        append_range(w.entries, collection, 0, W - (n - start));
    }
    else
    {
        const std::size_t start = winnerIndex - half;
        w.branch = WindowBranch::Contiguous;
        append_range(w.entries, collection, start, start + W);
    }
    return w;
}

Window make_winner_window(const Collection& collection, std::string_view winnerIdentity, std::size_t W, const IdentityNormalizer& normalize)
{
    if (auto idx = find_winner_index(collection, winnerIdentity, normalize))
        return make_winner_window(collection, *idx, W);
    return make_wrap_window(collection, W);
}

std::optional<std::size_t> find_winner_index(const Collection& collection, std::string_view winnerIdentity, const IdentityNormalizer& normalize)
{
    const std::string target = normalize ? normalize(winnerIdentity) : std::string(winnerIdentity);
    std::optional<std::size_t> found;
    for (std::size_t i = 0; i < collection.size(); ++i)
    {
        const std::string id = normalize ? normalize(collection[i].identity) : collection[i].identity;
        if (id != target)
            continue;
        if (found)
            return std::nullopt; // ambiguous
        found = i;
    }
    return found;
}
