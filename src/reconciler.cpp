#include "reconciler.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

double normalize_position(double position, std::size_t windowLength, double itemHeight)
{
    if (windowLength == 0 || !(itemHeight > 0.0)) return 0.0;
    const double span = double(windowLength) * itemHeight;
    double n = std::fmod(position, span);
    if (n < 0.0) n += span;
    // fmod can return span itself after the += on tiny negatives
    if (n >= span) n = 0.0;
    return n;
}

std::size_t center_index(double position, std::size_t windowLength, double itemHeight)
{
    if (windowLength == 0 || !(itemHeight > 0.0)) return kNoIndex;
    const double n = normalize_position(position, windowLength, itemHeight);
    return std::min(windowLength - 1, std::size_t(std::floor(n / itemHeight)));
}

namespace
{
    std::size_t locate_in(const Window& w, const Entry& e, bool& exact)
    {
        for (std::size_t i = 0; i < w.size(); ++i)
        {
            if (w.entries[i].identity == e.identity)
            {
                exact = true;
                return i;
            }
        }
        // nearest sort neighbour, first one on ties
        exact = false;
        std::size_t best = 0;
        double bestD = std::abs(w.entries[0].sortKey - e.sortKey);
        for (std::size_t i = 1; i < w.size(); ++i)
        {
            const double d = std::abs(w.entries[i].sortKey - e.sortKey);
            if (d < bestD) { bestD = d; best = i; }
        }
        return best;
    }

    double remaining_to(double position, std::size_t targetOffset, std::size_t windowLength, double itemHeight, double remainingHint)
    {
        const double span = double(windowLength) * itemHeight;
        const double cur = normalize_position(position, windowLength, itemHeight);
        const double tgt = normalize_position(double(targetOffset) * itemHeight, windowLength, itemHeight);
        double delta = tgt - cur;
        if (delta < 0.0) delta += span;
        double loops = std::round((remainingHint - delta) / span);
        if (!(loops > 0.0)) loops = 0.0;
        return delta + loops * span;
    }
} // namespace

ReconcileResult reconcile_swap(const Window& oldWindow, const Window& newWindow, double currentPosition, std::size_t targetOffset, double remainingHint, double itemHeight)
{
    ReconcileResult r;
    r.position = currentPosition;
    if (newWindow.empty() || !(itemHeight > 0.0))
    {
        std::cerr << "reconcile: empty target window, keeping position " << currentPosition << std::endl;
        r.usedFallback = true;
        return r;
    }

    const std::size_t newLen = newWindow.size();
    const double frac = std::fmod(normalize_position(currentPosition, std::max<std::size_t>(1, oldWindow.size()), itemHeight), itemHeight);

    if (!oldWindow.empty())
    {
        r.oldCenterIndex = center_index(currentPosition, oldWindow.size(), itemHeight);
        const Entry& centred = oldWindow.entries[r.oldCenterIndex];
        r.newCenterIndex = locate_in(newWindow, centred, r.exactMatch);

        // shift by the placement difference; the origin of the frame is untouched
        r.position = currentPosition - (double(r.oldCenterIndex) - double(r.newCenterIndex)) * itemHeight;

        if (center_index(r.position, newLen, itemHeight) != r.newCenterIndex)
        {
            // only reachable when the window lengths differ
            std::cerr << "reconcile: shifted position lands on slot " << center_index(r.position, newLen, itemHeight)
                      << " instead of " << r.newCenterIndex << ", re-normalizing" << std::endl;
            r.usedFallback = true;
        }
    }
    else
    {
        r.usedFallback = true;
        r.newCenterIndex = 0;
    }

    if (r.usedFallback)
    {
        const double span = double(newLen) * itemHeight;
        r.position = std::floor(currentPosition / span) * span + double(r.newCenterIndex) * itemHeight + frac;
    }

    r.remainingDistance = remaining_to(r.position, targetOffset, newLen, itemHeight, remainingHint);
    return r;
}

std::vector<VisibleSlot> visible_slots(const Window& window, double position, double itemHeight, int radius)
{
    std::vector<VisibleSlot> out;
    if (window.empty() || !(itemHeight > 0.0) || radius < 0)
        return out;

    const std::size_t len = window.size();
    const double norm = normalize_position(position, len, itemHeight);
    const std::size_t centre = center_index(position, len, itemHeight);
    const double frac = norm - double(centre) * itemHeight;

    out.reserve(std::size_t(2 * radius + 1));
    for (int d = -radius; d <= radius; ++d)
    {
        const long long raw = (long long)centre + d;
        const long long L = (long long)len;
        const std::size_t idx = std::size_t(((raw % L) + L) % L);
        VisibleSlot s;
        s.windowIndex = idx;
        s.entry = &window.entries[idx];
        s.distance = d;
        s.offsetPx = double(d) * itemHeight - frac;
        out.push_back(s);
    }
    return out;
}
