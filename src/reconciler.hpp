#pragma once
#include <vector>
#include <cstddef>
#include "model.hpp"

// Non-negative position modulo (windowLength * itemHeight).
double normalize_position(double position, std::size_t windowLength, double itemHeight);

// Slot rendered at centre: floor(normalized / itemHeight).
std::size_t center_index(double position, std::size_t windowLength, double itemHeight);

struct ReconcileResult
{
    double      position = 0.0;           // in the new window's frame
    double      remainingDistance = 0.0;  // to the target slot, >= 0
    std::size_t oldCenterIndex = kNoIndex;
    std::size_t newCenterIndex = kNoIndex;
    bool        exactMatch = false;       // centred identity present in the new window
    bool        usedFallback = false;     // modulo re-normalization was needed
};

// Re-express currentPosition when oldWindow is replaced by newWindow so that the
// centred entry stays put. The position is shifted by the placement difference of
// that entry, then the distance left to targetOffset is measured in the new
// window's frame and rounded to the whole number of loops closest to remainingHint.
ReconcileResult reconcile_swap(const Window& oldWindow, const Window& newWindow, double currentPosition, std::size_t targetOffset, double remainingHint, double itemHeight);

struct VisibleSlot
{
    std::size_t  windowIndex = 0;
    const Entry* entry = nullptr;
    double       offsetPx = 0.0;   // from the centre line, positive = below
    int          distance = 0;     // slots away from the centre
};

// The 2*radius+1 slots around the centre, sampled modulo the window length so a
// window shorter than the reel repeats itself.
std::vector<VisibleSlot> visible_slots(const Window& window, double position, double itemHeight, int radius);
