#pragma once
#include <string>
#include <cstdint>
#include <cstddef>
#include <vector>
#include <memory>
#include <optional>
#include <limits>

#include "easing.hpp"

// =============== Entry ===============
// one participant / ticket, supplied by the storage side
struct Entry
{
    std::string identity;       // ticket number, raw
    std::string displayName;
    double      sortKey = 0.0;
};

// full sorted snapshot for one drawing
using Collection = std::vector<Entry>;
// reference identity of the snapshot is what stale detection compares
using CollectionRef = std::shared_ptr<const Collection>;

inline constexpr std::size_t kNoIndex = std::numeric_limits<std::size_t>::max();

// =============== Errors ===============
enum class SpinError : uint8_t
{
    None = 0,
    InvalidTarget,
    WinnerNotFound,
    AlreadySpinning,
    StaleCollection,
};

inline const char* to_string(SpinError e)
{
    switch (e)
    {
        case SpinError::None:            return "None";
        case SpinError::InvalidTarget:   return "InvalidTarget";
        case SpinError::WinnerNotFound:  return "WinnerNotFound";
        case SpinError::AlreadySpinning: return "AlreadySpinning";
        case SpinError::StaleCollection: return "StaleCollection";
    }
    return "Unknown";
}

// =============== Window ===============
enum class WindowKind : uint8_t { Wrap, Winner };

// which construction path produced a window
enum class WindowBranch : uint8_t
{
    Whole,          // collection fits, taken as is
    Halves,         // first floor(W/2) + last ceil(W/2)
    NegativeStart,  // winner near the front, wraps from the tail
    Overflow,       // winner near the back, wraps to the head
    Contiguous,     // plain slice
};

inline const char* to_string(WindowBranch b)
{
    switch (b)
    {
        case WindowBranch::Whole:         return "whole";
        case WindowBranch::Halves:        return "halves";
        case WindowBranch::NegativeStart: return "negative-start";
        case WindowBranch::Overflow:      return "overflow";
        case WindowBranch::Contiguous:    return "contiguous";
    }
    return "?";
}

struct Window
{
    WindowKind   kind = WindowKind::Wrap;
    WindowBranch branch = WindowBranch::Whole;
    std::vector<Entry> entries;
    // winner slot, kNoIndex for wrap windows
    std::size_t  winnerOffset = kNoIndex;

    std::size_t size() const { return entries.size(); }
    bool empty() const { return entries.empty(); }
};

// =============== Plan ===============
// Built once per spin. Positions are in pixels (item index × itemHeight).
struct SpinPlan
{
    double      totalDistance = 0.0;
    double      durationMs = 0.0;
    EaseProfile profile = EaseProfile::Medium;
    EasingFn    easing = nullptr;
    double      startPosition = 0.0;

    // inputs kept for landing checks / debug output
    int         rotations = 0;
    std::size_t targetIndex = 0;
    std::size_t totalItems = 0;
    double      itemHeight = 0.0;

    double positionAt(double progress) const
    {
        const double e = easing ? easing(progress) : ease(profile, progress);
        return startPosition + totalDistance * e;
    }
    double finalPosition() const { return startPosition + totalDistance; }
};

// =============== Config ===============
struct SpinConfig
{
    EaseProfile profile = EaseProfile::Medium;
    double      minDurationSeconds = 3.0;
    std::size_t windowSize = 100;
    double      swapThreshold = 0.25;
    double      itemHeight = 80.0;
    // fixed loop count, 0 = draw from the controller's rng
    int         rotations = 0;
};

// =============== Session ===============
enum class SpinPhase : uint8_t { Idle, Spinning, Landed, Cancelled };

inline const char* to_string(SpinPhase p)
{
    switch (p)
    {
        case SpinPhase::Idle:      return "idle";
        case SpinPhase::Spinning:  return "spinning";
        case SpinPhase::Landed:    return "landed";
        case SpinPhase::Cancelled: return "cancelled";
    }
    return "?";
}

// Motion after the window swap: same curve, re-parameterized over [progress, 1].
struct SwapLeg
{
    double progress = 0.0;
    double eased = 0.0;
    double position = 0.0;
    double distance = 0.0;
};

// What happened at the swap instant, kept for diagnostics.
struct SwapRecord
{
    double      progress = 0.0;
    double      positionBefore = 0.0;
    double      positionAfter = 0.0;
    std::size_t oldCenterIndex = kNoIndex;
    std::size_t newCenterIndex = kNoIndex;
    std::string oldCenterIdentity;
    std::string newCenterIdentity;
    bool        exactMatch = false;
    bool        usedFallback = false;
};

struct SpinSession
{
    SpinPhase   phase = SpinPhase::Idle;
    double      currentPosition = 0.0;
    double      progress = 0.0;
    Window      activeWindow;
    bool        hasSwapped = false;
    SpinPlan    plan;
    SwapLeg     leg;
    SwapRecord  swap;
    SpinConfig  config;

    CollectionRef collection;
    std::string   targetIdentity;   // normalized
    std::size_t   winnerIndex = kNoIndex; // in the collection

    // set by the first advance() after start()
    bool        clockStarted = false;
    double      originMs = 0.0;

    SpinError   error = SpinError::None;
    std::optional<Entry> winner;
};

// =============== Render ===============
// Snapshot of one frame. activeWindow points into the SpinSession it was
// taken from: valid only until that session is next started, moved or
// destroyed. Re-read it every frame.
struct RenderState
{
    const Window* activeWindow = nullptr;
    double      position = 0.0;
    double      normalizedPosition = 0.0;
    std::size_t centerIndex = kNoIndex;
    double      progress = 0.0;
    SpinPhase   phase = SpinPhase::Idle;
    SpinError   error = SpinError::None;
};
