#pragma once
#include <cstdint>
#include <functional>
#include <random>
#include <string>
#include <string_view>

#include "model.hpp"
#include "identity.hpp"

/// @brief SpinController — drives SpinSession values through idle -> spinning -> landed/cancelled.
///
/// The controller keeps no per-spin state: everything a spin needs lives in the
/// SpinSession handed to start()/advance()/cancel(). It only owns the identity
/// normalizer, the rng that draws the loop count, and the landed callback.
/// Time comes from the caller's per-frame clock through advance(nowMs).
class SpinController
{
public:
    using OnLanded = std::function<void(const Entry&)>;

    explicit SpinController(std::uint32_t seed = std::random_device{}(), IdentityNormalizer normalize = default_normalizer());

    // Validate the target and arm the session. Nothing moves until the first advance().
    // AlreadySpinning / InvalidTarget / WinnerNotFound leave the session untouched.
    SpinError start(SpinSession& session, CollectionRef collection, std::string_view targetIdentity, const SpinConfig& config, std::string* outError = nullptr);

    // One frame. `collection` is the caller's current snapshot; a different
    // reference than the one given to start() cancels the spin (StaleCollection).
    RenderState advance(SpinSession& session, const CollectionRef& collection, double nowMs);

    void cancel(SpinSession& session);

    void onLanded(OnLanded cb) { _onLanded = std::move(cb); }
    void reseed(std::uint32_t seed) { _rng.seed(seed); }

    const IdentityNormalizer& normalizer() const { return _normalize; }

    static RenderState renderState(const SpinSession& session);

private:
    double positionAt(const SpinSession& session, double progress) const;
    void swapToWinnerWindow(SpinSession& session, double progress);
    void land(SpinSession& session);

private:
    std::mt19937       _rng;
    IdentityNormalizer _normalize;
    OnLanded           _onLanded;
};
