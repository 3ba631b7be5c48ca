#include "SpinController.hpp"
#include "planner.hpp"
#include "subset.hpp"
#include "reconciler.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

SpinController::SpinController(std::uint32_t seed, IdentityNormalizer normalize)
    : _rng{ seed }
    , _normalize{ normalize ? std::move(normalize) : default_normalizer() }
    , _onLanded{}
{
}

SpinError SpinController::start(SpinSession& session, CollectionRef collection, std::string_view targetIdentity, const SpinConfig& config, std::string* outError)
{
    if (session.phase == SpinPhase::Spinning)
    {
        if (outError) *outError = "a spin is already running";
        return SpinError::AlreadySpinning;
    }
    if (config.windowSize < 1)
    {
        if (outError) *outError = "window size must be at least 1";
        return SpinError::InvalidTarget;
    }
    if (!std::isfinite(config.swapThreshold) || config.swapThreshold < 0.0 || config.swapThreshold > 1.0)
    {
        if (outError) *outError = "swap threshold must be within [0,1]";
        return SpinError::InvalidTarget;
    }
    if (!collection || collection->empty())
    {
        if (outError) *outError = "collection is empty";
        return SpinError::WinnerNotFound;
    }

    const auto winnerIndex = find_winner_index(*collection, targetIdentity, _normalize);
    if (!winnerIndex)
    {
        if (outError) *outError = "no unique entry for identity '" + std::string(targetIdentity) + "'";
        return SpinError::WinnerNotFound;
    }

    const Collection& c = *collection;
    const std::size_t W = config.windowSize;
    const std::size_t displayed = std::min(c.size(), W);
    const std::size_t targetOffset = winner_offset_for(c.size(), *winnerIndex, W);
    const int rotations = config.rotations > 0 ? config.rotations : draw_rotations(_rng);

    SpinPlan plan;
    if (auto err = plan_spin(targetOffset, displayed, config.minDurationSeconds, config.profile, rotations, config.itemHeight, plan, outError); err != SpinError::None)
        return err;

    SpinSession next;
    next.phase = SpinPhase::Spinning;
    next.config = config;
    next.plan = plan;
    next.collection = std::move(collection);
    next.targetIdentity = _normalize(targetIdentity);
    next.winnerIndex = *winnerIndex;
    // small pools land straight in the winner window, no swap needed
    next.activeWindow = c.size() <= W ? make_winner_window(c, *winnerIndex, W) : make_wrap_window(c, W);
    next.currentPosition = plan.startPosition;
    next.hasSwapped = false;
    session = std::move(next);
    return SpinError::None;
}

double SpinController::positionAt(const SpinSession& session, double progress) const
{
    if (!session.hasSwapped)
        return session.plan.positionAt(progress);

    const SwapLeg& leg = session.leg;
    const double span = 1.0 - leg.eased;
    if (span <= 1e-12)
        return leg.position + leg.distance;
    const double e = session.plan.easing ? session.plan.easing(progress) : ease(session.plan.profile, progress);
    return leg.position + leg.distance * std::clamp((e - leg.eased) / span, 0.0, 1.0);
}

void SpinController::swapToWinnerWindow(SpinSession& session, double progress)
{
    const Collection& c = *session.collection;
    const double h = session.config.itemHeight;
    const double before = session.plan.positionAt(progress);

    Window next = make_winner_window(c, session.winnerIndex, session.config.windowSize);
    const ReconcileResult r = reconcile_swap(session.activeWindow, next, before, next.winnerOffset, session.plan.finalPosition() - before, h);

    SwapRecord& rec = session.swap;
    rec = SwapRecord{};
    rec.progress = progress;
    rec.positionBefore = before;
    rec.positionAfter = r.position;
    rec.oldCenterIndex = r.oldCenterIndex;
    rec.newCenterIndex = r.newCenterIndex;
    if (r.oldCenterIndex < session.activeWindow.size())
        rec.oldCenterIdentity = session.activeWindow.entries[r.oldCenterIndex].identity;
    if (r.newCenterIndex < next.size())
        rec.newCenterIdentity = next.entries[r.newCenterIndex].identity;
    rec.exactMatch = r.exactMatch;
    rec.usedFallback = r.usedFallback;

    session.leg.progress = progress;
    session.leg.eased = session.plan.easing ? session.plan.easing(progress) : ease(session.plan.profile, progress);
    session.leg.position = r.position;
    session.leg.distance = r.remainingDistance;

    session.activeWindow = std::move(next);
    session.hasSwapped = true;
    session.currentPosition = r.position;
}

void SpinController::land(SpinSession& session)
{
    Window& w = session.activeWindow;
    const double h = session.config.itemHeight;
    if (w.winnerOffset >= w.size())
    {
        // never emit a slot that is not the winner's
        std::cerr << "spin: active window holds no winner slot at landing, cancelling" << std::endl;
        cancel(session);
        return;
    }
    const std::size_t offset = w.winnerOffset;
    const double span = double(w.size()) * h;

    // snap onto the exact slot, whatever drift the curve accumulated
    const double raw = positionAt(session, 1.0);
    const double target = double(offset) * h;
    const double snapped = std::max(0.0, std::round((raw - target) / span)) * span + target;

    const LandingCheck chk = check_landing(snapped, w.size(), h, offset);
    if (!chk.accurate)
        std::cerr << "spin: landing on slot " << chk.actualIndex << " instead of " << chk.expectedIndex << std::endl;

    session.currentPosition = snapped;
    session.progress = 1.0;
    session.phase = SpinPhase::Landed;
    session.winner = w.entries[offset];

    if (_normalize(session.winner->identity) != session.targetIdentity)
        std::cerr << "spin: landed entry '" << session.winner->identity << "' does not match target '" << session.targetIdentity << "'" << std::endl;

    if (_onLanded)
        _onLanded(*session.winner);
}

RenderState SpinController::advance(SpinSession& session, const CollectionRef& collection, double nowMs)
{
    if (session.phase != SpinPhase::Spinning)
        return renderState(session);

    if (collection.get() != session.collection.get())
    {
        std::cerr << "spin: collection snapshot replaced mid-spin, cancelling" << std::endl;
        cancel(session);
        session.error = SpinError::StaleCollection;
        return renderState(session);
    }

    if (!session.clockStarted)
    {
        session.clockStarted = true;
        session.originMs = nowMs;
    }

    const double elapsed = std::max(0.0, nowMs - session.originMs);
    double progress = session.plan.durationMs > 0.0 ? std::min(elapsed / session.plan.durationMs, 1.0) : 1.0;
    // a clock that steps backwards does not rewind the reel
    progress = std::max(progress, session.progress);

    const double threshold = std::min(session.config.swapThreshold, 1.0);
    if (!session.hasSwapped && progress >= threshold && session.collection->size() > session.config.windowSize)
        swapToWinnerWindow(session, progress);

    if (progress >= 1.0)
    {
        land(session);
        return renderState(session);
    }

    session.progress = progress;
    session.currentPosition = positionAt(session, progress);
    return renderState(session);
}

void SpinController::cancel(SpinSession& session)
{
    if (session.phase != SpinPhase::Spinning)
        return;
    session.phase = SpinPhase::Cancelled;
    session.plan = SpinPlan{};
    session.leg = SwapLeg{};
    session.currentPosition = 0.0;
    session.progress = 0.0;
    session.winner.reset();
}

RenderState SpinController::renderState(const SpinSession& session)
{
    RenderState rs;
    rs.activeWindow = &session.activeWindow;
    rs.position = session.currentPosition;
    rs.progress = session.progress;
    rs.phase = session.phase;
    rs.error = session.error;
    const std::size_t len = session.activeWindow.size();
    const double h = session.config.itemHeight;
    if (len > 0 && h > 0.0)
    {
        rs.normalizedPosition = normalize_position(session.currentPosition, len, h);
        rs.centerIndex = center_index(session.currentPosition, len, h);
    }
    return rs;
}
