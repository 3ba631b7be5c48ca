#include "SpinController.hpp"
#include "reconciler.hpp"
#include "subset.hpp"
#include "gtest/gtest.h"

#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace
{
    constexpr double kStepMs = 16.0;

    CollectionRef makeCollection(std::size_t n)
    {
        auto c = std::make_shared<Collection>();
        c->reserve(n);
        for (std::size_t i = 0; i < n; ++i)
            c->push_back(Entry{ std::to_string(i + 1), "Participant " + std::to_string(i + 1), double(i + 1) });
        return c;
    }

    SpinConfig makeConfig(EaseProfile profile = EaseProfile::Medium, double seconds = 3.0)
    {
        SpinConfig cfg;
        cfg.profile = profile;
        cfg.minDurationSeconds = seconds;
        cfg.windowSize = 100;
        cfg.swapThreshold = 0.25;
        cfg.itemHeight = 80.0;
        return cfg;
    }

    std::string centred(const RenderState& rs)
    {
        if (!rs.activeWindow || rs.centerIndex >= rs.activeWindow->size())
            return {};
        return rs.activeWindow->entries[rs.centerIndex].identity;
    }

    // Tick at a fixed frame rate until the session leaves `spinning`.
    std::vector<RenderState> runToEnd(SpinController& ctl, SpinSession& s, const CollectionRef& c, double t0 = 5000.0, double step = kStepMs)
    {
        std::vector<RenderState> frames;
        double t = t0;
        for (int i = 0; i < 100000 && s.phase == SpinPhase::Spinning; ++i, t += step)
            frames.push_back(ctl.advance(s, c, t));
        return frames;
    }

    struct LandedProbe
    {
        int calls = 0;
        std::string identity;
    };

    void watch(SpinController& ctl, LandedProbe& probe)
    {
        ctl.onLanded([&probe](const Entry& e)
        {
            ++probe.calls;
            probe.identity = e.identity;
        });
    }
} // namespace

TEST(SpinControllerTest, SmallPoolLandsWithoutSwap)
{
    SpinController ctl(1);
    LandedProbe probe;
    watch(ctl, probe);
    auto c = makeCollection(50);
    SpinSession s;

    ASSERT_EQ(ctl.start(s, c, "26", makeConfig()), SpinError::None);
    EXPECT_EQ(s.activeWindow.size(), 50u);
    EXPECT_EQ(s.activeWindow.branch, WindowBranch::Whole);
    EXPECT_EQ(s.plan.totalItems, 50u);
    EXPECT_EQ(s.plan.targetIndex, 25u);

    const auto frames = runToEnd(ctl, s, c);
    ASSERT_FALSE(frames.empty());
    EXPECT_EQ(s.phase, SpinPhase::Landed);
    EXPECT_FALSE(s.hasSwapped);
    EXPECT_EQ(probe.calls, 1);
    EXPECT_EQ(probe.identity, (*c)[25].identity);
    EXPECT_EQ(frames.back().centerIndex, 25u);
    EXPECT_DOUBLE_EQ(frames.back().normalizedPosition, 25 * 80.0);
}

TEST(SpinControllerTest, NegativeStartBranchLandsOnWinner)
{
    SpinController ctl(2);
    LandedProbe probe;
    watch(ctl, probe);
    auto c = makeCollection(1000);
    SpinSession s;

    ASSERT_EQ(ctl.start(s, c, "11", makeConfig()), SpinError::None);
    EXPECT_EQ(s.activeWindow.kind, WindowKind::Wrap);
    runToEnd(ctl, s, c);

    EXPECT_EQ(s.phase, SpinPhase::Landed);
    EXPECT_TRUE(s.hasSwapped);
    EXPECT_EQ(s.activeWindow.branch, WindowBranch::NegativeStart);
    ASSERT_TRUE(s.winner.has_value());
    EXPECT_EQ(s.winner->identity, (*c)[10].identity);
    EXPECT_EQ(probe.identity, (*c)[10].identity);
}

TEST(SpinControllerTest, OverflowBranchLandsOnWinner)
{
    SpinController ctl(3);
    auto c = makeCollection(1000);
    SpinSession s;

    ASSERT_EQ(ctl.start(s, c, "991", makeConfig(EaseProfile::Fast)), SpinError::None);
    const auto frames = runToEnd(ctl, s, c);

    EXPECT_EQ(s.activeWindow.branch, WindowBranch::Overflow);
    ASSERT_TRUE(s.winner.has_value());
    EXPECT_EQ(s.winner->identity, (*c)[990].identity);
    EXPECT_EQ(centred(frames.back()), (*c)[990].identity);
}

TEST(SpinControllerTest, ContiguousBranchSwapsAtThreshold)
{
    SpinController ctl(4);
    auto c = makeCollection(5000);
    const SpinConfig cfg = makeConfig(EaseProfile::Slow);
    SpinSession s;

    ASSERT_EQ(ctl.start(s, c, "2501", cfg), SpinError::None);
    const Window wrap = s.activeWindow;

    RenderState beforeSwap;
    RenderState afterSwap;
    double t = 0.0;
    while (!s.hasSwapped && s.phase == SpinPhase::Spinning)
    {
        beforeSwap = SpinController::renderState(s);
        afterSwap = ctl.advance(s, c, t);
        t += kStepMs;
    }
    ASSERT_TRUE(s.hasSwapped);
    EXPECT_EQ(s.activeWindow.branch, WindowBranch::Contiguous);
    EXPECT_GE(s.swap.progress, 0.25);
    EXPECT_LT(s.swap.progress, 0.25 + kStepMs / 3000.0 + 1e-9);
    EXPECT_LT(beforeSwap.progress, 0.25);

    // centre at the swap instant, before and after re-expression
    const std::size_t oldCentre = center_index(s.swap.positionBefore, wrap.size(), cfg.itemHeight);
    EXPECT_EQ(wrap.entries[oldCentre].identity, s.swap.oldCenterIdentity);
    EXPECT_EQ(centred(afterSwap), s.swap.newCenterIdentity);
    EXPECT_FALSE(s.swap.usedFallback);
    if (s.swap.exactMatch)
        EXPECT_EQ(s.swap.oldCenterIdentity, s.swap.newCenterIdentity);
    else
        // the two windows share nothing here; the nearest ticket by sort key takes the centre
        EXPECT_TRUE(s.swap.newCenterIdentity == "2451" || s.swap.newCenterIdentity == "2550");
    EXPECT_NEAR(normalize_position(s.swap.positionBefore, 1, cfg.itemHeight), normalize_position(s.swap.positionAfter, 1, cfg.itemHeight), 1e-9);

    runToEnd(ctl, s, c, t);
    ASSERT_TRUE(s.winner.has_value());
    EXPECT_EQ(s.winner->identity, "2501");
}

TEST(SpinControllerTest, CentredEntryIdenticalAcrossSwap)
{
    SpinController ctl(5);
    auto c = makeCollection(1000);
    SpinConfig cfg = makeConfig(EaseProfile::Slow);
    cfg.rotations = 3;
    SpinSession s;

    ASSERT_EQ(ctl.start(s, c, "11", cfg), SpinError::None);
    ctl.advance(s, c, 0.0);
    const Window wrap = s.activeWindow;
    // progress 0.25 exactly: slow curve puts wrap slot 2 (ticket "3") at the centre
    const double before = s.plan.positionAt(0.25);
    const std::string centreBefore = wrap.entries[center_index(before, wrap.size(), cfg.itemHeight)].identity;
    const RenderState rs = ctl.advance(s, c, 750.0);

    ASSERT_TRUE(s.hasSwapped);
    EXPECT_EQ(centreBefore, "3");
    EXPECT_TRUE(s.swap.exactMatch);
    EXPECT_EQ(centred(rs), centreBefore);
    EXPECT_EQ(s.swap.oldCenterIdentity, s.swap.newCenterIdentity);
}

TEST(SpinControllerTest, SecondStartWhileSpinning)
{
    SpinController ctl(6);
    auto c = makeCollection(500);
    SpinSession s;

    ASSERT_EQ(ctl.start(s, c, "100", makeConfig()), SpinError::None);
    ctl.advance(s, c, 0.0);
    ctl.advance(s, c, 100.0);
    const double pos = s.currentPosition;

    std::string err;
    EXPECT_EQ(ctl.start(s, c, "200", makeConfig(), &err), SpinError::AlreadySpinning);
    EXPECT_FALSE(err.empty());
    EXPECT_EQ(s.phase, SpinPhase::Spinning);
    EXPECT_EQ(s.targetIdentity, "100");
    EXPECT_DOUBLE_EQ(s.currentPosition, pos);
}

TEST(SpinControllerTest, UnknownWinnerFailsBeforeAnyMotion)
{
    SpinController ctl(7);
    LandedProbe probe;
    watch(ctl, probe);
    auto c = makeCollection(500);
    SpinSession s;

    std::string err;
    EXPECT_EQ(ctl.start(s, c, "9999", makeConfig(), &err), SpinError::WinnerNotFound);
    EXPECT_FALSE(err.empty());
    EXPECT_EQ(s.phase, SpinPhase::Idle);

    const RenderState rs = ctl.advance(s, c, 1000.0);
    EXPECT_EQ(rs.phase, SpinPhase::Idle);
    EXPECT_DOUBLE_EQ(rs.position, 0.0);
    EXPECT_EQ(probe.calls, 0);

    EXPECT_EQ(ctl.start(s, std::make_shared<Collection>(), "1", makeConfig()), SpinError::WinnerNotFound);
    EXPECT_EQ(ctl.start(s, nullptr, "1", makeConfig()), SpinError::WinnerNotFound);
}

TEST(SpinControllerTest, InvalidWindowSize)
{
    SpinController ctl(8);
    auto c = makeCollection(10);
    SpinConfig cfg = makeConfig();
    cfg.windowSize = 0;
    SpinSession s;
    EXPECT_EQ(ctl.start(s, c, "1", cfg), SpinError::InvalidTarget);
    EXPECT_EQ(s.phase, SpinPhase::Idle);
}

TEST(SpinControllerTest, NanSwapThresholdRejected)
{
    SpinController ctl(18);
    LandedProbe probe;
    watch(ctl, probe);
    auto c = makeCollection(1000);
    SpinConfig cfg = makeConfig();
    cfg.swapThreshold = std::numeric_limits<double>::quiet_NaN();
    SpinSession s;

    std::string err;
    EXPECT_EQ(ctl.start(s, c, "500", cfg, &err), SpinError::InvalidTarget);
    EXPECT_FALSE(err.empty());
    EXPECT_EQ(s.phase, SpinPhase::Idle);

    ctl.advance(s, c, 0.0);
    ctl.advance(s, c, 10000.0);
    EXPECT_EQ(s.phase, SpinPhase::Idle);
    EXPECT_EQ(probe.calls, 0);
}

TEST(SpinControllerTest, OutOfRangeSwapThresholdRejected)
{
    SpinController ctl(19);
    auto c = makeCollection(1000);
    for (double threshold : { -0.1, 1.5, std::numeric_limits<double>::infinity() })
    {
        SpinConfig cfg = makeConfig();
        cfg.swapThreshold = threshold;
        SpinSession s;
        EXPECT_EQ(ctl.start(s, c, "500", cfg), SpinError::InvalidTarget) << threshold;
        EXPECT_EQ(s.phase, SpinPhase::Idle);
    }

    // both ends of the range are accepted
    for (double threshold : { 0.0, 1.0 })
    {
        SpinConfig cfg = makeConfig();
        cfg.swapThreshold = threshold;
        SpinSession s;
        ASSERT_EQ(ctl.start(s, c, "500", cfg), SpinError::None) << threshold;
        runToEnd(ctl, s, c);
        ASSERT_TRUE(s.winner.has_value());
        EXPECT_EQ(s.winner->identity, "500");
    }
}

TEST(SpinControllerTest, LandingWithoutWinnerSlotCancels)
{
    SpinController ctl(20);
    LandedProbe probe;
    watch(ctl, probe);
    auto c = makeCollection(1000);
    SpinSession s;
    ASSERT_EQ(ctl.start(s, c, "500", makeConfig()), SpinError::None);

    // session state corrupted after start: the swap never fires
    s.config.swapThreshold = std::numeric_limits<double>::quiet_NaN();
    ctl.advance(s, c, 0.0);
    const RenderState rs = ctl.advance(s, c, 10000.0);

    EXPECT_FALSE(s.hasSwapped);
    EXPECT_EQ(rs.phase, SpinPhase::Cancelled);
    EXPECT_FALSE(s.winner.has_value());
    EXPECT_EQ(probe.calls, 0);
}

TEST(SpinControllerTest, RenderStateFollowsRestartedSession)
{
    SpinController ctl(21);
    auto c = makeCollection(40);
    SpinSession s;
    ASSERT_EQ(ctl.start(s, c, "10", makeConfig()), SpinError::None);
    runToEnd(ctl, s, c);

    ASSERT_EQ(ctl.start(s, c, "20", makeConfig()), SpinError::None);
    const RenderState rs = SpinController::renderState(s);
    EXPECT_EQ(rs.activeWindow, &s.activeWindow);
    EXPECT_EQ(rs.phase, SpinPhase::Spinning);
    EXPECT_EQ(rs.activeWindow->winnerOffset, 19u);
}

TEST(SpinControllerTest, SameSeedReplaysIdentically)
{
    auto c = makeCollection(3000);
    SpinController a(1234), b(1234);
    SpinSession sa, sb;
    ASSERT_EQ(a.start(sa, c, "1777", makeConfig(EaseProfile::Fast)), SpinError::None);
    ASSERT_EQ(b.start(sb, c, "1777", makeConfig(EaseProfile::Fast)), SpinError::None);
    EXPECT_EQ(sa.plan.rotations, sb.plan.rotations);

    const auto fa = runToEnd(a, sa, c);
    const auto fb = runToEnd(b, sb, c);
    ASSERT_EQ(fa.size(), fb.size());
    for (std::size_t i = 0; i < fa.size(); ++i)
    {
        EXPECT_DOUBLE_EQ(fa[i].position, fb[i].position) << "frame " << i;
        EXPECT_EQ(centred(fa[i]), centred(fb[i])) << "frame " << i;
        EXPECT_EQ(fa[i].activeWindow->entries.front().identity, fb[i].activeWindow->entries.front().identity);
    }
    ASSERT_TRUE(sa.winner && sb.winner);
    EXPECT_EQ(sa.winner->identity, sb.winner->identity);
}

TEST(SpinControllerTest, LandingSweep)
{
    SpinController ctl(99);
    for (std::size_t n : { 1u, 2u, 3u, 49u, 99u, 100u, 101u, 150u, 999u, 1000u, 2500u, 10000u })
    {
        auto c = makeCollection(n);
        for (std::size_t idx : { std::size_t(0), n / 2, n - 1 })
        {
            for (EaseProfile p : { EaseProfile::Slow, EaseProfile::Medium, EaseProfile::Fast })
            {
                SpinSession s;
                const std::string target = (*c)[idx].identity;
                ASSERT_EQ(ctl.start(s, c, target, makeConfig(p, 1.0)), SpinError::None);
                const auto frames = runToEnd(ctl, s, c, 0.0, 33.0);

                ASSERT_EQ(s.phase, SpinPhase::Landed) << "n=" << n << " idx=" << idx;
                ASSERT_TRUE(s.winner.has_value());
                EXPECT_EQ(s.winner->identity, target) << "n=" << n << " idx=" << idx;
                EXPECT_EQ(centred(frames.back()), target) << "n=" << n << " idx=" << idx;
                EXPECT_EQ(s.activeWindow.size(), std::min<std::size_t>(n, 100));
                EXPECT_EQ(s.hasSwapped, n > 100);
            }
        }
    }
}

TEST(SpinControllerTest, WindowHoldsWinnerAfterSwap)
{
    SpinController ctl(10);
    auto c = makeCollection(4000);
    SpinSession s;
    ASSERT_EQ(ctl.start(s, c, "3210", makeConfig()), SpinError::None);

    double t = 0.0;
    double lastPos = 0.0;
    while (s.phase == SpinPhase::Spinning)
    {
        const bool swappedBefore = s.hasSwapped;
        const RenderState rs = ctl.advance(s, c, t);
        t += kStepMs;
        EXPECT_EQ(rs.activeWindow->size(), 100u);
        if (s.hasSwapped)
        {
            ASSERT_LT(s.activeWindow.winnerOffset, s.activeWindow.size());
            EXPECT_EQ(s.activeWindow.entries[s.activeWindow.winnerOffset].identity, "3210");
        }
        // motion is forward except for the one re-expression at the swap
        if (swappedBefore == s.hasSwapped)
            EXPECT_GE(rs.position, lastPos - 1e-9);
        lastPos = rs.position;
    }
    EXPECT_EQ(s.phase, SpinPhase::Landed);
}

TEST(SpinControllerTest, StaleCollectionCancels)
{
    SpinController ctl(11);
    LandedProbe probe;
    watch(ctl, probe);
    auto c = makeCollection(800);
    SpinSession s;
    ASSERT_EQ(ctl.start(s, c, "400", makeConfig()), SpinError::None);
    ctl.advance(s, c, 0.0);
    ctl.advance(s, c, 200.0);

    // same contents, different snapshot
    auto replaced = std::make_shared<Collection>(*c);
    const RenderState rs = ctl.advance(s, replaced, 216.0);
    EXPECT_EQ(rs.phase, SpinPhase::Cancelled);
    EXPECT_EQ(rs.error, SpinError::StaleCollection);

    ctl.advance(s, c, 10000.0);
    EXPECT_EQ(s.phase, SpinPhase::Cancelled);
    EXPECT_EQ(probe.calls, 0);
}

TEST(SpinControllerTest, CancelIsImmediate)
{
    SpinController ctl(12);
    LandedProbe probe;
    watch(ctl, probe);
    auto c = makeCollection(300);
    SpinSession s;
    ASSERT_EQ(ctl.start(s, c, "42", makeConfig()), SpinError::None);
    ctl.advance(s, c, 0.0);
    ctl.advance(s, c, 500.0);

    ctl.cancel(s);
    EXPECT_EQ(s.phase, SpinPhase::Cancelled);
    EXPECT_DOUBLE_EQ(s.currentPosition, 0.0);

    const RenderState rs = ctl.advance(s, c, 100000.0);
    EXPECT_EQ(rs.phase, SpinPhase::Cancelled);
    EXPECT_FALSE(s.winner.has_value());
    EXPECT_EQ(probe.calls, 0);

    // a cancelled session can be started again
    EXPECT_EQ(ctl.start(s, c, "43", makeConfig()), SpinError::None);
}

TEST(SpinControllerTest, OneFrameJumpSwapsThenLands)
{
    SpinController ctl(13);
    LandedProbe probe;
    watch(ctl, probe);
    auto c = makeCollection(2000);
    SpinSession s;
    ASSERT_EQ(ctl.start(s, c, "1500", makeConfig()), SpinError::None);
    ctl.advance(s, c, 0.0);
    const RenderState rs = ctl.advance(s, c, 60000.0);

    EXPECT_EQ(rs.phase, SpinPhase::Landed);
    EXPECT_TRUE(s.hasSwapped);
    EXPECT_EQ(centred(rs), "1500");
    EXPECT_EQ(probe.calls, 1);

    // landed is terminal, no second emission
    ctl.advance(s, c, 70000.0);
    EXPECT_EQ(probe.calls, 1);
}

TEST(SpinControllerTest, ZeroDurationLandsOnFirstFrame)
{
    SpinController ctl(14);
    auto c = makeCollection(20);
    SpinSession s;
    ASSERT_EQ(ctl.start(s, c, "7", makeConfig(EaseProfile::Medium, 0.0)), SpinError::None);
    const RenderState rs = ctl.advance(s, c, 123.0);
    EXPECT_EQ(rs.phase, SpinPhase::Landed);
    EXPECT_EQ(centred(rs), "7");
}

TEST(SpinControllerTest, ClockGoingBackwardsDoesNotRewind)
{
    SpinController ctl(15);
    auto c = makeCollection(60);
    SpinSession s;
    ASSERT_EQ(ctl.start(s, c, "30", makeConfig()), SpinError::None);
    ctl.advance(s, c, 1000.0);
    const RenderState a = ctl.advance(s, c, 2000.0);
    const RenderState b = ctl.advance(s, c, 1500.0);
    EXPECT_DOUBLE_EQ(a.position, b.position);
    EXPECT_DOUBLE_EQ(a.progress, b.progress);
}

TEST(SpinControllerTest, FixedRotationsOverrideTheDraw)
{
    SpinController ctl(16);
    auto c = makeCollection(10);
    SpinConfig cfg = makeConfig();
    cfg.rotations = 7;
    SpinSession s;
    ASSERT_EQ(ctl.start(s, c, "4", cfg), SpinError::None);
    EXPECT_EQ(s.plan.rotations, 7);
    EXPECT_DOUBLE_EQ(s.plan.totalDistance, (7.0 * 10.0 + 3.0) * 80.0);
}

TEST(SpinControllerTest, IndependentSessions)
{
    SpinController ctl(17);
    auto c = makeCollection(1200);
    SpinSession a, b;
    ASSERT_EQ(ctl.start(a, c, "5", makeConfig()), SpinError::None);
    ASSERT_EQ(ctl.start(b, c, "1195", makeConfig()), SpinError::None);
    runToEnd(ctl, a, c);
    runToEnd(ctl, b, c);
    ASSERT_TRUE(a.winner && b.winner);
    EXPECT_EQ(a.winner->identity, "5");
    EXPECT_EQ(b.winner->identity, "1195");
}
