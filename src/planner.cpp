#include "planner.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

int draw_rotations(std::mt19937& rng)
{
    std::uniform_int_distribution<int> dist(3, 4);
    return dist(rng);
}

SpinError plan_spin(std::size_t targetIndex, std::size_t totalItems, double minDurationSeconds, EaseProfile profile, int rotations, double itemHeight, SpinPlan& outPlan, std::string* outError)
{
    if (totalItems < 1)
    {
        if (outError) *outError = "no items to spin over";
        return SpinError::InvalidTarget;
    }
    if (targetIndex >= totalItems)
    {
        if (outError) *outError = "target index " + std::to_string(targetIndex) + " outside [0, " + std::to_string(totalItems) + ")";
        return SpinError::InvalidTarget;
    }
    if (!(itemHeight > 0.0) || rotations < 0)
    {
        if (outError) *outError = "invalid item height or rotation count";
        return SpinError::InvalidTarget;
    }

    // whole multiples of itemHeight, exact in double for any realistic size
    const double loops = double(rotations) * double(totalItems) + double(targetIndex);

    SpinPlan p;
    p.totalDistance = loops * itemHeight;
    p.durationMs = std::isfinite(minDurationSeconds) ? std::max(0.0, minDurationSeconds) * 1000.0 : 0.0;
    p.profile = profile;
    p.easing = easing_fn(profile);
    p.startPosition = 0.0;
    p.rotations = rotations;
    p.targetIndex = targetIndex;
    p.totalItems = totalItems;
    p.itemHeight = itemHeight;
    outPlan = p;
    return SpinError::None;
}

LandingCheck check_landing(double finalPosition, std::size_t totalItems, double itemHeight, std::size_t expectedIndex)
{
    LandingCheck r;
    r.expectedIndex = expectedIndex;
    if (totalItems == 0 || !(itemHeight > 0.0))
        return r;

    const double circumference = double(totalItems) * itemHeight;
    double norm = std::fmod(finalPosition, circumference);
    if (norm < 0.0) norm += circumference;

    r.actualIndex = std::size_t(std::floor(norm / itemHeight)) % totalItems;
    r.positionError = std::abs(norm - double(expectedIndex) * itemHeight);
    r.accurate = r.actualIndex == expectedIndex;
    return r;
}

std::string describe_plan(const SpinPlan& plan)
{
    const double circumference = double(plan.totalItems) * plan.itemHeight;
    const double landing = circumference > 0.0 ? std::fmod(plan.finalPosition(), circumference) : 0.0;
    char buf[256];
    std::snprintf(buf, sizeof(buf), "R=%d target=%zu/%zu circumference=%.0fpx landing=%.0fpx duration=%.0fms profile=%s",
        plan.rotations, plan.targetIndex, plan.totalItems, circumference, landing, plan.durationMs, profile_name(plan.profile));
    return buf;
}
