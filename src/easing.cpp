#include "easing.hpp"
#include <algorithm>

namespace
{
    inline double clamp01(double t)
    {
        if (!(t > 0.0)) return 0.0; // NaN lands here too
        return std::min(t, 1.0);
    }
} // namespace

double ease_out_cubic(double t)
{
    t = clamp01(t);
    const double u = 1.0 - t;
    return 1.0 - u * u * u;
}

double ease_out_quad(double t)
{
    t = clamp01(t);
    const double u = 1.0 - t;
    return 1.0 - u * u;
}

double ease_linear_quad(double t)
{
    t = clamp01(t);
    if (t < 0.5)
        return t * (4.0 / 3.0);
    const double u = 1.0 - t;
    return 1.0 - (4.0 / 3.0) * u * u;
}

EasingFn easing_fn(EaseProfile profile)
{
    switch (profile)
    {
        case EaseProfile::Slow:   return &ease_out_cubic;
        case EaseProfile::Medium: return &ease_out_quad;
        case EaseProfile::Fast:   return &ease_linear_quad;
    }
    return &ease_out_quad;
}

double ease(EaseProfile profile, double t)
{
    return easing_fn(profile)(t);
}

const char* profile_name(EaseProfile profile)
{
    switch (profile)
    {
        case EaseProfile::Slow:   return "slow";
        case EaseProfile::Medium: return "medium";
        case EaseProfile::Fast:   return "fast";
    }
    return "medium";
}

std::optional<EaseProfile> parse_profile(std::string_view name)
{
    if (name == "slow")   return EaseProfile::Slow;
    if (name == "medium") return EaseProfile::Medium;
    if (name == "fast")   return EaseProfile::Fast;
    return std::nullopt;
}
