#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

// Deceleration profiles offered to the operator.
enum class EaseProfile : uint8_t { Slow, Medium, Fast };

using EasingFn = double (*)(double);

// Progress mapping, t clamped to [0,1]. ease(p,0)=0, ease(p,1)=1, non-decreasing.
double ease(EaseProfile profile, double t);

double ease_out_cubic(double t);
double ease_out_quad(double t);
// linear 4t/3 up to 0.5, quadratic-out after; C1 at the joint
double ease_linear_quad(double t);

EasingFn easing_fn(EaseProfile profile);

const char* profile_name(EaseProfile profile);
std::optional<EaseProfile> parse_profile(std::string_view name);
