#pragma once
#include <string>
#include <random>
#include <cstddef>
#include "model.hpp"

// Loop count used for the visible flourish; integer in [3,5).
int draw_rotations(std::mt19937& rng);

// Build the immutable plan of one spin.
// - targetIndex: slot of the winner in the window ultimately displayed
// - totalItems:  length of that window
// - rotations:   whole loops added before the target (R)
// totalDistance = (R * totalItems + targetIndex) * itemHeight, so the landing slot
// does not depend on R.
// InvalidTarget when totalItems < 1, targetIndex outside [0,totalItems),
// itemHeight <= 0 or rotations < 0.
SpinError plan_spin(std::size_t targetIndex, std::size_t totalItems, double minDurationSeconds, EaseProfile profile, int rotations, double itemHeight, SpinPlan& outPlan, std::string* outError = nullptr);

struct LandingCheck
{
    bool        accurate = false;
    std::size_t actualIndex = 0;
    std::size_t expectedIndex = 0;
    double      positionError = 0.0;   // px, in normalized space
};

// Which slot sits at centre for finalPosition, compared to expectedIndex.
LandingCheck check_landing(double finalPosition, std::size_t totalItems, double itemHeight, std::size_t expectedIndex);

// "R=4 target=50/100 circumference=8000px landing=4000px duration=3000ms profile=medium"
std::string describe_plan(const SpinPlan& plan);
