#pragma once

#include <imgui.h>

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

inline std::string fmtMs(double ms)
{
    // safe entry
    if (!std::isfinite(ms)) ms = 0.0;
    if (ms < 0.0) ms = 0.0;

    char buf[64];
    if (ms < 1e3)
        std::snprintf(buf, sizeof(buf), "%.0f ms", ms);
    else if (ms < 60e3)
        std::snprintf(buf, sizeof(buf), "%.2f s", ms / 1e3);
    else
    {
        const long long total_s = std::llround(ms / 1e3);
        std::snprintf(buf, sizeof(buf), "%02lld:%02lld", total_s / 60, total_s % 60);
    }
    return buf;
}

inline std::string elideToWidth(const std::string& s, float maxPx)
{
    if (maxPx <= 0.f || s.empty()) return {};
    if (ImGui::CalcTextSize(s.c_str()).x <= maxPx) return s;
    static constexpr const char* dots = "...";
    float wd = ImGui::CalcTextSize(dots).x;
    if (wd >= maxPx) return {};
    int lo = 0, hi = int(s.size());
    while (lo < hi) {
        int mid = (lo + hi + 1) / 2;
        std::string st = s.substr(0, mid) + dots;
        if (ImGui::CalcTextSize(st.c_str()).x <= maxPx) lo = mid; else hi = mid - 1;
    }
    return s.substr(0, lo) + dots;
}

// slot colour fades with distance from the centre line
inline ImU32 slotFade(ImU32 base, int distance, int radius)
{
    const float t = radius > 0 ? 1.0f - 0.75f * float(std::abs(distance)) / float(radius) : 1.0f;
    const int a = int(float((base >> IM_COL32_A_SHIFT) & 0xFF) * t);
    return (base & ~IM_COL32_A_MASK) | (ImU32(a < 0 ? 0 : a) << IM_COL32_A_SHIFT);
}
