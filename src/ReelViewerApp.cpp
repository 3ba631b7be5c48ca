#include "ReelViewerApp.hpp"
#include "parser.hpp"
#include "planner.hpp"
#include "reconciler.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <iostream>

namespace
{
    constexpr const char* kProfiles[] = { "slow", "medium", "fast" };
    constexpr std::size_t kMaxHistory = 16;

    inline EaseProfile profileFromIndex(int i)
    {
        return i <= 0 ? EaseProfile::Slow : (i == 1 ? EaseProfile::Medium : EaseProfile::Fast);
    }

    inline int indexFromProfile(EaseProfile p)
    {
        return p == EaseProfile::Slow ? 0 : (p == EaseProfile::Medium ? 1 : 2);
    }
} // namespace

ReelViewerApp::ReelViewerApp(std::uint32_t seed)
    : _controller{ seed }
    , _session{}
    , _render{}
    , _collection{}
    , _config{}
    , _entriesPath{ "entries.json" }
    , _configPath{ "spin.json" }
    , _target{ "" }
    , _syntheticCount{ 5000 }
    , _profileIdx{ 1 }
    , _durationSec{ 3.0f }
    , _windowSize{ 100 }
    , _swapThreshold{ 0.25f }
    , _reelRadius{ 4 }
    , _lastError{}
    , _lastWinner{}
    , _history{}
    , _pick{ seed ^ 0x9E3779B9u }
{
    _controller.onLanded([this](const Entry& winner)
    {
        std::cout << "Winner: " << winner.identity << " " << winner.displayName << std::endl;
        _lastWinner = winner;
        _history.insert(_history.begin(), winner);
        if (_history.size() > kMaxHistory)
            _history.resize(kMaxHistory);
    });
    synthesize(_syntheticCount);
}

ReelViewerApp::~ReelViewerApp() {}

bool ReelViewerApp::loadEntries(const char* path)
{
    if (!path || !*path) return false;

    std::string data;
    if (!read_file(path, data))
    {
        _lastError = std::string("Failed to open ") + path;
        return false;
    }
    auto fresh = std::make_shared<Collection>();
    std::string err;
    if (!parse_entries_payload(data, *fresh, &err))
    {
        _lastError = err.empty() ? "Failed to parse entries" : err;
        return false;
    }
    // a running spin notices the new reference on its next tick
    _collection = std::move(fresh);
    std::snprintf(_entriesPath, sizeof(_entriesPath), "%s", path);
    _lastError.clear();
    std::cout << "Loaded " << _collection->size() << " entries from " << path << std::endl;
    return true;
}

bool ReelViewerApp::loadConfig(const char* path)
{
    if (!path || !*path) return false;

    std::string data;
    if (!read_file(path, data))
    {
        _lastError = std::string("Failed to open ") + path;
        return false;
    }
    std::string err;
    std::optional<std::uint32_t> seed;
    SpinConfig cfg = _config;
    if (!parse_spin_config(data, cfg, &seed, &err))
    {
        _lastError = err.empty() ? "Failed to parse config" : err;
        return false;
    }
    _config = cfg;
    if (seed)
        _controller.reseed(*seed);

    _profileIdx = indexFromProfile(_config.profile);
    _durationSec = float(_config.minDurationSeconds);
    _windowSize = int(std::min<std::size_t>(_config.windowSize, 100000));
    _swapThreshold = float(_config.swapThreshold);
    std::snprintf(_configPath, sizeof(_configPath), "%s", path);
    _lastError.clear();
    return true;
}

void ReelViewerApp::synthesize(int count)
{
    count = std::clamp(count, 1, 1000000);
    auto fresh = std::make_shared<Collection>();
    fresh->reserve(std::size_t(count));
    for (int i = 1; i <= count; ++i)
    {
        char id[16];
        std::snprintf(id, sizeof(id), "%06d", i);
        fresh->push_back(Entry{ id, "Participant " + std::to_string(i), double(i) });
    }
    _collection = std::move(fresh);
    _syntheticCount = count;
}

void ReelViewerApp::syncConfigFromUI()
{
    _config.profile = profileFromIndex(_profileIdx);
    _config.minDurationSeconds = std::max(0.0, double(_durationSec));
    _config.windowSize = std::size_t(std::max(1, _windowSize));
    _config.swapThreshold = std::clamp(double(_swapThreshold), 0.0, 1.0);
}

void ReelViewerApp::startSpin()
{
    syncConfigFromUI();
    std::string err;
    const SpinError e = _controller.start(_session, _collection, _target, _config, &err);
    if (e != SpinError::None)
    {
        _lastError = std::string(to_string(e)) + ": " + err;
        return;
    }
    _lastError.clear();
    std::cout << "Spin " << _session.targetIdentity << ": " << describe_plan(_session.plan) << std::endl;
}

void ReelViewerApp::drawControls()
{
    ImGui::Begin("Controls");

    ImGui::SeparatorText("Entries");
    ImGui::InputText("Entries path", _entriesPath, sizeof(_entriesPath));
    ImGui::SameLine();
    if (ImGui::Button("Load"))
        loadEntries(_entriesPath);
    ImGui::SetNextItemWidth(140.f);
    ImGui::InputInt("Synthetic size", &_syntheticCount, 100, 1000);
    ImGui::SameLine();
    if (ImGui::Button("Generate"))
        synthesize(_syntheticCount);
    ImGui::Text("Pool: %zu entries", _collection ? _collection->size() : std::size_t(0));

    ImGui::SeparatorText("Spin");
    ImGui::InputText("Config path", _configPath, sizeof(_configPath));
    ImGui::SameLine();
    if (ImGui::Button("Apply"))
        loadConfig(_configPath);

    const bool spinning = _session.phase == SpinPhase::Spinning;
    ImGui::BeginDisabled(spinning);
    ImGui::Combo("Deceleration", &_profileIdx, kProfiles, IM_ARRAYSIZE(kProfiles));
    ImGui::SliderFloat("Min duration (s)", &_durationSec, 0.5f, 20.0f, "%.1f");
    ImGui::InputInt("Window size", &_windowSize, 10, 100);
    if (_windowSize < 1) _windowSize = 1;
    ImGui::SliderFloat("Swap at", &_swapThreshold, 0.0f, 1.0f, "%.2f");
    ImGui::EndDisabled();
    ImGui::SliderInt("Reel radius", &_reelRadius, 1, 10);

    ImGui::SetNextItemWidth(180.f);
    ImGui::InputText("Winner ticket", _target, sizeof(_target));
    ImGui::SameLine();
    if (ImGui::SmallButton("Random") && _collection && !_collection->empty())
    {
        std::uniform_int_distribution<std::size_t> dist(0, _collection->size() - 1);
        std::snprintf(_target, sizeof(_target), "%s", (*_collection)[dist(_pick)].identity.c_str());
    }

    ImGui::BeginDisabled(spinning || _target[0] == '\0');
    if (ImGui::Button("Spin", ImVec2(120, 0)))
        startSpin();
    ImGui::EndDisabled();
    ImGui::SameLine();
    ImGui::BeginDisabled(!spinning);
    if (ImGui::Button("Cancel", ImVec2(120, 0)))
        _controller.cancel(_session);
    ImGui::EndDisabled();

    if (!_lastError.empty())
        ImGui::TextColored(ImVec4(1, 0.4f, 0.4f, 1), "Error: %s", _lastError.c_str());
    if (_session.error != SpinError::None)
        ImGui::TextColored(ImVec4(1, 0.7f, 0.3f, 1), "Session: %s", to_string(_session.error));

    ImGui::SeparatorText("Winners");
    if (_lastWinner)
        ImGui::Text("Last: %s  %s", _lastWinner->identity.c_str(), _lastWinner->displayName.c_str());
    for (const auto& w : _history)
        ImGui::BulletText("%s  %s", w.identity.c_str(), w.displayName.c_str());

    ImGui::End();
}

void ReelViewerApp::drawReel(ImDrawList* dl, const ImVec2& canvasMin, const ImVec2& canvasMax)
{
    const Window* win = _render.activeWindow;
    if (!win || win->empty())
    {
        dl->AddText(ImVec2(canvasMin.x + 12, canvasMin.y + 12), IM_COL32(160, 170, 180, 255), "Enter a winner ticket and press Spin");
        return;
    }

    // the engine works in item units of _config.itemHeight; scale to the canvas
    const float midY = (canvasMin.y + canvasMax.y) * 0.5f;
    const float slotH = std::max(24.f, (canvasMax.y - canvasMin.y - 30.f) / float(2 * _reelRadius + 1));
    const float scale = slotH / float(_session.config.itemHeight);
    const float x1 = canvasMin.x + 20.f, x2 = canvasMax.x - 20.f;

    constexpr ImU32 kSlotCol = IM_COL32(34, 48, 58, 255);
    constexpr ImU32 kTextCol = IM_COL32(225, 232, 240, 255);
    constexpr ImU32 kWinCol = IM_COL32(66, 180, 110, 255);

    dl->PushClipRect(canvasMin, ImVec2(canvasMax.x, canvasMax.y - 24.f), true);
    for (const auto& slot : visible_slots(*win, _render.position, _session.config.itemHeight, _reelRadius + 1))
    {
        const float top = midY + float(slot.offsetPx) * scale - slotH * 0.5f;
        ImVec2 p1(x1, top + 2.f), p2(x2, top + slotH - 2.f);
        const bool landedHere = _render.phase == SpinPhase::Landed && slot.distance == 0;
        dl->AddRectFilled(p1, p2, slotFade(landedHere ? kWinCol : kSlotCol, slot.distance, _reelRadius + 1), 6.f);

        char label[256];
        std::snprintf(label, sizeof(label), "%s   %s", slot.entry->identity.c_str(), slot.entry->displayName.c_str());
        const std::string text = elideToWidth(label, (x2 - x1) - 24.f);
        const float th = ImGui::GetTextLineHeight();
        dl->AddText(ImVec2(p1.x + 12.f, (p1.y + p2.y - th) * 0.5f), slotFade(kTextCol, slot.distance, _reelRadius + 1), text.c_str());
    }
    dl->PopClipRect();

    // centre marker
    dl->AddRect(ImVec2(x1 - 6.f, midY - slotH * 0.5f), ImVec2(x2 + 6.f, midY + slotH * 0.5f), IM_COL32(250, 204, 21, 220), 8.f, 0, 2.5f);
}

void ReelViewerApp::drawStatusBar(ImDrawList* dl, const ImVec2& canvasMin, const ImVec2& canvasMax)
{
    ImVec2 sMin(canvasMin.x, canvasMax.y - 22.f), sMax(canvasMax.x, canvasMax.y);
    dl->AddRectFilled(sMin, sMax, IM_COL32(18, 23, 28, 255));

    const Window& w = _session.activeWindow;
    char left[200];
    std::snprintf(left, sizeof(left), "%s  |  %3.0f%% of %s  |  pos %.1f  |  window %zu (%s)",
        to_string(_render.phase), _render.progress * 100.0, fmtMs(_session.plan.durationMs).c_str(),
        _render.position, w.size(), to_string(w.branch));
    char right[200] = "";
    if (_session.hasSwapped)
    {
        std::snprintf(right, sizeof(right), "swap @%.2f  %s -> %s%s",
            _session.swap.progress, _session.swap.oldCenterIdentity.c_str(), _session.swap.newCenterIdentity.c_str(),
            _session.swap.exactMatch ? "" : " (nearest)");
    }
    dl->AddText(ImVec2(sMin.x + 8, sMin.y + 3), IM_COL32(200, 200, 200, 255), left);
    float rw = ImGui::CalcTextSize(right).x;
    dl->AddText(ImVec2(sMax.x - rw - 8, sMin.y + 3), IM_COL32(200, 200, 200, 255), right);
}

// --- drawUI (controls + reel host) ---
void ReelViewerApp::drawUI()
{
    // per-frame clock
    const double nowMs = ImGui::GetTime() * 1000.0;
    _render = _controller.advance(_session, _collection, nowMs);

    drawControls();
    // Spin / Cancel may have replaced the session above
    _render = SpinController::renderState(_session);

    ImGui::Begin("Reel", nullptr, ImGuiWindowFlags_NoBringToFrontOnFocus);
    ImDrawList* dl = ImGui::GetWindowDrawList();
    ImVec2 canvasMin = ImGui::GetCursorScreenPos();
    ImVec2 availCR = ImGui::GetContentRegionAvail();
    ImVec2 canvasMax(canvasMin.x + availCR.x, canvasMin.y + availCR.y);
    dl->AddRectFilled(canvasMin, canvasMax, IM_COL32(10, 18, 24, 255));
    drawReel(dl, canvasMin, canvasMax);
    drawStatusBar(dl, canvasMin, canvasMax);
    ImGui::End();
}
