#pragma once
#include "SpinController.hpp"
#include "model.hpp"

#include <imgui.h>

#include <optional>
#include <random>
#include <string>
#include <vector>

/// @brief ReelViewerApp — ImGui host that drives one SpinSession from the frame clock and draws it.
class ReelViewerApp
{
public:
    explicit ReelViewerApp(std::uint32_t seed);
    ~ReelViewerApp();

    void drawUI();
    bool loadEntries(const char* path);
    bool loadConfig(const char* path);
    void synthesize(int count);

private:
    void drawControls();
    void drawReel(ImDrawList* dl, const ImVec2& canvasMin, const ImVec2& canvasMax);
    void drawStatusBar(ImDrawList* dl, const ImVec2& canvasMin, const ImVec2& canvasMax);
    void startSpin();
    void syncConfigFromUI();

private:
    SpinController _controller;
    SpinSession    _session;
    RenderState    _render;     // rebuilt from _session every frame
    CollectionRef  _collection;
    SpinConfig     _config;

    // UI
    char  _entriesPath[1024];
    char  _configPath[1024];
    char  _target[64];
    int   _syntheticCount;
    int   _profileIdx;
    float _durationSec;
    int   _windowSize;
    float _swapThreshold;
    int   _reelRadius;
    std::string _lastError;

    std::optional<Entry> _lastWinner;
    std::vector<Entry> _history;
    // demo draw of a target, the real one comes from the caller
    std::mt19937 _pick;
};
