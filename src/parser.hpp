#pragma once
#include <vector>
#include <string>
#include <cstdint>
#include <optional>
#include "model.hpp"

// Parse a collection snapshot into sorted entries.
// - jsonText: [ {identity,name,sortKey}, ... ] or { "entries": [ ... ] }
// - out: entries, stable-sorted by sortKey
// - a missing sortKey is taken from the digits of the identity, then from the position
// - outError: readable error optionnal.
//
// True in success
bool parse_entries_payload(const std::string& jsonText, Collection& out, std::string* outError = nullptr);

// Parse spin settings. Keys absent from the object keep the value already in `out`.
// { "profile":"slow|medium|fast", "minDurationSeconds":3, "windowSize":100,
//   "swapThreshold":0.25, "itemHeight":80, "rotations":0, "seed":42 }
bool parse_spin_config(const std::string& jsonText, SpinConfig& out, std::optional<std::uint32_t>* outSeed = nullptr, std::string* outError = nullptr);

bool read_file(const std::string& path, std::string& out);
