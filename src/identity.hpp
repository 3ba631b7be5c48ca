#pragma once
#include <string>
#include <string_view>
#include <functional>
#include <cstdint>
#include <optional>

// Caller-supplied mapping applied to both stored and typed ticket identities.
using IdentityNormalizer = std::function<std::string(std::string_view)>;

inline bool is_space_ascii(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

inline std::string_view trim_ascii(std::string_view s) {
    while (!s.empty() && is_space_ascii(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space_ascii(s.back())) s.remove_suffix(1);
    return s;
}

// "  0042 " -> "42", "000" -> "0", "" -> "0"
inline std::string normalize_identity(std::string_view raw) {
    std::string_view s = trim_ascii(raw);
    size_t i = 0;
    while (i < s.size() && s[i] == '0') ++i;
    s.remove_prefix(i);
    if (s.empty()) return "0";
    return std::string(s);
}

// Digits of the identity read as a number ("T-456-X" -> 456). Used to derive a sort key.
inline std::optional<double> extract_numeric_identity(std::string_view s) {
    double v = 0.0;
    bool any = false;
    for (char c : s) {
        if (c < '0' || c > '9') continue;
        v = v * 10.0 + double(c - '0');
        any = true;
    }
    if (!any) return std::nullopt;
    return v;
}

inline IdentityNormalizer default_normalizer() {
    return [](std::string_view s) { return normalize_identity(s); };
}
