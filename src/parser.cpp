#include "parser.hpp"
#include "identity.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

bool read_file(const std::string& path, std::string& out)
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) return false;
    std::ostringstream oss; oss << ifs.rdbuf();
    out = std::move(oss).str();
    return true;
}

// identity may be given as a string or a bare number
static std::string read_identity(const json& o)
{
    for (const char* key : { "identity", "ticketNumber", "id" })
    {
        if (!o.contains(key)) continue;
        const json& v = o[key];
        if (v.is_string()) return v.get<std::string>();
        if (v.is_number_integer()) return std::to_string(v.get<long long>());
        if (v.is_number()) return v.dump();
    }
    return {};
}

static bool parse_entry_object(const json& o, Collection& out, std::string* outError)
{
    if (!o.is_object())
    {
        if (outError) *outError = "entry #" + std::to_string(out.size()) + " is not an object";
        return false;
    }

    Entry e;
    e.identity = read_identity(o);
    if (trim_ascii(e.identity).empty())
    {
        if (outError) *outError = "entry #" + std::to_string(out.size()) + " has no identity";
        return false;
    }
    e.displayName = o.value("name", o.value("displayName", std::string()));

    if (o.contains("sortKey") && o["sortKey"].is_number())
        e.sortKey = o["sortKey"].get<double>();
    else if (auto num = extract_numeric_identity(e.identity))
        e.sortKey = *num;
    else
        e.sortKey = double(out.size());

    out.push_back(std::move(e));
    return true;
}

// ---------- API ----------
bool parse_entries_payload(const std::string& jsonText, Collection& out, std::string* outError)
{
    out.clear();

    json root;
    try
    {
        root = json::parse(jsonText);
    }
    catch (const std::exception& e)
    {
        if (outError)
            *outError = e.what();
        return false;
    }

    const json* arr = nullptr;
    if (root.is_array())
        arr = &root;
    else if (root.is_object() && root.contains("entries") && root["entries"].is_array())
        arr = &root["entries"];

    if (!arr)
    {
        if (outError) *outError = "Unsupported JSON root";
        return false;
    }

    out.reserve(arr->size());
    for (const auto& it : *arr)
    {
        if (!parse_entry_object(it, out, outError))
        {
            out.clear();
            return false;
        }
    }

    std::stable_sort(out.begin(), out.end(), [](const Entry& a, const Entry& b) { return a.sortKey < b.sortKey; });
    return true;
}

bool parse_spin_config(const std::string& jsonText, SpinConfig& out, std::optional<std::uint32_t>* outSeed, std::string* outError)
{
    json root;
    try
    {
        root = json::parse(jsonText);
    }
    catch (const std::exception& e)
    {
        if (outError)
            *outError = e.what();
        return false;
    }
    if (!root.is_object())
    {
        if (outError) *outError = "config root must be an object";
        return false;
    }

    auto fail = [&](const std::string& msg)
    {
        if (outError) *outError = msg;
        return false;
    };

    SpinConfig cfg = out;
    try
    {
        if (root.contains("profile"))
        {
            const auto name = root["profile"].get<std::string>();
            const auto p = parse_profile(name);
            if (!p) return fail("unknown profile '" + name + "' (slow, medium, fast)");
            cfg.profile = *p;
        }
        cfg.minDurationSeconds = root.value("minDurationSeconds", cfg.minDurationSeconds);
        cfg.swapThreshold = root.value("swapThreshold", cfg.swapThreshold);
        cfg.itemHeight = root.value("itemHeight", cfg.itemHeight);
        cfg.rotations = root.value("rotations", cfg.rotations);
        if (root.contains("windowSize"))
        {
            const auto w = root["windowSize"].get<long long>();
            if (w < 1) return fail("windowSize must be >= 1");
            cfg.windowSize = std::size_t(w);
        }
        if (outSeed && root.contains("seed"))
            *outSeed = root["seed"].get<std::uint32_t>();
    }
    catch (const json::exception& e)
    {
        return fail(e.what());
    }

    if (!std::isfinite(cfg.minDurationSeconds) || cfg.minDurationSeconds < 0.0)
        return fail("minDurationSeconds must be >= 0");
    if (!std::isfinite(cfg.swapThreshold) || cfg.swapThreshold < 0.0 || cfg.swapThreshold > 1.0)
        return fail("swapThreshold must be within [0,1]");
    if (!(cfg.itemHeight > 0.0) || !std::isfinite(cfg.itemHeight))
        return fail("itemHeight must be > 0");
    if (cfg.rotations < 0)
        return fail("rotations must be >= 0");

    out = cfg;
    return true;
}
