// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "chart_types.h"

#include <cmath>
#include <limits>
#include <optional>
#include <string>

#include "hv/json.hpp"

namespace chartkit::json_util {

/// Safely extract a string from a JSON field that may be null.
/// nlohmann .value("key", "") throws type_error.302 when the field is JSON null.
inline std::string safe_string(const nlohmann::json& j, const char* key,
                               const std::string& def = "") {
    if (!j.contains(key) || j[key].is_null()) {
        return def;
    }
    const auto& v = j[key];
    if (v.is_string()) {
        return v.get<std::string>();
    }
    if (v.is_number()) {
        // Labels written as bare numbers ("value_label": 212)
        return v.dump();
    }
    return def;
}

/// Numbers are read as double so out-of-range values fall back instead of wrapping.
inline bool in_int_range(double d) {
    return d >= static_cast<double>(std::numeric_limits<int>::min()) &&
           d <= static_cast<double>(std::numeric_limits<int>::max());
}

inline bool in_float_range(double d) {
    return std::isfinite(d) && std::fabs(d) <= std::numeric_limits<float>::max();
}

/// Safely extract an int from a JSON field that may be number, string, or null.
/// Numbers outside the int range yield @p def.
inline int safe_int(const nlohmann::json& j, const char* key, int def = 0) {
    if (!j.contains(key) || j[key].is_null()) {
        return def;
    }
    const auto& v = j[key];
    if (v.is_number()) {
        double d = v.get<double>();
        return in_int_range(d) ? static_cast<int>(d) : def;
    }
    if (v.is_string()) {
        try {
            return std::stoi(v.get<std::string>());
        } catch (const std::exception&) {
            return def;
        }
    }
    return def;
}

/// Safely extract a float from a JSON field that may be number, string, or null.
/// Numbers outside the float range yield @p def.
inline float safe_float(const nlohmann::json& j, const char* key, float def = 0.0f) {
    if (!j.contains(key) || j[key].is_null()) {
        return def;
    }
    const auto& v = j[key];
    if (v.is_number()) {
        double d = v.get<double>();
        return in_float_range(d) ? static_cast<float>(d) : def;
    }
    if (v.is_string()) {
        try {
            return std::stof(v.get<std::string>());
        } catch (const std::exception&) {
            return def;
        }
    }
    return def;
}

/// Safely extract a bool from a JSON field that may be bool, number, or null.
inline bool safe_bool(const nlohmann::json& j, const char* key, bool def = false) {
    if (!j.contains(key) || j[key].is_null()) {
        return def;
    }
    const auto& v = j[key];
    if (v.is_boolean()) {
        return v.get<bool>();
    }
    if (v.is_number()) {
        return v.get<double>() != 0.0;
    }
    return def;
}

/// Float field if present, numeric and representable as float, nullopt otherwise
inline std::optional<float> optional_float(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_number()) {
        return std::nullopt;
    }
    double d = j[key].get<double>();
    if (!in_float_range(d)) {
        return std::nullopt;
    }
    return static_cast<float>(d);
}

} // namespace chartkit::json_util
