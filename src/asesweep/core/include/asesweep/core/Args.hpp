#pragma once
#include "asesweep/core/Errors.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace asesweep {

/*
  Command-line helpers.

  Conventions:
    - Key format: --key=value  (no spaces)
    - Flags:      --key        (boolean presence), --no-key to force off
    - Parsing starts at argv[2] because argv[1] is the mode.
      Example:   asesweep sweep --count=50 --presets=4,0.1
    - Keys are case-sensitive; the last occurrence wins.

  A value that is present but does not parse is a ConfigError; a missing key
  yields the default.
*/

/* Get string value for "--key=value". Returns 'def' if not found. */
inline std::string argValue(int argc, char** argv, const std::string& key, const std::string& def = {}) {
    const std::string pref = "--" + key + "=";
    std::string out = def;
    for (int i = 2; i < argc; ++i) {
        std::string a(argv[i]);
        if (a.rfind(pref, 0) == 0) out = a.substr(pref.size());
    }
    return out;
}

/* Get int value for "--key=value". */
inline int argValueInt(int argc, char** argv, const std::string& key, int def) {
    const std::string v = argValue(argc, argv, key, "");
    if (v.empty()) return def;
    std::size_t used = 0;
    int out = 0;
    try {
        out = std::stoi(v, &used);
    } catch (const std::exception&) {
        throw ConfigError("--" + key + ": not an integer: '" + v + "'");
    }
    if (used != v.size()) throw ConfigError("--" + key + ": not an integer: '" + v + "'");
    return out;
}

/* Get double value for "--key=value". */
inline double argValueDouble(int argc, char** argv, const std::string& key, double def) {
    const std::string v = argValue(argc, argv, key, "");
    if (v.empty()) return def;
    std::size_t used = 0;
    double out = 0.0;
    try {
        out = std::stod(v, &used);
    } catch (const std::exception&) {
        throw ConfigError("--" + key + ": not a number: '" + v + "'");
    }
    if (used != v.size()) throw ConfigError("--" + key + ": not a number: '" + v + "'");
    return out;
}

/* Comma-separated doubles, "--key=4,0.1". */
inline std::vector<double> argValueList(int argc, char** argv, const std::string& key,
                                        const std::vector<double>& def) {
    const std::string v = argValue(argc, argv, key, "");
    if (v.empty()) return def;
    std::vector<double> out;
    std::size_t start = 0;
    while (start <= v.size()) {
        const auto comma = v.find(',', start);
        const std::string item = v.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
        std::size_t used = 0;
        try {
            out.push_back(std::stod(item, &used));
        } catch (const std::exception&) {
            used = 0;
        }
        if (item.empty() || used != item.size()) {
            throw ConfigError("--" + key + ": bad list item '" + item + "'");
        }
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return out;
}

/* Check presence of a boolean flag "--key". */
inline bool argHas(int argc, char** argv, const std::string& key) {
    const std::string flag = "--" + key;
    for (int i = 2; i < argc; ++i) if (flag == argv[i]) return true;
    return false;
}

/* "--key" turns on, "--no-key" turns off, otherwise 'def'. */
inline bool argFlag(int argc, char** argv, const std::string& key, bool def) {
    bool out = def;
    const std::string on = "--" + key, off = "--no-" + key;
    for (int i = 2; i < argc; ++i) {
        if (on == argv[i]) out = true;
        else if (off == argv[i]) out = false;
    }
    return out;
}

/* First argument from argv[2] on that is not one of 'known' (by key). Empty if all are. */
inline std::string argUnknown(int argc, char** argv, const std::vector<std::string>& known) {
    for (int i = 2; i < argc; ++i) {
        std::string a(argv[i]);
        if (a.rfind("--", 0) != 0) return a;
        std::string key = a.substr(2, a.find('=') == std::string::npos ? std::string::npos : a.find('=') - 2);
        if (key.rfind("no-", 0) == 0) key = key.substr(3);
        bool found = false;
        for (const auto& k : known) if (k == key) { found = true; break; }
        if (!found) return a;
    }
    return {};
}

} // namespace asesweep
