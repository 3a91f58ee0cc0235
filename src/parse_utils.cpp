#include "parse_utils.hpp"
#include <algorithm>
#include <cctype>
#include <climits>

int parse_int(const std::string& value, int min, int max, bool& ok) {
    ok = false;
    try {
        size_t pos = 0;
        int v = std::stoi(value, &pos);
        if (pos != value.size() || v < min || v > max)
            return 0;
        ok = true;
        return v;
    } catch (...) {
        return 0;
    }
}

size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    if (value.empty())
        return 0;
    std::string val = value;
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    unsigned long long mult = 1;
    auto ends_with = [&](const std::string& suf) {
        return val.size() >= suf.size() &&
               val.compare(val.size() - suf.size(), suf.size(), suf) == 0;
    };
    if (ends_with("kb")) {
        mult = 1024ull;
        val.erase(val.size() - 2);
    } else if (ends_with("mb")) {
        mult = 1024ull * 1024;
        val.erase(val.size() - 2);
    } else if (ends_with("gb")) {
        mult = 1024ull * 1024 * 1024;
        val.erase(val.size() - 2);
    } else if (ends_with("tb")) {
        mult = 1024ull * 1024 * 1024 * 1024;
        val.erase(val.size() - 2);
    } else if (ends_with("pb")) {
        mult = 1024ull * 1024 * 1024 * 1024 * 1024;
        val.erase(val.size() - 2);
    } else if (!val.empty() && val.back() == 'b') {
        val.pop_back();
    }
    if (val.empty() || !std::all_of(val.begin(), val.end(),
                                    [](unsigned char c) { return std::isdigit(c) != 0; }))
        return 0;
    unsigned long long base = 0;
    try {
        base = std::stoull(val);
    } catch (...) {
        return 0;
    }
    if (base > ULLONG_MAX / mult)
        return 0;
    unsigned long long total = base * mult;
    if (total < min || total > max)
        return 0;
    ok = true;
    return static_cast<size_t>(total);
}

std::chrono::milliseconds parse_time_ms(const std::string& value, bool& ok) {
    ok = false;
    std::string num = value;
    long long mult = 1;
    if (num.size() > 2 && num.compare(num.size() - 2, 2, "ms") == 0) {
        num.erase(num.size() - 2);
    } else if (!num.empty() && num.back() == 's') {
        mult = 1000;
        num.pop_back();
    } else if (!num.empty() && num.back() == 'm') {
        mult = 60 * 1000;
        num.pop_back();
    }
    if (num.empty() || !std::all_of(num.begin(), num.end(),
                                    [](unsigned char c) { return std::isdigit(c) != 0; }))
        return std::chrono::milliseconds(0);
    long long n = 0;
    try {
        n = std::stoll(num);
    } catch (...) {
        return std::chrono::milliseconds(0);
    }
    if (n > LLONG_MAX / mult)
        return std::chrono::milliseconds(0);
    ok = true;
    return std::chrono::milliseconds(n * mult);
}

bool parse_bool(const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v == "" || v == "1" || v == "true" || v == "yes" || v == "on";
}
