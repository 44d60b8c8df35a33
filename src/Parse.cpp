/**
 * @file Parse.cpp
 * @brief Implementation of text-to-Value conversion
 */

#include "pathmap/Parse.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <regex>

namespace pathmap {

namespace {
    const std::regex& integer_pattern() {
        static const std::regex re("^-?[0-9]+$");
        return re;
    }

    const std::regex& float_pattern() {
        static const std::regex re("^-?[0-9]+\\.[0-9]+([eE][+-]?[0-9]+)?$");
        return re;
    }

    std::string lowercase(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        return s;
    }

    std::optional<Value> parse_integer(const std::string& text) {
        if (!std::regex_match(text, integer_pattern())) return std::nullopt;
        errno = 0;
        char* end = nullptr;
        long long v = std::strtoll(text.c_str(), &end, 10);
        if (errno == ERANGE || end != text.c_str() + text.size()) {
            return std::nullopt;
        }
        return Value(static_cast<std::int64_t>(v));
    }

    std::optional<Value> parse_float(const std::string& text) {
        if (!std::regex_match(text, float_pattern())) return std::nullopt;
        errno = 0;
        char* end = nullptr;
        double v = std::strtod(text.c_str(), &end);
        if (errno == ERANGE || end != text.c_str() + text.size()) {
            return std::nullopt;
        }
        return Value(v);
    }

    bool enclosed(const std::string& text, char open, char close) {
        return text.size() >= 2 && text.front() == open && text.back() == close;
    }

    std::optional<Value> parse_json(const std::string& text) {
        Value parsed = Value::parse(text, nullptr, false);
        if (parsed.is_discarded()) return std::nullopt;
        return parsed;
    }
}

Value parse_value(const std::string& text) {
    if (text.empty()) {
        return "";
    }

    const std::string lower = lowercase(text);
    if (lower == "true") return true;
    if (lower == "false") return false;
    if (lower == "null") return nullptr;

    if (auto v = parse_integer(text)) return *v;
    if (auto v = parse_float(text)) return *v;

    if (enclosed(text, '{', '}') || enclosed(text, '[', ']')) {
        if (auto v = parse_json(text)) return *v;
    }

    if (enclosed(text, '"', '"')) {
        auto v = parse_json(text);
        if (v && v->is_string()) return *v;
    }

    return text;
}

} // namespace pathmap
