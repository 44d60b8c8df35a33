/**
 * @file Path.cpp
 * @brief Implementation of path construction and dot notation
 */

#include "pathmap/Path.hpp"
#include <sstream>

namespace pathmap {

Path::Path(const Value& raw) {
    if (!raw.is_array()) {
        valid_ = false;
        invalid_ = raw;
        return;
    }

    keys_.reserve(raw.size());
    for (const auto& elem : raw) {
        if (!elem.is_string()) {
            keys_.clear();
            valid_ = false;
            invalid_ = raw;
            return;
        }
        keys_.push_back(elem.get<std::string>());
    }
}

Path Path::parse_dot(const std::string& dotted) {
    auto segments = split_dot_path(dotted);
    for (const auto& seg : segments) {
        if (seg.empty()) {
            // Keep the original text for the InvalidPath report
            return Path(Value(dotted));
        }
    }
    return Path(std::move(segments));
}

Value Path::raw() const {
    if (!valid_) return invalid_;
    return Value(keys_);
}

std::string Path::to_dot() const {
    return join_dot_path(keys_);
}

std::vector<std::string> split_dot_path(const std::string& path) {
    if (path.empty()) {
        return {};
    }

    std::vector<std::string> segments;
    std::string current;

    for (char c : path) {
        if (c == '.') {
            segments.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }

    // Add final segment
    segments.push_back(current);

    return segments;
}

std::string join_dot_path(const Keys& segments) {
    if (segments.empty()) {
        return "";
    }

    std::ostringstream oss;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) oss << '.';
        oss << segments[i];
    }
    return oss.str();
}

Path parse_path_arg(const std::string& text) {
    if (!text.empty() && text.front() == '[') {
        Value parsed = Value::parse(text, nullptr, false);
        if (parsed.is_discarded()) {
            return Path(Value(text));
        }
        return Path(parsed);
    }
    return Path::parse_dot(text);
}

} // namespace pathmap
