/**
 * @file Document.cpp
 * @brief Implementation of JSON/TOML document IO
 */

#include "pathmap/Document.hpp"
#include "pathmap/Exceptions.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>
#include <string_view>
#include <type_traits>

namespace fs = std::filesystem;

namespace pathmap {

namespace {

template <typename T>
std::string stream_to_string(const T& v) {
    std::ostringstream ss;
    ss << v;
    return ss.str();
}

// Whole file as text. Directories and unreadable paths count as missing.
std::string read_text(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw FileNotFoundError(path);
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw FileNotFoundError(path);
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

Value toml_to_value(const toml::node& node) {
    return node.visit([](const auto& n) -> Value {
        using N = std::decay_t<decltype(n)>;
        if constexpr (toml::is_table<N>) {
            Value map = empty_map();
            for (const auto& [key, child] : n) {
                map[std::string(key.str())] = toml_to_value(child);
            }
            return map;
        } else if constexpr (toml::is_array<N>) {
            Value arr = Value::array();
            for (const auto& child : n) {
                arr.push_back(toml_to_value(child));
            }
            return arr;
        } else if constexpr (toml::is_date<N> || toml::is_time<N> || toml::is_date_time<N>) {
            // No JSON equivalent; keep the TOML spelling
            return Value(stream_to_string(n.get()));
        } else {
            return Value(n.get());
        }
    });
}

toml::table map_to_table(const Value& map);
toml::array value_to_array(const Value& arr);

// Appends or inserts v through sink(T) for every scalar kind.
template <typename Sink>
void emit_leaf(const Value& v, Sink&& sink) {
    if (v.is_string()) {
        sink(v.get<std::string>());
    } else if (v.is_boolean()) {
        sink(v.get<bool>());
    } else if (v.is_number_unsigned()) {
        const auto u = v.get<std::uint64_t>();
        if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            sink(static_cast<std::int64_t>(u));
        } else {
            // Oversize for TOML integer
            sink(static_cast<double>(u));
        }
    } else if (v.is_number_integer()) {
        sink(v.get<std::int64_t>());
    } else if (v.is_number_float()) {
        sink(v.get<double>());
    } else if (v.is_null()) {
        sink(std::string{});
    } else if (v.is_object()) {
        sink(map_to_table(v));
    } else if (v.is_array()) {
        sink(value_to_array(v));
    } else {
        sink(v.dump());
    }
}

toml::table map_to_table(const Value& map) {
    toml::table tbl;
    for (auto it = map.begin(); it != map.end(); ++it) {
        const std::string& key = it.key();
        emit_leaf(it.value(), [&](auto&& x) {
            tbl.insert(key, std::forward<decltype(x)>(x));
        });
    }
    return tbl;
}

toml::array value_to_array(const Value& arr) {
    toml::array out;
    for (const auto& elem : arr) {
        emit_leaf(elem, [&](auto&& x) {
            out.push_back(std::forward<decltype(x)>(x));
        });
    }
    return out;
}

toml::table to_toml_root(const Value& value) {
    if (is_map(value)) return map_to_table(value);
    Value wrapped = empty_map();
    wrapped["value"] = value;
    return map_to_table(wrapped);
}

void write_file(const std::string& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw DocumentError("Failed to open for write: " + path);
    }
    out << text;
    if (!out) {
        throw DocumentError("Failed to write: " + path);
    }
}

} // anonymous namespace

DocumentFormat format_of(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (ext == ".json") return DocumentFormat::Json;
    if (ext == ".toml") return DocumentFormat::Toml;
    throw UnsupportedFormatError(path);
}

Value load_json_file(const std::string& path) {
    const std::string content = read_text(path);
    try {
        return Value::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw DocumentParseError(path, 0, 0, e.what());
    }
}

Value load_toml_file(const std::string& path) {
    const std::string content = read_text(path);
    try {
        toml::table table = toml::parse(std::string_view(content), std::string_view(path));
        return toml_to_value(table);
    } catch (const toml::parse_error& e) {
        throw DocumentParseError(
            path,
            static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column),
            std::string(e.description())
        );
    }
}

Value load_document(const std::string& path) {
    switch (format_of(path)) {
        case DocumentFormat::Json: return load_json_file(path);
        case DocumentFormat::Toml: return load_toml_file(path);
    }
    throw UnsupportedFormatError(path);
}

void save_document(const std::string& path, const Value& value) {
    switch (format_of(path)) {
        case DocumentFormat::Json:
            write_file(path, to_json_string(value) + "\n");
            return;
        case DocumentFormat::Toml:
            write_file(path, to_toml_string(value));
            return;
    }
}

std::string to_json_string(const Value& value, int indent) {
    return value.dump(indent);
}

std::string to_toml_string(const Value& value) {
    return stream_to_string(to_toml_root(value));
}

} // namespace pathmap
