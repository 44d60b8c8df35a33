/**
 * @file Document.hpp
 * @brief Loading and saving whole path maps as JSON or TOML files
 *
 * - JSON files (using nlohmann::json)
 * - TOML files (using toml++)
 *
 * The format is chosen by the lower-case file extension, ".json" or
 * ".toml".
 */

#ifndef PATHMAP_DOCUMENT_HPP
#define PATHMAP_DOCUMENT_HPP

#include "pathmap/Value.hpp"
#include <string>

namespace pathmap {

enum class DocumentFormat {
    Json,
    Toml
};

/**
 * @brief Format for a file path, by extension
 * @throws UnsupportedFormatError for anything but .json / .toml
 */
DocumentFormat format_of(const std::string& path);

/**
 * @brief Load a JSON file
 * @throws FileNotFoundError if the file doesn't exist
 * @throws DocumentParseError if the JSON is malformed
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a TOML file
 *
 * Tables become maps. Dates and times become their TOML text.
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws DocumentParseError with line/column if the TOML is malformed
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Load a file in the format given by its extension
 */
Value load_document(const std::string& path);

/**
 * @brief Write value to path in the format given by its extension
 * @throws UnsupportedFormatError, DocumentError if the file can't be written
 */
void save_document(const std::string& path, const Value& value);

/// JSON text, 2-space indent.
std::string to_json_string(const Value& value, int indent = 2);

/**
 * @brief TOML text
 *
 * TOML has no null: nulls are written as empty strings. A non-map value
 * is written under the key "value".
 */
std::string to_toml_string(const Value& value);

} // namespace pathmap

#endif // PATHMAP_DOCUMENT_HPP
