/**
 * @file Exceptions.hpp
 * @brief Exception types for pathmap
 *
 * Path map operations report failures as Error values. These exceptions
 * exist for callers that want them:
 * - PathMapError and one subclass per ErrorKind, thrown by
 *   Result::value() / Status::throw_if_error()
 * - DocumentError and subclasses, thrown by document loading and saving
 */

#ifndef PATHMAP_EXCEPTIONS_HPP
#define PATHMAP_EXCEPTIONS_HPP

#include "pathmap/Errors.hpp"
#include <stdexcept>
#include <string>

namespace pathmap {

/**
 * @brief Base class for all classified path map failures
 */
class PathMapError : public std::runtime_error {
public:
    explicit PathMapError(Error err)
        : std::runtime_error(err.message())
        , error_(std::move(err))
    {}

    /**
     * @brief Get the error value this exception was raised from
     */
    const Error& error() const noexcept {
        return error_;
    }

private:
    Error error_;
};

class NotAMapError : public PathMapError {
public:
    using PathMapError::PathMapError;
};

class MissingError : public PathMapError {
public:
    using PathMapError::PathMapError;
};

class InvalidPathError : public PathMapError {
public:
    using PathMapError::PathMapError;
};

class AlreadyExistsError : public PathMapError {
public:
    using PathMapError::PathMapError;
};

class LeafMissingError : public PathMapError {
public:
    using PathMapError::PathMapError;
};

class InvalidFunctionError : public PathMapError {
public:
    using PathMapError::PathMapError;
};

class InvalidInitializerError : public PathMapError {
public:
    using PathMapError::PathMapError;
};

/**
 * @brief Throw the exception subclass matching err.kind()
 */
[[noreturn]] void throw_error(const Error& err);

/**
 * @brief Base class for document loading/saving errors
 */
class DocumentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Document file not found
 */
class FileNotFoundError : public DocumentError {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : DocumentError("Document file not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Document parse error (JSON/TOML syntax)
 *
 * Line and column are 0 when the parser does not report a position.
 */
class DocumentParseError : public DocumentError {
public:
    DocumentParseError(std::string file, int line, int column, std::string details)
        : DocumentError(format_message(file, line, column, details))
        , file_(std::move(file))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept { return file_; }
    int line() const noexcept { return line_; }
    int column() const noexcept { return column_; }
    const std::string& details() const noexcept { return details_; }

private:
    std::string file_;
    int line_;
    int column_;
    std::string details_;

    static std::string format_message(const std::string& file, int line,
                                      int column, const std::string& details) {
        std::string msg = "Parse error in '" + file + "'";
        if (line > 0) {
            msg += " at line " + std::to_string(line) +
                   ", column " + std::to_string(column);
        }
        return msg + ": " + details;
    }
};

/**
 * @brief File extension is neither .json nor .toml
 */
class UnsupportedFormatError : public DocumentError {
public:
    explicit UnsupportedFormatError(const std::string& path)
        : DocumentError("Unsupported document type: '" + path +
                        "' (expected .json or .toml)")
    {}
};

} // namespace pathmap

#endif // PATHMAP_EXCEPTIONS_HPP
