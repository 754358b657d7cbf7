#ifndef DECOPY_EXCEPTIONS_H
#define DECOPY_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace decopy {

/**
 * @brief Base exception for all decopy errors
 *
 * Carries the filesystem path the error relates to (may be empty)
 */
class DecopyException : public std::runtime_error {
public:
    explicit DecopyException(const std::string& msg, const std::string& path = "")
        : std::runtime_error(msg), path_(path) {}

    const std::string& path() const { return path_; }

protected:
    std::string path_;
};

/**
 * @brief Malformed or missing command-line paths
 *
 * Raised before any copy starts.
 */
class ArgumentException : public DecopyException {
public:
    explicit ArgumentException(const std::string& msg, const std::string& path = "")
        : DecopyException(msg, path) {}
};

/**
 * @brief Source directory cannot be listed or sized
 *
 * Fatal: no destination is touched once this is thrown.
 */
class SourceUnreadableException : public DecopyException {
public:
    explicit SourceUnreadableException(const std::string& msg, const std::string& path = "")
        : DecopyException(msg, path) {}
};

/**
 * @brief A single destination failed mid-copy (permission, space, vanished path)
 *
 * Recorded by CopyQueue, never aborts the remaining destinations.
 */
class DestinationCopyException : public DecopyException {
public:
    DestinationCopyException(const std::string& msg, const std::string& destination)
        : DecopyException(msg, destination) {}
};

/**
 * @brief The terminal output sink rejected a write
 */
class RenderIOException : public DecopyException {
public:
    explicit RenderIOException(const std::string& msg)
        : DecopyException(msg) {}
};

/**
 * @brief User interface asked to move to an earlier state
 */
class InvalidStateException : public DecopyException {
public:
    explicit InvalidStateException(const std::string& msg)
        : DecopyException(msg) {}
};

/**
 * @brief JSON parsing errors
 */
class ParseException : public DecopyException {
public:
    ParseException(const std::string& msg, const std::string& path = "")
        : DecopyException(msg, path) {}
};

/**
 * @brief Configuration errors (missing keys, invalid values, etc.)
 */
class ConfigException : public DecopyException {
public:
    explicit ConfigException(const std::string& msg)
        : DecopyException(msg) {}
};

} // namespace decopy

#endif // DECOPY_EXCEPTIONS_H
