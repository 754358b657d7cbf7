#ifndef DECOPY_ILOGGER_H
#define DECOPY_ILOGGER_H

#include <string>
#include <ostream>

namespace decopy {

/**
 * @brief Logging interface to decouple core logic from terminal output
 *
 * CopyQueue and the copy worker log through this, the CLI uses ConsoleLogger,
 * tests use NullLogger.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void debug(const std::string& msg) = 0;
    virtual void info(const std::string& msg) = 0;
    virtual void warn(const std::string& msg) = 0;
    virtual void error(const std::string& msg) = 0;
};

/**
 * @brief Formats one log line as "[decopy] msg"
 * @param msg Message text
 * @param color Paint the tag magenta
 */
inline std::string formatLogLine(const std::string& msg, bool color)
{
    if (color) {
        return "[\033[35mdecopy\033[39m] " + msg;
    }
    return "[decopy] " + msg;
}

/**
 * @brief CLI logger writing "[decopy] ..." lines to a stream
 */
class ConsoleLogger : public ILogger {
public:
    explicit ConsoleLogger(std::ostream& out, bool show_debug = false, bool color = true)
        : out_(out), show_debug_(show_debug), color_(color) {}

    void debug(const std::string& msg) override {
        if (show_debug_) {
            log("debug: " + msg);
        }
    }

    void info(const std::string& msg) override {
        log(msg);
    }

    void warn(const std::string& msg) override {
        log("warning: " + msg);
    }

    void error(const std::string& msg) override {
        log("error: " + msg);
    }

private:
    std::ostream& out_;
    bool show_debug_;
    bool color_;

    void log(const std::string& msg) {
        out_ << formatLogLine(msg, color_) << "\n";
        out_.flush();
    }
};

/**
 * @brief Null logger for tests - discards all output
 */
class NullLogger : public ILogger {
public:
    void debug(const std::string&) override {}
    void info(const std::string&) override {}
    void warn(const std::string&) override {}
    void error(const std::string&) override {}
};

} // namespace decopy

#endif // DECOPY_ILOGGER_H
