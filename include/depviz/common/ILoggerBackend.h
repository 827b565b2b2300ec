#pragma once

#include <source_location>
#include <string>

namespace depviz {

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

/// Sink for Logger output. SpdlogBackend is the default; tests install
/// their own to observe what the resolvers report.
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /// @param message Already formatted and prefixed with the caller's name
    virtual void log(LogLevel level, const std::string& message,
                     const std::source_location& loc) = 0;

    virtual void setLevel(LogLevel level) = 0;
    virtual void flush() = 0;
};

}  // namespace depviz
