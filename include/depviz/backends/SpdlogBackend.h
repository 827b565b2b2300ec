#pragma once

#include "depviz/common/ILoggerBackend.h"
#include <memory>
#include <spdlog/spdlog.h>

namespace depviz {

/// Console output, plus <logDir>/depviz.log when logToFile is set.
/// Starts at info unless LOG_LEVEL or SPDLOG_LEVEL names another level.
class SpdlogBackend : public ILoggerBackend {
public:
    SpdlogBackend(const std::string& logDir = "", bool logToFile = false);

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::shared_ptr<spdlog::logger> logger_;
    spdlog::level::level_enum convertLevel(LogLevel level);
};

}  // namespace depviz
