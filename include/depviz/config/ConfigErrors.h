#pragma once

#include <stdexcept>
#include <string>

namespace depviz {

/// Base of all configuration failures
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigFileNotFoundError : public ConfigError {
public:
    explicit ConfigFileNotFoundError(const std::string& path)
        : ConfigError("Config file not found: " + path) {}
};

class MissingConfigFieldError : public ConfigError {
public:
    explicit MissingConfigFieldError(const std::string& field)
        : ConfigError("Missing required config field: " + field), field_(field) {}

    const std::string& field() const noexcept { return field_; }

private:
    std::string field_;
};

class InvalidConfigError : public ConfigError {
public:
    InvalidConfigError(const std::string& field, const std::string& value, const std::string& reason)
        : ConfigError("Invalid value '" + value + "' for field '" + field + "': " + reason),
          field_(field) {}

    const std::string& field() const noexcept { return field_; }

private:
    std::string field_;
};

}  // namespace depviz
