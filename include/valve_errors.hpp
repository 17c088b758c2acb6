#pragma once

#include <stdexcept>
#include <string>

// Invalid input detected before any frame is computed.
// field() names the rejected key/argument, what() says what was expected.
class ConfigurationError : public std::runtime_error {
public:
  ConfigurationError(const std::string &field, const std::string &expected)
      : std::runtime_error("invalid '" + field + "': " + expected),
        field_(field) {}

  const std::string &field() const { return field_; }

private:
  std::string field_;
};
