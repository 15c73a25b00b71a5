#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace philoglot::core
{

// Raised when a process configuration names a value outside its closed set,
// e.g. an embeddings variant other than "fasttext" or "nlpl".
class ConfigurationError : public std::runtime_error
{
public:
    ConfigurationError(const std::string& what_field, std::string value, std::vector<std::string> valid_options);

    [[nodiscard]] const std::string& value() const noexcept { return value_; }
    [[nodiscard]] const std::vector<std::string>& validOptions() const noexcept { return valid_options_; }

private:
    std::string value_;
    std::vector<std::string> valid_options_;
};

// Raised when a process is used outside its contract (no input document bound).
class ProcessError : public std::logic_error
{
public:
    using std::logic_error::logic_error;
};

} // namespace philoglot::core
