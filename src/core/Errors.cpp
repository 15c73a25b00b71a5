#include "Errors.hpp"

#include <utility>

namespace philoglot::core
{

namespace
{

std::string formatMessage(const std::string& what_field, const std::string& value,
                          const std::vector<std::string>& valid_options)
{
    std::string msg = "Invalid " + what_field + " '" + value + "'. Available: ";
    for (std::size_t i = 0; i < valid_options.size(); ++i)
    {
        if (i > 0)
            msg += ", ";
        msg += "'" + valid_options[i] + "'";
    }
    msg += ".";
    return msg;
}

} // namespace

ConfigurationError::ConfigurationError(const std::string& what_field, std::string value,
                                       std::vector<std::string> valid_options)
    : std::runtime_error(formatMessage(what_field, value, valid_options))
    , value_(std::move(value))
    , valid_options_(std::move(valid_options))
{
}

} // namespace philoglot::core
