#include <lintree/core/config.hpp>

#include <cstdlib>

#include <boost/algorithm/string.hpp>

namespace lintree {

char const log_level_variable[] = "LINTREE_LOG_LEVEL";
char const log_operations_variable[] = "LINTREE_LOG_OPERATIONS";

// An unset variable and one set to the empty string both read as none.
static optional<string>
get_optional_environment_variable(char const* name)
{
    char const* value = std::getenv(name);
    if (!value || *value == '\0')
        return none;
    return string(value);
}

static spdlog::level::level_enum
parse_log_level(string const& text)
{
    auto name = boost::algorithm::to_lower_copy(text);
    auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to off.
    if (level == spdlog::level::off && name != "off")
    {
        LINTREE_THROW(
            invalid_config_value() << variable_name_info(log_level_variable)
                                   << config_value_info(text));
    }
    return level;
}

static bool
parse_flag(string const& variable, string const& text)
{
    auto value = boost::algorithm::to_lower_copy(text);
    if (value == "1" || value == "true" || value == "yes")
        return true;
    if (value == "0" || value == "false" || value == "no")
        return false;
    LINTREE_THROW(
        invalid_config_value() << variable_name_info(variable)
                               << config_value_info(text));
}

engine_config
read_engine_config_from_environment()
{
    engine_config config;
    auto level = get_optional_environment_variable(log_level_variable);
    if (level)
        config.log_level = parse_log_level(*level);
    auto log_operations
        = get_optional_environment_variable(log_operations_variable);
    if (log_operations)
    {
        config.log_operations
            = parse_flag(log_operations_variable, *log_operations);
    }
    return config;
}

} // namespace lintree
