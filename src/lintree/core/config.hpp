#ifndef LINTREE_CORE_CONFIG_HPP
#define LINTREE_CORE_CONFIG_HPP

#include <spdlog/common.h>

#include <lintree/core/exception.hpp>

namespace lintree {

// Names of the environment variables that engine_config is read from.
extern char const log_level_variable[];
extern char const log_operations_variable[];

struct engine_config
{
    // the level of the "lintree" logger (defaults to warn)
    optional<spdlog::level::level_enum> log_level;
    // whether diff and merge summaries should be logged (at debug level,
    // defaults to false)
    optional<bool> log_operations;
};

// Read the engine configuration from the environment.
// Variables that aren't set (or are set to the empty string) are left as none.
engine_config
read_engine_config_from_environment();

// Thrown when an environment setting can't be parsed.
LINTREE_DEFINE_EXCEPTION(invalid_config_value)
LINTREE_DEFINE_ERROR_INFO(string, variable_name)
LINTREE_DEFINE_ERROR_INFO(string, config_value)

} // namespace lintree

#endif
