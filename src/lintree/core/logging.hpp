#ifndef LINTREE_CORE_LOGGING_HPP
#define LINTREE_CORE_LOGGING_HPP

#include <memory>
#include <sstream>
#include <type_traits>

#include <spdlog/spdlog.h>

#include <lintree/core/value.hpp>

namespace lintree {

struct engine_config;

// Get the "lintree" logger, creating it (with a colored stdout sink) if the
// application hasn't registered one under that name.
std::shared_ptr<spdlog::logger>
get_logger();

// Apply :config to the "lintree" logger.
void
initialize_logging(engine_config const& config);

namespace detail {

template<class Value>
struct arg_logger
{
    arg_logger(char const* name, Value const& value) : name(name), value(value)
    {
    }

    char const* name;
    Value const& value;
};

template<class Value>
std::ostream&
operator<<(std::ostream& stream, arg_logger<Value> arg)
{
    stream << "\n  " << arg.name << " = " << arg.value;
    return stream;
}

} // namespace detail

// Log a function call (at trace level).
// Nothing is formatted unless trace logging is enabled.
#define LINTREE_LOG_CALL(args)                                                \
    {                                                                         \
        auto logger = lintree::get_logger();                                  \
        if (logger->should_log(spdlog::level::trace))                         \
        {                                                                     \
            std::ostringstream stream;                                        \
            stream << __func__ args;                                          \
            logger->trace(stream.str());                                      \
        }                                                                     \
    }

// Log an argument to a function call.
#define LINTREE_LOG_ARG(arg)                                                  \
    lintree::detail::arg_logger<                                              \
        std::remove_reference<std::remove_const<decltype(arg)>::type>::type>( \
        #arg, arg)

} // namespace lintree

#endif
