// log.h - Diagnostic logging helpers

#pragma once

#include <vdom/vdom_config.h>

#include <iostream>
#include <source_location>
#include <string_view>

namespace vdom {

namespace detail {

inline void log_warning(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if VDOM_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

} // namespace detail

} // namespace vdom
