#pragma once

#include <functional>
#include <iostream>
#include <string_view>

namespace TS {

struct LogHooks {
    std::function<void(std::string_view)> info;
    std::function<void(std::string_view)> error;
};

inline void log_info(LogHooks const& hooks, std::string_view message) {
    if (hooks.info) {
        hooks.info(message);
        return;
    }
    std::cout << message << '\n';
}

inline void log_error(LogHooks const& hooks, std::string_view message) {
    if (hooks.error) {
        hooks.error(message);
        return;
    }
    std::cerr << message << '\n';
}

} // namespace TS
