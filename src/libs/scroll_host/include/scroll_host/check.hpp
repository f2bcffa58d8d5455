#pragma once

namespace scroll_host {

[[noreturn]] void check_failed(const char* condition, const char* message, const char* file, int line);

} // namespace scroll_host

// Precondition check for caller invariants. Logs at critical level and aborts.
#define LINKED_SCROLL_CHECK(condition, message)                                      \
    do {                                                                             \
        if (!(condition))                                                            \
            ::scroll_host::check_failed(#condition, (message), __FILE__, __LINE__); \
    } while (0)
