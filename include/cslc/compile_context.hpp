#ifndef CSLC_COMPILE_CONTEXT_HPP
#define CSLC_COMPILE_CONTEXT_HPP

#include <concepts>
#include <memory_resource>
#include <string>
#include <string_view>

#include "cslc/diagnostic.hpp"
#include "cslc/fwd.hpp"
#include "cslc/services.hpp"

namespace cslc {

/// @brief Services and memory shared by all stages of compiling one style.
/// A `Compile_Context` is owned by a single compilation and never shared between threads.
struct Compile_Context {
private:
    std::pmr::memory_resource* m_memory;
    Logger& m_logger;

public:
    [[nodiscard]]
    Compile_Context(std::pmr::memory_resource* memory, Logger& logger)
        : m_memory { memory }
        , m_logger { logger }
    {
    }

    /// @brief Returns the memory resource from which all compiled structures are allocated.
    [[nodiscard]]
    std::pmr::memory_resource* get_memory() const
    {
        return m_memory;
    }

    [[nodiscard]]
    Logger& get_logger() const
    {
        return m_logger;
    }

    [[nodiscard]]
    bool emits(Severity severity) const
    {
        return m_logger.can_log(severity);
    }

    /// @brief Emits a diagnostic whose message is the concatenation of `message_parts`,
    /// if the logger accepts diagnostics of the given `severity`.
    template <std::convertible_to<std::u8string_view>... Parts>
    void try_log(Severity severity, std::u8string_view id, const Parts&... message_parts) const
    {
        if (!emits(severity)) {
            return;
        }
        std::pmr::u8string message { m_memory };
        (message.append(std::u8string_view(message_parts)), ...);
        m_logger(Diagnostic { .severity = severity, .id = id, .message = message });
    }

    template <std::convertible_to<std::u8string_view>... Parts>
    void try_debug(std::u8string_view id, const Parts&... message_parts) const
    {
        try_log(Severity::debug, id, message_parts...);
    }

    template <std::convertible_to<std::u8string_view>... Parts>
    void try_warning(std::u8string_view id, const Parts&... message_parts) const
    {
        try_log(Severity::warning, id, message_parts...);
    }

    template <std::convertible_to<std::u8string_view>... Parts>
    void try_error(std::u8string_view id, const Parts&... message_parts) const
    {
        try_log(Severity::error, id, message_parts...);
    }
};

} // namespace cslc

#endif
