#ifndef CSLC_SERVICES_HPP
#define CSLC_SERVICES_HPP

#include "cslc/util/assert.hpp"

#include "cslc/diagnostic.hpp"
#include "cslc/fwd.hpp"

namespace cslc {

struct Logger {
private:
    Severity m_min_severity;

public:
    [[nodiscard]]
    constexpr explicit Logger(Severity min_severity)
    {
        set_min_severity(min_severity);
    }

    virtual ~Logger() = default;

    [[nodiscard]]
    constexpr Severity get_min_severity() const
    {
        return m_min_severity;
    }

    constexpr void set_min_severity(Severity severity)
    {
        CSLC_ASSERT(severity <= Severity::none);
        m_min_severity = severity;
    }

    [[nodiscard]]
    constexpr bool can_log(Severity severity) const
    {
        return severity >= m_min_severity;
    }

    virtual void operator()(Diagnostic diagnostic) = 0;
};

/// @brief A logger which discards every diagnostic.
struct Ignorant_Logger final : Logger {
    using Logger::Logger;

    void operator()(Diagnostic) final { }
};

inline Ignorant_Logger ignorant_logger { Severity::none };

} // namespace cslc

#endif
