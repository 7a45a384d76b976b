#ifndef LAMP_SERVICES_HPP
#define LAMP_SERVICES_HPP

#include "lamp/util/assert.hpp"
#include "lamp/util/severity.hpp"

#include "lamp/diagnostic.hpp"
#include "lamp/fwd.hpp"

namespace lamp {

struct Logger {
private:
    Severity m_min_severity;

public:
    [[nodiscard]]
    constexpr explicit Logger(Severity min_severity)
    {
        set_min_severity(min_severity);
    }

    [[nodiscard]]
    constexpr Severity get_min_severity() const
    {
        return m_min_severity;
    }

    constexpr void set_min_severity(Severity severity)
    {
        LAMP_ASSERT(severity <= Severity::none);
        m_min_severity = severity;
    }

    [[nodiscard]]
    constexpr bool can_log(Severity severity) const
    {
        return severity >= m_min_severity;
    }

    /// @brief Logs `diagnostic` if its severity is at least the minimum severity.
    void log(const Diagnostic& diagnostic)
    {
        LAMP_ASSERT(severity_is_emittable(diagnostic.severity));
        if (can_log(diagnostic.severity)) {
            (*this)(diagnostic);
        }
    }

    constexpr virtual void operator()(Diagnostic diagnostic) = 0;
};

struct Ignorant_Logger final : Logger {
    using Logger::Logger;

    void operator()(Diagnostic) final { }
};

inline constinit Ignorant_Logger ignorant_logger { Severity::none };

} // namespace lamp

#endif
