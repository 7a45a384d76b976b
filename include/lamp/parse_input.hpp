#ifndef LAMP_PARSE_INPUT_HPP
#define LAMP_PARSE_INPUT_HPP

#include <cstddef>
#include <memory_resource>
#include <optional>
#include <string_view>

#include "lamp/util/assert.hpp"
#include "lamp/util/function_ref.hpp"
#include "lamp/util/result.hpp"
#include "lamp/util/source_position.hpp"

#include "lamp/fwd.hpp"
#include "lamp/services.hpp"
#include "lamp/settings.hpp"

namespace lamp {

/// @brief A position within some source text.
/// Parsers receive a `Parse_Input` and report the `Parse_Input` at which they stopped,
/// which allows them to be chained and retried without mutating any shared state.
struct Parse_Input {
    /// @brief The complete source text, not only the text which remains to be parsed.
    std::u8string_view source;
    Source_Position pos {};

    [[nodiscard]]
    constexpr std::u8string_view remaining() const
    {
        LAMP_DEBUG_ASSERT(pos.begin <= source.size());
        return source.substr(pos.begin);
    }

    [[nodiscard]]
    constexpr bool eof() const
    {
        return pos.begin == source.size();
    }

    /// @brief Returns the next character.
    /// `eof()` shall be `false`.
    [[nodiscard]]
    constexpr char8_t peek() const
    {
        LAMP_ASSERT(!eof());
        return source[pos.begin];
    }

    /// @brief Returns this input, advanced by `n` code units.
    [[nodiscard]]
    constexpr Parse_Input advanced(std::size_t n) const
    {
        LAMP_ASSERT(pos.begin + n <= source.size());
        Parse_Input result = *this;
        advance(result.pos, source.substr(pos.begin, n));
        return result;
    }

    /// @brief Returns the source text between this input and `next`.
    /// `next` shall be an input over the same source which does not precede this input.
    [[nodiscard]]
    constexpr std::u8string_view capture(const Parse_Input& next) const
    {
        LAMP_ASSERT(next.pos.begin >= pos.begin);
        return source.substr(pos.begin, next.pos.begin - pos.begin);
    }

    /// @brief Returns the span of source text between this input and `next`.
    [[nodiscard]]
    constexpr Source_Span span_to(const Parse_Input& next) const
    {
        return Source_Span::between(pos, next.pos);
    }

    /// @brief Returns an input which ends at `end`,
    /// i.e. whose `source` is truncated to the first `end` code units.
    /// Positions remain comparable with those of the original input.
    [[nodiscard]]
    constexpr Parse_Input truncated(std::size_t end) const
    {
        LAMP_ASSERT(end >= pos.begin && end <= source.size());
        return { source.substr(0, end), pos };
    }
};

/// @brief The reason why a parser did not match.
/// Messages are static strings, so that failing is cheap and failures can be freely discarded.
struct Parse_Error {
    std::u8string_view message;
    Source_Position pos;
};

template <typename T>
struct Parse_Success {
    T value;
    Parse_Input next;
};

template <typename T>
using Parsed = Result<Parse_Success<T>, Parse_Error>;

/// @brief A non-owning reference to a parser which produces values of type `T`.
template <typename T>
using Parser_Ref = Function_Ref<Parsed<T>(const Parse_Input&)>;

struct Parse_Options {
    /// @brief The name of the file being parsed, used in diagnostics.
    std::u8string_view file_name;
    /// @brief Receives diagnostics for directives which could not be applied,
    /// and for other recoverable problems.
    Logger& logger = ignorant_logger;
    /// @brief The maximum depth to which directive bodies and braces are parsed recursively.
    std::size_t max_nesting_depth = default_max_nesting_depth;
    /// @brief The source of memory for all tree nodes and intermediate results.
    std::pmr::memory_resource* memory = std::pmr::get_default_resource();
    /// @brief If set, the input is the body of a directive at this location in the document.
    /// Positions within a body are relative to the body text,
    /// so diagnostics and placeholders within it are located at the outermost enclosing
    /// directive instead.
    std::optional<Source_Span> body_origin = {};
};

/// @brief Enters one level of recursive body parsing for the lifetime of the scope.
/// If `options` are not yet those of a directive body,
/// the body's directive at `origin` becomes their `body_origin`.
struct [[nodiscard]] Nested_Body_Scope {
private:
    std::size_t& m_depth;
    Parse_Options& m_options;
    const std::optional<Source_Span> m_previous_origin;

public:
    Nested_Body_Scope(std::size_t& depth, Parse_Options& options, const Source_Span& origin)
        : m_depth { depth }
        , m_options { options }
        , m_previous_origin { options.body_origin }
    {
        ++m_depth;
        if (!m_options.body_origin) {
            m_options.body_origin = origin;
        }
    }

    Nested_Body_Scope(const Nested_Body_Scope&) = delete;
    Nested_Body_Scope& operator=(const Nested_Body_Scope&) = delete;

    ~Nested_Body_Scope()
    {
        --m_depth;
        m_options.body_origin = m_previous_origin;
    }
};

} // namespace lamp

#endif
