#ifndef LAMP_PARSER_HPP
#define LAMP_PARSER_HPP

#include <cstddef>
#include <string_view>
#include <utility>

#include "lamp/util/assert.hpp"
#include "lamp/util/chars.hpp"
#include "lamp/util/result.hpp"
#include "lamp/util/source_position.hpp"

#include "lamp/fwd.hpp"
#include "lamp/parse_input.hpp"

namespace lamp {

/// @brief A cursor over source text for writing recursive-descent parsers.
/// Unlike `Parse_Input`, a `Parser` is advanced in place,
/// and `attempt()` can be used to undo progress when a parse is abandoned.
struct [[nodiscard]] Parser {
public:
    struct [[nodiscard]] Scoped_Attempt {
    private:
        Parser* m_self;
        const Source_Position m_initial_pos;

    public:
        Scoped_Attempt(Parser& self)
            : m_self { &self }
            , m_initial_pos { self.m_pos }
        {
        }

        Scoped_Attempt(const Scoped_Attempt&) = delete;
        Scoped_Attempt& operator=(const Scoped_Attempt&) = delete;

        void commit()
        {
            LAMP_ASSERT(m_self);
            m_self = nullptr;
        }

        void abort()
        {
            LAMP_ASSERT(m_self);
            m_self->m_pos = m_initial_pos;
            m_self = nullptr;
        }

        ~Scoped_Attempt()
        {
            if (m_self) {
                abort();
            }
        }
    };

private:
    std::u8string_view m_source;
    Source_Position m_pos;

public:
    [[nodiscard]]
    explicit Parser(const Parse_Input& input)
        : m_source { input.source }
        , m_pos { input.pos }
    {
    }

    /// @brief Returns the current position as a `Parse_Input`.
    [[nodiscard]]
    Parse_Input input() const
    {
        return { m_source, m_pos };
    }

    [[nodiscard]]
    Source_Position position() const
    {
        return m_pos;
    }

    /// @brief Returns a `Parse_Error` with the given `message`, located at the current position.
    [[nodiscard]]
    Parse_Error error(std::u8string_view message) const
    {
        return { message, m_pos };
    }

    Scoped_Attempt attempt()
    {
        return Scoped_Attempt { *this };
    }

    /// @brief If `parsed` is a success, moves the parser to the position where it stopped
    /// and returns its value.
    /// Otherwise, returns the error and leaves the position unchanged.
    template <typename T>
    [[nodiscard]]
    Result<T, Parse_Error> consume(Parsed<T>&& parsed)
    {
        if (!parsed) {
            return parsed.error();
        }
        LAMP_ASSERT(parsed->next.source.data() == m_source.data());
        LAMP_ASSERT(parsed->next.pos.begin >= m_pos.begin);
        m_pos = parsed->next.pos;
        return std::move(parsed->value);
    }

    void advance_by(std::size_t n)
    {
        LAMP_DEBUG_ASSERT(m_pos.begin + n <= m_source.size());
        advance(m_pos, m_source.substr(m_pos.begin, n));
    }

    /// @brief Returns all remaining text, from the current position to the end of the source.
    [[nodiscard]]
    std::u8string_view peek_all() const
    {
        LAMP_DEBUG_ASSERT(m_pos.begin <= m_source.size());
        return m_source.substr(m_pos.begin);
    }

    /// @brief Returns the next character.
    /// `eof()` shall be `false`.
    [[nodiscard]]
    char8_t peek() const
    {
        LAMP_ASSERT(!eof());
        return m_source[m_pos.begin];
    }

    [[nodiscard]]
    bool eof() const
    {
        return m_pos.begin == m_source.length();
    }

    [[nodiscard]]
    bool peek(std::u8string_view text) const
    {
        return peek_all().starts_with(text);
    }

    [[nodiscard]]
    bool peek(char8_t c) const
    {
        return !eof() && m_source[m_pos.begin] == c;
    }

    [[nodiscard]]
    bool peek(bool predicate(char8_t)) const
    {
        return !eof() && predicate(m_source[m_pos.begin]);
    }

    [[nodiscard]]
    bool expect(char8_t c)
    {
        if (!peek(c)) {
            return false;
        }
        advance_by(1);
        return true;
    }

    [[nodiscard]]
    bool expect(std::u8string_view text)
    {
        if (!peek(text)) {
            return false;
        }
        advance_by(text.size());
        return true;
    }

    /// @brief Consumes characters while they satisfy `predicate`,
    /// and returns the consumed text.
    /// `predicate` shall only accept ASCII characters.
    std::u8string_view match_while(bool predicate(char8_t))
    {
        const std::size_t initial = m_pos.begin;
        while (peek(predicate)) {
            LAMP_DEBUG_ASSERT(is_ascii(m_source[m_pos.begin]));
            advance_by(1);
        }
        return m_source.substr(initial, m_pos.begin - initial);
    }

    /// @brief Matches a name, which is an ASCII letter,
    /// followed by any amount of ASCII letters, digits, `-`, or `_`.
    /// @returns The name, or an empty string if there is no name at the current position.
    std::u8string_view match_name()
    {
        if (!peek(is_name_start)) {
            return {};
        }
        return match_while(is_name_continuation);
    }
};

} // namespace lamp

#endif
