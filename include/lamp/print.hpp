#ifndef LAMP_PRINT_HPP
#define LAMP_PRINT_HPP

#include <cstddef>
#include <iosfwd>
#include <span>
#include <string>
#include <string_view>

#include "lamp/util/io.hpp"
#include "lamp/util/source_position.hpp"

#include "lamp/ast.hpp"
#include "lamp/fwd.hpp"

namespace lamp {

/// @brief Returns the line that contains the given index.
/// @param source the source string
/// @param index the index within the source string, in range `[0, source.size()]`
/// @return A line which contains the given `index`.
[[nodiscard]]
std::u8string_view find_line(std::u8string_view source, std::size_t index);

/// @brief Prints a position within a file, consisting of the file name and line/column,
/// followed by a colon.
void print_file_position(
    std::pmr::u8string& out,
    std::u8string_view file,
    const Source_Position& pos,
    bool colors
);

/// @brief Prints the contents of the affected line within `source` as well as position indicators
/// which show the span which is affected by some diagnostic.
/// `pos` shall be within `source`.
void print_affected_line(
    std::pmr::u8string& out,
    std::u8string_view source,
    const Source_Span& pos,
    bool colors
);

/// @brief Prints `diagnostic` in the form `file:line:column: SEVERITY: message [id]`,
/// followed by the affected line within `source`, if the location is not empty.
/// @param source The source of the file that the diagnostic refers to,
/// or an empty string if the source is not available.
void print_diagnostic(
    std::pmr::u8string& out,
    const Diagnostic& diagnostic,
    std::u8string_view source,
    bool colors
);

void print_io_error(
    std::pmr::u8string& out,
    std::u8string_view file,
    IO_Error_Code error,
    bool colors
);

/// @brief Appends a textual representation of `spans` to `out`,
/// such as `Text("a"), Styled(strong)[Text("b")]`.
/// Strings are quoted, and quotes, backslashes, and control characters within them are
/// escaped.
void dump_spans(std::pmr::u8string& out, std::span<const ast::Span> spans);

/// @brief Appends a textual representation of `blocks` to `out`,
/// with one top-level block per line.
void dump_blocks(std::pmr::u8string& out, std::span<const ast::Block> blocks);

/// @brief Appends the path, configuration, and blocks of `document` to `out`.
void dump_document(std::pmr::u8string& out, const Document& document);

std::ostream& operator<<(std::ostream& out, std::u8string_view str);

} // namespace lamp

#endif
