#ifndef LAMP_FWD_HPP
#define LAMP_FWD_HPP

namespace lamp {

/// @brief The default underlying type for scoped enumerations.
using Default_Underlying = unsigned char;

struct Blank_Line;
struct Block_Directive_Context;
struct Builtin_Directive_Set;
struct Collecting_Logger;
enum struct Context_Requirement : bool;
struct Delimited_Text;
enum struct Delimiter_Kind : bool;
struct Diagnostic;
struct Directive_Context_Base;
struct Document;
struct Document_Cursor;
struct Document_Tree;
struct Ignorant_Logger;
enum struct IO_Error_Code : Default_Underlying;
struct Logger;
struct Markup_Parser;
struct Parse_Error;
struct Parse_Input;
struct Parse_Options;
struct Parsed_Directive;
struct Part;
struct Part_Key;
enum struct Part_Kind : bool;
struct Recursive_Parsers;
struct Recursive_Span_Parser;
template <typename, typename>
struct Result;
enum struct Severity : Default_Underlying;
struct Source_Position;
struct Source_Span;
struct Span_Builder;
struct Span_Directive_Context;
enum struct Start_Char_Policy : bool;
struct Template_Parser;
struct Text_Builder;
struct Text_Delimiter;
struct Trigger_Set;

namespace ast {

struct Block;
struct Block_Placeholder;
struct Block_Sequence;
struct Invalid_Block;
struct Invalid_Span;
struct Literal_Block;
struct Paragraph;
struct Reference;
template <typename>
struct Resolver;
struct Retraction;
struct Span;
struct Span_Placeholder;
struct Styled;
struct Text;

} // namespace ast

} // namespace lamp

#endif
