#ifndef TERN_FWD_HPP
#define TERN_FWD_HPP

#include "tern/settings.hpp"

namespace tern {

/// @brief The default underlying type for scoped enumerations.
using Default_Underlying = unsigned char;

#define TERN_ENUM_STRING_CASE8(...)                                                                \
    case __VA_ARGS__: return u8## #__VA_ARGS__

struct AST_Instruction;
enum struct AST_Instruction_Type : Default_Underlying;
template <typename>
struct Basic_Transparent_String_View_Equals;
template <typename>
struct Basic_Transparent_String_View_Hash;
struct Builtin_Handler_Set;
struct Collecting_Logger;
struct Context;
struct Deferred_Error;
enum struct Deferred_Error_Kind : Default_Underlying;
struct Diagnostic;
struct Collected_Diagnostic;
struct Directive_Handler;
struct Empty_Fallback;
struct Error_Fallback;
struct Error_Tag;
struct Evaluation_Error;
enum struct Evaluation_Error_Kind : Default_Underlying;
struct Evaluation_Options;
using Float = double;
struct Function_Registry;
struct Handler_Error;
enum struct Handler_Error_Kind : Default_Underlying;
struct Handler_Map;
struct Ignorant_Logger;
using Integer = long long;
struct Invocation;
struct Literal;
enum struct Literal_Kind : Default_Underlying;
struct Logger;
struct Printing_Logger;
struct Reg_Exp;
enum struct Reg_Exp_Error_Code : Default_Underlying;
enum struct Reg_Exp_Status : Default_Underlying;
template <typename, typename>
struct Result;
enum struct Severity : Default_Underlying;
struct Source_Fallback;
struct Source_Position;
struct Source_Span;
struct Success_Tag;

namespace ast {

struct Argument;
struct Call;
struct Node;
struct Text;

} // namespace ast

using Transparent_String_View_Equals8 = Basic_Transparent_String_View_Equals<char8_t>;
using Transparent_String_View_Hash8 = Basic_Transparent_String_View_Hash<char8_t>;

} // namespace tern

#endif
