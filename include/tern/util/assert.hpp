#ifndef TERN_ASSERT_HPP
#define TERN_ASSERT_HPP

#include "ulight/impl/assert.hpp"

namespace tern {

using ulight::assert_fail;
using ulight::Assertion_Error;
using ulight::Assertion_Error_Type;

#define TERN_ASSERT(...) ULIGHT_ASSERT(__VA_ARGS__)
#define TERN_DEBUG_ASSERT(...) ULIGHT_DEBUG_ASSERT(__VA_ARGS__)

#define TERN_ASSERT_UNREACHABLE(...) ULIGHT_ASSERT_UNREACHABLE(__VA_ARGS__)

} // namespace tern

#endif
