#ifndef TERN_FUNCTION_REF_HPP
#define TERN_FUNCTION_REF_HPP

#include "ulight/function_ref.hpp"

namespace tern {

template <typename F>
using Function_Ref = ulight::Function_Ref<F>;

} // namespace tern

#endif
