#ifndef LAMP_FUNCTION_REF_HPP
#define LAMP_FUNCTION_REF_HPP

#include "ulight/const.hpp"
#include "ulight/function_ref.hpp"

namespace lamp {

template <typename F>
using Function_Ref = ulight::Function_Ref<F>;

using ulight::const_v;

} // namespace lamp

#endif
