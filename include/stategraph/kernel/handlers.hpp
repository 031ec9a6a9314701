#pragma once

#include "stategraph/sg_types.hpp"

namespace sg { namespace handlers {

// Registers the built-in `emit:*` handlers with HandlerRegistry:
//   emit:constant  returns parameters.output
//   emit:text      returns parameters.text as a text payload
//   emit:sequence  returns parameters.outputs[visit - 1], repeating the last
//   emit:entry     returns the entry input, or parameters.output without one
//   emit:error     throws with parameters.message
void register_builtin();

}} // namespace sg::handlers
