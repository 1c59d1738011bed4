#include "core/types.hpp"

#include <type_traits>

// Implementation is entirely in the header for this simple types module.
// This file exists for build system compatibility.

namespace atrium {

static_assert(sizeof(Key) == 8, "Key should be a 64 bit integer");
static_assert(std::is_trivially_copyable_v<Timestamp>, "Timestamp should be trivially copyable");

} // namespace atrium
