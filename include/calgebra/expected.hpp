#pragma once

// CALGEBRA Expected Type
//
// Exposes tl::expected in the calgebra namespace for consistent error handling.
// Every field operation that can fail returns FieldResult<T>, an alias of
// expected<T, FieldError> (see field_error.hpp).
//
// Usage:
//   calgebra::FieldResult<int32_t> value = field->get(instant);
//   if (value.has_value()) {
//       use(*value);
//   } else {
//       report(value.error().describe());
//   }
//
// Monadic operations:
//   result.and_then(f)  - chain on success
//   result.map(f)       - transform value
//   result.or_else(f)   - chain on error
//   result.map_error(f) - transform error

#include <tl/expected.hpp>

namespace calgebra {

using tl::expected;
using tl::make_unexpected;
using tl::unexpect;
using tl::unexpect_t;
using tl::unexpected;

} // namespace calgebra
