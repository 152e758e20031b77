#pragma once
#include "tracedmcp/exceptions.hpp"
#include "tracedmcp/types.hpp"

namespace tracedmcp::util::schema
{

// Minimal JSON Schema v7-like validator supporting:
// - type: object, array, string, number, integer, boolean, null (or a list of them)
// - required: [..]
// - properties: { name: { ...nested schema... } }
// - additionalProperties: false
// - items: { ...schema... }
// - minimum / maximum, minLength / maxLength, enum
//
// Throws ValidationError naming the offending path ("arguments.days").

void validate(const Json& schema, const Json& instance);

} // namespace tracedmcp::util::schema
