#pragma once

#include <string>

#include <ddb/attribute_value.h>
#include <ddb/error.h>
#include <ddb/value.h>

namespace ddb {

// Conversion between plain JSON values and DynamoDB attribute values.
//
// Every function here is pure: no I/O, no shared state, safe to call from
// several threads on independent inputs. Failures throw CodecError and the
// whole value fails; no field is ever dropped or repaired.

// --- DynamoDB -> plain -------------------------------------------------

// S, B and BS carry their text verbatim (base64 stays base64). N and NS
// become Integer unless the literal has a '.' or an exponent marker, in
// which case they become Double. SS, NS and BS become plain arrays.
Value unmarshall_value(const AttributeValue& value, const std::string& path = "");

// Same, starting from the JSON form of a single attribute value.
Value unmarshall_value(const Value& tagged_json);

// Decode an item document: an object of attribute values, optionally inside
// a {"Item": {...}} envelope.
Value unmarshall_item(const Value& document);

// Default DynamoDB -> plain entry point. Item oriented: same as
// unmarshall_item. Use unmarshall_value for a bare attribute value.
Value from_tagged(const Value& document);

// --- plain -> DynamoDB -------------------------------------------------

// Arrays always become L; SS, NS and BS are never produced.
AttributeValue marshall_value(const Value& value, const std::string& path = "");

// Encode an item (a JSON object), optionally inside {"Item": {...}}.
Value marshall_item(const Value& item, bool wrap_item);

// Objects are encoded as items; any other value becomes a single attribute
// value in JSON form and `wrap_item` does not apply.
Value to_tagged(const Value& input, bool wrap_item);

// --- envelope ----------------------------------------------------------

// True iff `document` is exactly {"Item": <object>}.
bool is_item_envelope(const Value& document);

// The inner object of an envelope, or `document` unchanged.
Value unwrap_item(const Value& document);

Value wrap_item(const Value& item);

}  // namespace ddb
