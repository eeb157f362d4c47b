#pragma once

#include <optional>
#include <string>

#include "prefstore/codec.hpp"

namespace prefstore {
namespace scalar_text {

// Decimal integers become int64 (or uint64 above the int64 range); decimal and
// exponent forms plus inf/nan become double.
std::optional<Document> parse_number(const std::string &text);

// "true"/"false" in any letter case.
std::optional<bool> parse_bool(const std::string &text);

// Textual form of a boolean, number or string scalar that parse_number and
// parse_bool read back to the same value.
std::string format(const Document &scalar);

// True when text would be read back as something other than a string.
bool is_ambiguous(const std::string &text);

}  // namespace scalar_text
}  // namespace prefstore
