#ifndef CHATBRIDGE_UTF8_SANITIZE_HPP
#define CHATBRIDGE_UTF8_SANITIZE_HPP

// nlohmann::json refuses to dump strings that are not valid UTF-8, and text
// coming back from a query engine is not guaranteed to be. These helpers
// replace every ill-formed sequence with U+FFFD.

#include <nlohmann/json.hpp>
#include <string>

namespace utf8_sanitize {

// True if the whole string is well-formed UTF-8 (no overlongs, no surrogates,
// nothing above U+10FFFF).
bool is_valid(const std::string &text);

// Replaces ill-formed sequences with U+FFFD, one replacement per bad lead byte.
std::string sanitize(const std::string &text);

// Sanitizes every string value and object key inside the document, in place.
void sanitize_json(nlohmann::json &document);

} // namespace utf8_sanitize

#endif // CHATBRIDGE_UTF8_SANITIZE_HPP
