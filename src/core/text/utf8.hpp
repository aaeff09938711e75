#pragma once

#include <string>

namespace shellserver::core::text {

// Returns `bytes` with every ill-formed UTF-8 sequence replaced by U+FFFD.
// Overlong encodings, surrogates and code points above U+10FFFF are ill-formed.
std::string sanitize_utf8(const std::string& bytes);

}  // namespace shellserver::core::text
