#pragma once

#include "result.hpp"

#include <string>
#include <string_view>

namespace codebox::core {

// Standard alphabet with '=' padding
std::string base64_encode(std::string_view data);

// Rejects characters outside the alphabet and malformed padding
Result<std::string, Error> base64_decode(std::string_view encoded);

}  // namespace codebox::core
