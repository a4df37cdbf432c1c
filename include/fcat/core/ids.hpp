#pragma once

#include <string>
#include <string_view>

namespace fcat::core {

/// Fresh random (version 4) UUID in canonical lowercase hyphenated form.
std::string generate_id();

/// True for a canonical 8-4-4-4-12 hex UUID string.
bool is_valid_id(std::string_view candidate);

} // namespace fcat::core
