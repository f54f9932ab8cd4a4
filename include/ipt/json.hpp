#pragma once

#include <string>
#include <string_view>

namespace ipt {

// Escape for embedding inside a JSON string literal (no surrounding quotes).
std::string json_escape(std::string_view s);

// json_escape wrapped in double quotes.
std::string json_quote(std::string_view s);

} // namespace ipt
