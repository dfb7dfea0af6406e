#pragma once
#include <optional>
#include <string>
#include <string_view>

// Standard alphabet with '=' padding.
std::string base64_encode(std::string_view bytes);

// Whitespace is skipped. Returns std::nullopt on bad length, characters or padding.
std::optional<std::string> base64_decode(std::string_view text);
