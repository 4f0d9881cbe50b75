#pragma once
#include <string_view>

namespace eglib {
    inline constexpr std::string_view DEFAULT_MIME_TYPE = "application/octet-stream";

    // Media type guessed from the extension of a manifest path, case insensitive.
    extern auto mime_type_of(std::string_view path) noexcept -> std::string_view;
}
