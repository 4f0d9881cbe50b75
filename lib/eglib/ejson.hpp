#pragma once
#include <cinttypes>
#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <type_traits>
#include <vector>

#include "emanifest.hpp"

namespace eglib {
    // Decodes a JSON manifest. Throws when the text is not JSON or the root is not an object.
    extern auto read_json_manifest(std::span<char const> data) -> Manifest;

    // Three decimal digits per byte, first byte least significant. Decodes at most size bytes.
    extern auto blob_to_bytes(std::string_view blob, std::size_t size) -> std::optional<std::vector<std::uint8_t>>;

    template <typename T>
        requires(std::is_integral_v<T>)
    inline auto blob_to(std::string_view blob) -> std::optional<T> {
        auto bytes = blob_to_bytes(blob, sizeof(T));
        if (!bytes) {
            return std::nullopt;
        }
        using U = std::make_unsigned_t<T>;
        auto result = U{};
        for (std::size_t i = 0; i != bytes->size(); ++i) {
            result |= static_cast<U>(static_cast<U>((*bytes)[i]) << (8 * i));
        }
        return static_cast<T>(result);
    }
}
