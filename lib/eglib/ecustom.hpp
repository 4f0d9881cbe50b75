#pragma once
#include <cinttypes>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "advisory.hpp"
#include "reader.hpp"

namespace eglib {
    struct CustomFields {
        std::uint32_t data_size = {};
        std::uint8_t data_version = {};
        std::uint32_t count = {};
        std::vector<std::pair<std::string, std::string>> fields = {};

        auto find(std::string_view key) const noexcept -> std::string const*;

        // Older manifests end before this section, which yields nullopt without an advisory.
        static auto read(Reader& reader, Advisories& advisories) -> std::optional<CustomFields>;

        bool operator==(CustomFields const&) const = default;
    };
}
