#pragma once
#include <array>
#include <cinttypes>
#include <optional>
#include <string>
#include <string_view>

#include "common.hpp"

namespace eglib {
    // 128-bit identifier stored as four 32-bit words, A first.
    struct Guid {
        std::array<std::uint32_t, 4> words = {};

        // xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx, lowercase.
        auto str() const -> std::string;

        // Accepts 32 hex digits, the dashed 36 char form or the braced 38 char form, any case.
        static auto parse(std::string_view src) noexcept -> std::optional<Guid>;

        static auto canonical(std::string_view src) -> std::optional<std::string>;

        auto is_valid() const noexcept -> bool { return (words[0] | words[1] | words[2] | words[3]) != 0; }

        auto operator<=>(Guid const&) const noexcept = default;
    };
}

template <>
struct fmt::formatter<eglib::Guid> : formatter<std::string> {
    template <typename FormatContext>
    auto format(eglib::Guid const& guid, FormatContext& ctx) const {
        return formatter<std::string>::format(guid.str(), ctx);
    }
};
