#pragma once
#include <cinttypes>
#include <string>
#include <string_view>
#include <vector>

#include "common.hpp"

namespace eglib {
    enum class AdvisoryKind : std::uint8_t {
        HashMismatch,
        InflateShortfall,
        PayloadShortfall,
        SizeMismatch,
        Encrypted,
        SectionMissing,
        SectionTruncated,
        SectionInvalid,
        UnresolvedChunk,
        DuplicateChunk,
    };

    // Non fatal condition found while decoding. The result is still usable.
    struct Advisory {
        AdvisoryKind kind = {};
        std::string message = {};

        // Conditions about the payload as a whole rather than a single record.
        auto is_integrity() const noexcept -> bool;

        bool operator==(Advisory const&) const = default;
    };

    using Advisories = std::vector<Advisory>;

    template <typename... Args>
    inline auto advise(Advisories& out, AdvisoryKind kind, fmt::format_string<Args...> format, Args&&... args)
        -> void {
        out.push_back(Advisory{.kind = kind, .message = fmt::format(format, std::forward<Args>(args)...)});
    }

    extern auto to_string(AdvisoryKind kind) noexcept -> std::string_view;
}

template <>
struct fmt::formatter<eglib::AdvisoryKind> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(eglib::AdvisoryKind kind, FormatContext& ctx) const {
        return formatter<std::string_view>::format(eglib::to_string(kind), ctx);
    }
};
