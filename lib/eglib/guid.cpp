#include "guid.hpp"

#include <charconv>

using namespace eglib;

auto Guid::str() const -> std::string {
    auto const& [a, b, c, d] = words;
    return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:04x}{:08x}", a, b >> 16, b & 0xFFFF, c >> 16, c & 0xFFFF, d);
}

auto Guid::parse(std::string_view src) noexcept -> std::optional<Guid> {
    if (src.size() == 38 && src.front() == '{' && src.back() == '}') {
        src = src.substr(1, 36);
    }
    char buffer[32];
    if (src.size() == 36) {
        if (std::count(src.begin(), src.end(), '-') != 4) {
            return std::nullopt;
        }
        for (std::size_t i : {8, 13, 18, 23}) {
            if (src[i] != '-') {
                return std::nullopt;
            }
        }
        std::copy_if(src.begin(), src.end(), buffer, [](char c) { return c != '-'; });
    } else if (src.size() == 32) {
        std::copy(src.begin(), src.end(), buffer);
    } else {
        return std::nullopt;
    }
    auto digits = std::string_view{buffer, 32};
    if (!is_hex_string(digits, 32)) {
        return std::nullopt;
    }
    auto result = Guid{};
    for (std::size_t i = 0; i != 4; ++i) {
        auto beg = digits.data() + i * 8;
        auto [p, ec] = std::from_chars(beg, beg + 8, result.words[i], 16);
        if (ec != std::errc{} || p != beg + 8) {
            return std::nullopt;
        }
    }
    return result;
}

auto Guid::canonical(std::string_view src) -> std::optional<std::string> {
    if (auto guid = parse(src)) {
        return guid->str();
    }
    return std::nullopt;
}
