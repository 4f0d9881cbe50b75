#include "common.hpp"

#include <cstdarg>
#include <cstdio>

using namespace eglib;

void eglib::throw_error(char const* from, char const* msg) {
    // break point goes here
    throw std::runtime_error(std::string(from) + msg);
}

error_stack_t& eglib::error_stack() noexcept {
    thread_local error_stack_t instance = {};
    return instance;
}

void eglib::push_error_msg(char const* fmt, ...) noexcept {
    va_list args;
    char buffer[4096];
    int result;
    va_start(args, fmt);
    result = vsnprintf(buffer, 4096, fmt, args);
    va_end(args);
    if (result >= 0) {
        try {
            error_stack().push_back({buffer, buffer + std::min(result, 4095)});
        } catch (std::bad_alloc const&) {
            // unwinding already, drop the message
        }
    }
}

auto eglib::to_hex(std::span<std::uint8_t const> src) -> std::string {
    static constexpr char digits[] = "0123456789abcdef";
    auto result = std::string(src.size() * 2, '\0');
    for (std::size_t i = 0; auto c : src) {
        result[i++] = digits[c >> 4];
        result[i++] = digits[c & 0xF];
    }
    return result;
}

auto eglib::from_hex(std::string_view src, std::span<std::uint8_t> dst) noexcept -> bool {
    constexpr auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    if (src.size() != dst.size() * 2) {
        return false;
    }
    for (std::size_t i = 0; i != dst.size(); ++i) {
        auto hi = nibble(src[i * 2]);
        auto lo = nibble(src[i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        dst[i] = (std::uint8_t)((hi << 4) | lo);
    }
    return true;
}

auto eglib::clean_path(std::string path) noexcept -> std::string {
    std::replace(path.begin(), path.end(), '\\', '/');
    return path;
}

auto eglib::trim_nul(std::string str) noexcept -> std::string {
    while (!str.empty() && str.back() == '\0') {
        str.pop_back();
    }
    return str;
}
