#pragma once
#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cinttypes>
#include <cstddef>
#include <cstring>
#include <filesystem>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

#ifdef _MSC_VER
#    define __PRETTY_FUNCTION__ __FUNCTION__
#endif

#define eglib_paste_impl(x, y) x##y
#define eglib_paste(x, y) eglib_paste_impl(x, y)

#define eglib_error(msg) ::eglib::throw_error(__PRETTY_FUNCTION__, msg)

#define eglib_assert(...)                                                 \
    do {                                                                  \
        if (!(__VA_ARGS__)) [[unlikely]] {                                \
            ::eglib::throw_error(__PRETTY_FUNCTION__, ": " #__VA_ARGS__); \
        }                                                                 \
    } while (false)

#define eglib_trace(...)                                 \
    ::eglib::ErrorTrace eglib_paste(_trace_, __LINE__) { \
        [&] { ::eglib::push_error_msg(__VA_ARGS__); }    \
    }

namespace eglib {
    inline constexpr std::size_t KiB = 1024;
    inline constexpr std::size_t MiB = KiB * 1024;
    inline constexpr std::size_t GiB = MiB * 1024;

    namespace fs = std::filesystem;
    using namespace std::literals::string_view_literals;

    [[noreturn]] extern void throw_error(char const* from, char const* msg);

    [[noreturn]] inline void throw_error(char const* from, std::string const& msg) {
        throw_error(from, msg.c_str());
    }

    [[noreturn]] inline void throw_error(char const* from, std::error_code const& ec) {
        throw_error(from, (": " + ec.message()).c_str());
    }

    using error_stack_t = std::vector<std::string>;

    extern error_stack_t& error_stack() noexcept;

    extern void push_error_msg(char const* fmt, ...) noexcept;

    template <typename Func>
    struct ErrorTrace : Func {
        inline ErrorTrace(Func&& func) noexcept : Func(std::move(func)) {}
        inline ~ErrorTrace() noexcept {
            if (std::uncaught_exceptions()) {
                Func::operator()();
            }
        }
    };

    // Lowercase hex of raw bytes, two characters per byte.
    extern auto to_hex(std::span<std::uint8_t const> src) -> std::string;

    extern auto from_hex(std::string_view src, std::span<std::uint8_t> dst) noexcept -> bool;

    extern auto clean_path(std::string path) noexcept -> std::string;

    extern auto trim_nul(std::string str) noexcept -> std::string;

    constexpr auto str_eq_ci = [](std::string_view l, std::string_view r) noexcept -> bool {
        constexpr auto lower = [](std::uint8_t c) noexcept -> std::uint8_t {
            return (c >= 'A' && c <= 'Z') ? ((c - 'A') + 'a') : c;
        };
        return l.size() == r.size() && std::equal(l.begin(), l.end(), r.begin(), r.end(), [&](auto l, auto r) {
                   return lower(l) == lower(r);
               });
    };

    inline auto is_hex_string(std::string_view str, std::size_t size) noexcept -> bool {
        return str.size() == size && std::all_of(str.begin(), str.end(), [](char c) {
                   return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
               });
    }

    template <typename T>
        requires(std::is_integral_v<T>)
    inline auto load_le(std::uint8_t const* src) noexcept -> T {
        using U = std::make_unsigned_t<T>;
        auto result = U{};
        for (std::size_t i = 0; i != sizeof(T); ++i) {
            result |= static_cast<U>(static_cast<U>(src[i]) << (8 * i));
        }
        return static_cast<T>(result);
    }
}
