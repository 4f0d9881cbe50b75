#pragma once
#include <array>
#include <cinttypes>
#include <cstddef>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

#include "advisory.hpp"
#include "common.hpp"
#include "guid.hpp"

namespace eglib {
    // Ok: value read. Exhausted: not enough bytes left, value untouched, cursor unchanged.
    // Invalid: bytes present but they can not describe a legal value.
    enum class ReadStatus : std::uint8_t {
        Ok,
        Exhausted,
        Invalid,
    };

    struct SectionHeader {
        static constexpr std::size_t MIN_SIZE = sizeof(std::uint32_t) + sizeof(std::uint8_t);
        static constexpr std::size_t MAX_SIZE = 1 * GiB;

        std::size_t start = {};
        std::uint32_t data_size = {};
        std::uint8_t data_version = {};

        auto end() const noexcept -> std::size_t { return start + data_size; }
    };

    struct Reader {
        constexpr Reader() noexcept = default;

        explicit Reader(std::span<char const> data) noexcept : data_(data), pos_(0), end_(data.size()) {}

        // Absolute offset inside the underlying buffer.
        auto tell() const noexcept -> std::size_t { return pos_; }

        auto remains() const noexcept -> std::size_t { return end_ - pos_; }

        // True when the declared end of this reader lies past the bytes that exist.
        auto truncated() const noexcept -> bool { return truncated_; }

        // Status to report when remains() hit zero: clean stop unless bytes are missing.
        auto stop_status() const noexcept -> ReadStatus {
            return truncated_ ? ReadStatus::Exhausted : ReadStatus::Ok;
        }

        auto skip(std::size_t count) noexcept -> ReadStatus;

        // Moves forward to an absolute offset, clamped to the end of this reader.
        auto seek(std::size_t pos) noexcept -> ReadStatus;

        template <typename T>
            requires(std::is_integral_v<T> && !std::is_same_v<T, bool>)
        auto read(T& value) noexcept -> ReadStatus {
            if (remains() < sizeof(T)) {
                return ReadStatus::Exhausted;
            }
            value = load_le<T>(reinterpret_cast<std::uint8_t const*>(data_.data() + pos_));
            pos_ += sizeof(T);
            return ReadStatus::Ok;
        }

        template <typename T>
            requires(std::is_enum_v<T>)
        auto read(T& value) noexcept -> ReadStatus {
            auto raw = std::underlying_type_t<T>{};
            auto status = read(raw);
            if (status == ReadStatus::Ok) {
                value = static_cast<T>(raw);
            }
            return status;
        }

        auto read(bool& value) noexcept -> ReadStatus;

        // Four little-endian 32-bit words.
        auto read(Guid& value) noexcept -> ReadStatus;

        // i32 length prefix: positive is 8-bit chars, negative is UTF-16LE code units.
        // Trailing NULs are dropped.
        auto read(std::string& value) -> ReadStatus;

        auto read(std::vector<std::string>& value) -> ReadStatus;

        // Reads count raw bytes and renders them as lowercase hex.
        auto read_digest(std::string& value, std::size_t count) -> ReadStatus;

        // Reads the data_size/data_version pair of a section and returns a reader bound
        // to the declared section end (clamped to the available bytes).
        auto section(SectionHeader& header, Reader& body) noexcept -> ReadStatus;

        // Reads an i32 count and then count items; every item occupies at least min_size bytes.
        template <typename T, typename Func>
        auto read_array(std::vector<T>& out, std::size_t min_size, Func&& func) -> ReadStatus {
            auto start = pos_;
            auto count = std::int32_t{};
            if (auto status = read(count); status != ReadStatus::Ok) {
                return status;
            }
            if (count < 0) {
                pos_ = start;
                return ReadStatus::Invalid;
            }
            out.clear();
            out.reserve(std::min((std::size_t)count, remains() / std::max(min_size, std::size_t{1})));
            for (std::int32_t i = 0; i != count; ++i) {
                auto item = T{};
                if (auto status = func(*this, item); status != ReadStatus::Ok) {
                    return status;
                }
                out.push_back(std::move(item));
            }
            return ReadStatus::Ok;
        }

        template <typename Range, typename Func>
        auto read_each(Range& items, Func&& func) -> ReadStatus {
            for (auto& item : items) {
                if (auto status = func(*this, item); status != ReadStatus::Ok) {
                    return status;
                }
            }
            return ReadStatus::Ok;
        }

    private:
        std::span<char const> data_ = {};
        std::size_t pos_ = {};
        std::size_t end_ = {};
        bool truncated_ = {};
    };

    // One version gated step of a section. Steps run in order until one is newer than the
    // section, the section runs out of bytes or a step fails.
    template <typename T>
    struct Field {
        std::uint8_t since;
        ReadStatus (*read)(Reader& reader, T& out);
    };

    template <typename T, std::size_t N>
    auto read_fields(Reader& reader, std::uint8_t version, T& out, std::array<Field<T>, N> const& fields)
        -> ReadStatus {
        for (auto const& field : fields) {
            if (field.since > version) {
                break;
            }
            if (reader.remains() == 0) {
                return reader.stop_status();
            }
            if (auto status = field.read(reader, out); status != ReadStatus::Ok) {
                return status;
            }
        }
        return ReadStatus::Ok;
    }

    // Opens the section at the cursor. A failure is recorded against name and leaves the
    // cursor in place.
    extern auto open_section(
        Reader& reader, std::string_view name, SectionHeader& header, Reader& body, Advisories& advisories)
        -> bool;

    // Records how reading a section body ended and moves the cursor to the declared end.
    extern auto close_section(Reader& reader,
                              std::string_view name,
                              SectionHeader const& header,
                              Reader const& body,
                              ReadStatus status,
                              Advisories& advisories) -> void;
}
