#pragma once
#include <cinttypes>
#include <cstddef>
#include <span>
#include <string>

#include "common.hpp"
#include "guid.hpp"

namespace eglib {
    struct ManifestHeader {
        static constexpr std::uint32_t MAGIC = 0x44BEC00C;
        // magic, header_size, two sizes, sha1, stored_as
        static constexpr std::size_t MIN_SIZE = 4 + 4 + 4 + 4 + 20 + 1;
        // MIN_SIZE followed by the container version
        static constexpr std::size_t VERSIONED_SIZE = MIN_SIZE + 4;

        enum StoredAs : std::uint8_t {
            STORED_RAW = 0,
            STORED_COMPRESSED = 1 << 0,
            STORED_ENCRYPTED = 1 << 1,
        };

        std::uint32_t header_size = {};
        std::uint32_t data_size_uncompressed = {};
        std::uint32_t data_size_compressed = {};
        std::string sha1_hash = {};
        std::uint8_t stored_as = {};
        std::int32_t version = {};
        Guid guid = {};
        std::int64_t rolling_hash = {};
        std::uint32_t hash_type = {};

        auto is_compressed() const noexcept -> bool { return stored_as & STORED_COMPRESSED; }

        auto is_encrypted() const noexcept -> bool { return stored_as & STORED_ENCRYPTED; }

        // Number of payload bytes the container declares after the header.
        auto stored_size() const noexcept -> std::size_t {
            return is_compressed() ? data_size_compressed : data_size_uncompressed;
        }

        // Offset of the first payload byte, never inside the fields read above.
        auto payload_offset() const noexcept -> std::size_t {
            return std::max((std::size_t)header_size, version_present() ? VERSIONED_SIZE : MIN_SIZE);
        }

        // Any header larger than MIN_SIZE carries the version.
        auto version_present() const noexcept -> bool { return header_size > MIN_SIZE; }

        // Stored payload bytes, clamped to what the buffer holds.
        auto payload(std::span<char const> data) const noexcept -> std::span<char const>;

        // True when the buffer starts with the binary container magic.
        static auto detect(std::span<char const> data) noexcept -> bool;

        // Buffer must pass detect(). Throws when it can not hold even the minimal header.
        static auto read(std::span<char const> data) -> ManifestHeader;

        bool operator==(ManifestHeader const&) const = default;
    };
}
