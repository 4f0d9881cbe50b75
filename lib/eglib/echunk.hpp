#pragma once
#include <cinttypes>
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "advisory.hpp"
#include "guid.hpp"
#include "reader.hpp"

namespace eglib {
    struct Chunk {
        Guid guid = {};
        std::uint64_t hash = {};
        std::string sha_hash = {};
        std::uint8_t group = {};
        std::uint32_t window_size = {};
        std::int64_t file_size = {};

        bool operator==(Chunk const&) const = default;
    };

    struct ChunkDataList {
        std::uint32_t data_size = {};
        std::uint8_t data_version = {};
        std::uint32_t count = {};
        std::vector<Chunk> elements = {};
        // Canonical guid string to index into elements, first occurrence wins.
        std::unordered_map<std::string, std::size_t> lookup = {};

        auto find(Guid const& guid) const -> std::optional<std::size_t>;

        // Bytes to fetch: sum of chunk file sizes.
        auto download_size() const noexcept -> std::uint64_t;

        // Bytes once uncompressed: sum of window sizes, file size where the window is unknown.
        auto install_size() const noexcept -> std::uint64_t;

        // Builds lookup from elements. Repeated guids are recorded and skipped.
        auto index(Advisories& advisories) -> void;

        static auto read(Reader& reader, Advisories& advisories) -> std::optional<ChunkDataList>;

        bool operator==(ChunkDataList const&) const = default;
    };
}
