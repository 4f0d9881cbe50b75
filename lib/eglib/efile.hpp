#pragma once
#include <cinttypes>
#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "advisory.hpp"
#include "echunk.hpp"
#include "guid.hpp"
#include "reader.hpp"

namespace eglib {
    struct ChunkPart {
        // data_size, parent_guid, offset and size.
        static constexpr std::size_t MIN_SIZE = 28;

        // Serialized size of the part record, not of the chunk.
        std::uint32_t data_size = {};
        Guid parent_guid = {};
        std::uint32_t offset = {};
        std::uint32_t size = {};
        // Index into ChunkDataList::elements, absent when parent_guid is not in the catalog.
        std::optional<std::size_t> chunk = {};

        bool operator==(ChunkPart const&) const = default;
    };

    struct FileManifest {
        enum Flags : std::uint8_t {
            FLAG_NONE = 0,
            FLAG_READ_ONLY = 1 << 0,
            FLAG_COMPRESSED = 1 << 1,
            FLAG_UNIX_EXECUTABLE = 1 << 2,
        };

        std::string filename = {};
        std::string symlink_target = {};
        std::string sha_hash = {};
        std::uint8_t file_meta_flags = {};
        std::vector<std::string> install_tags = {};
        std::vector<ChunkPart> chunk_parts = {};
        std::uint64_t file_size = {};
        std::string mime_type = {};
        std::string md5 = {};
        std::string sha256 = {};

        auto is_read_only() const noexcept -> bool { return file_meta_flags & FLAG_READ_ONLY; }

        auto is_compressed() const noexcept -> bool { return file_meta_flags & FLAG_COMPRESSED; }

        auto is_unix_executable() const noexcept -> bool { return file_meta_flags & FLAG_UNIX_EXECUTABLE; }

        auto is_symlink() const noexcept -> bool { return !symlink_target.empty(); }

        // Install tags joined with ';', empty for untagged files.
        auto tags() const -> std::string;

        // Points parts at the catalog, sums the file size and fills a missing mime type.
        auto resolve(ChunkDataList const* chunks, Advisories& advisories) -> void;

        struct Match {
            std::optional<std::regex> path;
            std::optional<std::regex> tags;

            auto operator()(FileManifest const& file) const -> bool;
        };

        bool operator==(FileManifest const&) const = default;
    };

    struct FileManifestList {
        std::uint32_t data_size = {};
        std::uint8_t data_version = {};
        std::uint32_t count = {};
        std::vector<FileManifest> files = {};

        auto resolve(ChunkDataList const* chunks, Advisories& advisories) -> void;

        // chunks may be null when the chunk list could not be read, every part stays unresolved.
        static auto read(Reader& reader, ChunkDataList const* chunks, Advisories& advisories)
            -> std::optional<FileManifestList>;

        bool operator==(FileManifestList const&) const = default;
    };
}
