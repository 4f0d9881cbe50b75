#pragma once
#include <cinttypes>
#include <filesystem>
#include <future>
#include <optional>
#include <span>

#include "advisory.hpp"
#include "echunk.hpp"
#include "ecustom.hpp"
#include "efile.hpp"
#include "eheader.hpp"
#include "emeta.hpp"

namespace eglib {
    namespace fs = std::filesystem;

    enum class Format : std::uint8_t {
        Binary,
        Json,
    };

    struct ReadOptions {
        // Raise integrity advisories (hash mismatch, short payload, encryption) as errors.
        bool strict = false;
    };

    struct Manifest {
        Format format = {};
        ManifestHeader header = {};
        std::optional<ManifestMeta> meta = {};
        std::optional<ChunkDataList> chunk_list = {};
        std::optional<FileManifestList> file_list = {};
        std::optional<CustomFields> custom_fields = {};
        Advisories advisories = {};

        // Chunk a part resolved to, null when it did not resolve.
        auto chunk_of(ChunkPart const& part) const noexcept -> Chunk const*;

        auto has_advisory(AdvisoryKind kind) const noexcept -> bool;

        static auto detect(std::span<char const> data) noexcept -> Format;

        // Throws only on input that is neither a binary container nor a JSON object, or in
        // strict mode on an integrity advisory.
        static auto read(std::span<char const> data, ReadOptions const& options = {}) -> Manifest;

        static auto read_file(fs::path const& path, ReadOptions const& options = {}) -> Manifest;

        static auto read_file_async(fs::path path, ReadOptions options = {}) -> std::future<Manifest>;

        bool operator==(Manifest const&) const = default;

    private:
        static auto read_binary(std::span<char const> data) -> Manifest;
    };
}
