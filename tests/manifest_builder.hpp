#pragma once
#include <miniz.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <digestpp.hpp>
#include <eglib/echunk.hpp>
#include <eglib/efile.hpp>
#include <eglib/eheader.hpp>
#include <eglib/emeta.hpp>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace eglib::tests {
    // Little endian byte writer for hand made manifests.
    struct Bytes {
        std::vector<char> data = {};

        template <typename T>
            requires(std::is_integral_v<T>)
        auto put(T value) -> Bytes& {
            using U = std::make_unsigned_t<T>;
            auto v = static_cast<U>(value);
            for (std::size_t i = 0; i != sizeof(T); ++i) {
                data.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
            }
            return *this;
        }

        auto put_raw(std::span<char const> bytes) -> Bytes& {
            data.insert(data.end(), bytes.begin(), bytes.end());
            return *this;
        }

        auto put_hex(std::string_view hex, std::size_t size) -> Bytes& {
            auto bytes = std::vector<std::uint8_t>(size);
            if (!hex.empty() && !from_hex(hex, bytes)) {
                throw std::runtime_error("bad hex in test data: " + std::string(hex));
            }
            for (auto b : bytes) {
                put(b);
            }
            return *this;
        }

        auto put_string(std::string_view value) -> Bytes& {
            if (value.empty()) {
                return put(std::int32_t{0});
            }
            put((std::int32_t)value.size() + 1);
            put_raw(value);
            return put(char{0});
        }

        auto put_utf16(std::u16string_view value) -> Bytes& {
            put(-(std::int32_t)value.size() - 1);
            for (auto c : value) {
                put((std::uint16_t)c);
            }
            return put(std::uint16_t{0});
        }

        auto put_strings(std::vector<std::string> const& values) -> Bytes& {
            put((std::int32_t)values.size());
            for (auto const& value : values) {
                put_string(value);
            }
            return *this;
        }

        auto put_guid(Guid const& guid) -> Bytes& {
            for (auto word : guid.words) {
                put(word);
            }
            return *this;
        }

        auto patch_u32(std::size_t offset, std::uint32_t value) -> void {
            for (std::size_t i = 0; i != 4; ++i) {
                data.at(offset + i) = static_cast<char>((value >> (8 * i)) & 0xFF);
            }
        }
    };

    // Wraps a section body with its data_size/data_version prefix.
    inline auto section(std::uint8_t version, Bytes const& body) -> Bytes {
        auto result = Bytes{};
        result.put((std::uint32_t)(body.data.size() + 5));
        result.put(version);
        result.put_raw(body.data);
        return result;
    }

    inline auto meta_section(ManifestMeta const& meta) -> Bytes {
        auto body = Bytes{};
        body.put(meta.feature_level);
        body.put((std::uint8_t)meta.is_file_data);
        body.put(meta.app_id);
        body.put_string(meta.app_name);
        body.put_string(meta.build_version);
        body.put_string(meta.launch_exe);
        body.put_string(meta.launch_command);
        body.put_strings(meta.prereq_ids);
        body.put_string(meta.prereq_name);
        body.put_string(meta.prereq_path);
        body.put_string(meta.prereq_args);
        if (meta.data_version >= 1) {
            body.put_string(meta.build_id.value_or(""));
        }
        if (meta.data_version >= 2) {
            body.put_string(meta.uninstall_action_path);
            body.put_string(meta.uninstall_action_args);
        }
        return section(meta.data_version, body);
    }

    inline auto chunk_section(std::vector<Chunk> const& chunks, std::uint8_t version = 0) -> Bytes {
        auto body = Bytes{};
        body.put((std::int32_t)chunks.size());
        for (auto const& chunk : chunks) {
            body.put_guid(chunk.guid);
        }
        for (auto const& chunk : chunks) {
            body.put(chunk.hash);
        }
        for (auto const& chunk : chunks) {
            body.put_hex(chunk.sha_hash, 20);
        }
        for (auto const& chunk : chunks) {
            body.put(chunk.group);
        }
        for (auto const& chunk : chunks) {
            body.put(chunk.window_size);
        }
        for (auto const& chunk : chunks) {
            body.put(chunk.file_size);
        }
        return section(version, body);
    }

    inline auto file_section(std::vector<FileManifest> const& files, std::uint8_t version = 0) -> Bytes {
        auto body = Bytes{};
        body.put((std::int32_t)files.size());
        for (auto const& file : files) {
            body.put_string(file.filename);
        }
        for (auto const& file : files) {
            body.put_string(file.symlink_target);
        }
        for (auto const& file : files) {
            body.put_hex(file.sha_hash, 20);
        }
        for (auto const& file : files) {
            body.put(file.file_meta_flags);
        }
        for (auto const& file : files) {
            body.put_strings(file.install_tags);
        }
        for (auto const& file : files) {
            body.put((std::uint32_t)file.chunk_parts.size());
            for (auto const& part : file.chunk_parts) {
                auto const size = part.data_size ? part.data_size : 28u;
                auto const start = body.data.size();
                body.put(size);
                body.put_guid(part.parent_guid);
                body.put(part.offset);
                body.put(part.size);
                body.data.resize(start + size, '\0');
            }
        }
        if (version >= 1) {
            for (auto const& file : files) {
                body.put((std::uint32_t)!file.md5.empty());
                if (!file.md5.empty()) {
                    body.put_hex(file.md5, 16);
                }
            }
            for (auto const& file : files) {
                body.put_string(file.mime_type);
            }
        }
        if (version >= 2) {
            for (auto const& file : files) {
                body.put_hex(file.sha256, 32);
            }
        }
        return section(version, body);
    }

    inline auto custom_section(std::vector<std::pair<std::string, std::string>> const& fields) -> Bytes {
        auto body = Bytes{};
        body.put((std::int32_t)fields.size());
        for (auto const& [key, value] : fields) {
            body.put_string(key);
        }
        for (auto const& [key, value] : fields) {
            body.put_string(value);
        }
        return section(0, body);
    }

    inline auto sha1_raw(std::span<char const> data) -> std::array<char, 20> {
        using digestpp::sha1;
        auto result = std::array<char, 20>{};
        sha1().absorb((std::uint8_t const*)data.data(), data.size()).digest((std::uint8_t*)result.data(), 20);
        return result;
    }

    inline auto zlib_compress(std::span<char const> data) -> std::vector<char> {
        auto size = mz_compressBound((mz_ulong)data.size());
        auto result = std::vector<char>(size);
        auto error = mz_compress((unsigned char*)result.data(),
                                 &size,
                                 (unsigned char const*)data.data(),
                                 (mz_ulong)data.size());
        if (error != MZ_OK) {
            throw std::runtime_error(std::string("mz_compress: ") + mz_error(error));
        }
        result.resize(size);
        return result;
    }

    struct ContainerOptions {
        bool compress = false;
        std::uint32_t header_size = ManifestHeader::VERSIONED_SIZE;
        std::int32_t version = 18;
        std::uint8_t extra_stored_as = 0;
    };

    // Header followed by the payload, with sizes and sha1 filled in from the payload.
    inline auto container(Bytes const& payload, ContainerOptions const& options = {}) -> std::vector<char> {
        auto stored = options.compress ? zlib_compress(payload.data) : payload.data;
        auto result = Bytes{};
        result.put(ManifestHeader::MAGIC);
        result.put(options.header_size);
        result.put((std::uint32_t)payload.data.size());
        result.put((std::uint32_t)stored.size());
        result.put_raw(sha1_raw(payload.data));
        result.put((std::uint8_t)((options.compress ? ManifestHeader::STORED_COMPRESSED : 0) | options.extra_stored_as));
        if (options.header_size > ManifestHeader::MIN_SIZE) {
            result.put(options.version);
        }
        result.data.resize(std::max<std::size_t>(result.data.size(), options.header_size), '\0');
        result.put_raw(stored);
        return result.data;
    }

    inline auto guid(std::string_view text) -> Guid {
        auto result = Guid::parse(text);
        if (!result) {
            throw std::runtime_error("bad guid in test data: " + std::string(text));
        }
        return *result;
    }

    inline auto part(Guid const& guid, std::uint32_t offset, std::uint32_t size) -> ChunkPart {
        return ChunkPart{.data_size = 28, .parent_guid = guid, .offset = offset, .size = size};
    }
}
