#include "efile.hpp"

#include "mime.hpp"

using namespace eglib;

static auto read_count(Reader& reader, FileManifestList& list) -> ReadStatus {
    auto count = std::int32_t{};
    if (auto status = reader.read(count); status != ReadStatus::Ok) {
        return status;
    }
    if (count < 0) {
        return ReadStatus::Invalid;
    }
    list.count = (std::uint32_t)count;
    return ReadStatus::Ok;
}

static auto read_filenames(Reader& reader, FileManifestList& list) -> ReadStatus {
    list.files.reserve(std::min((std::size_t)list.count, reader.remains() / sizeof(std::int32_t)));
    for (std::uint32_t i = 0; i != list.count; ++i) {
        auto filename = std::string{};
        if (auto status = reader.read(filename); status != ReadStatus::Ok) {
            return status;
        }
        list.files.push_back(FileManifest{.filename = clean_path(std::move(filename))});
    }
    return ReadStatus::Ok;
}

template <auto Member>
static auto read_column(Reader& reader, FileManifestList& list) -> ReadStatus {
    return reader.read_each(list.files, [](Reader& reader, FileManifest& file) { return reader.read(file.*Member); });
}

template <auto Member, std::size_t Size>
static auto read_digest_column(Reader& reader, FileManifestList& list) -> ReadStatus {
    return reader.read_each(list.files,
                            [](Reader& reader, FileManifest& file) { return reader.read_digest(file.*Member, Size); });
}

static auto read_part(Reader& reader, ChunkPart& part) -> ReadStatus {
    auto const start = reader.tell();
    if (auto status = reader.read(part.data_size); status != ReadStatus::Ok) {
        return status;
    }
    if (auto status = reader.read(part.parent_guid); status != ReadStatus::Ok) {
        return status;
    }
    if (auto status = reader.read(part.offset); status != ReadStatus::Ok) {
        return status;
    }
    if (auto status = reader.read(part.size); status != ReadStatus::Ok) {
        return status;
    }
    // newer part records carry extra trailing fields, a record running past the end still counts
    (void)reader.seek(start + part.data_size);
    return ReadStatus::Ok;
}

static auto read_chunk_parts(Reader& reader, FileManifestList& list) -> ReadStatus {
    return reader.read_each(list.files, [](Reader& reader, FileManifest& file) {
        return reader.read_array(file.chunk_parts, ChunkPart::MIN_SIZE, &read_part);
    });
}

static auto read_md5_column(Reader& reader, FileManifestList& list) -> ReadStatus {
    return reader.read_each(list.files, [](Reader& reader, FileManifest& file) {
        auto has_md5 = std::uint32_t{};
        if (auto status = reader.read(has_md5); status != ReadStatus::Ok || !has_md5) {
            return status;
        }
        return reader.read_digest(file.md5, 16);
    });
}

static constexpr auto FILE_FIELDS = std::array<Field<FileManifestList>, 10>{{
    {0, &read_count},
    {0, &read_filenames},
    {0, &read_column<&FileManifest::symlink_target>},
    {0, &read_digest_column<&FileManifest::sha_hash, 20>},
    {0, &read_column<&FileManifest::file_meta_flags>},
    {0, &read_column<&FileManifest::install_tags>},
    {0, &read_chunk_parts},
    {1, &read_md5_column},
    {1, &read_column<&FileManifest::mime_type>},
    {2, &read_digest_column<&FileManifest::sha256, 32>},
}};

auto FileManifest::tags() const -> std::string {
    auto result = std::string{};
    for (std::size_t i = 0; i != install_tags.size(); ++i) {
        if (i) {
            result.push_back(';');
        }
        result += install_tags[i];
    }
    return result;
}

auto FileManifest::Match::operator()(FileManifest const& file) const -> bool {
    if (tags && !std::regex_search(file.tags(), *tags)) {
        return false;
    }
    if (path && !std::regex_search(file.filename, *path)) {
        return false;
    }
    return true;
}

auto FileManifest::resolve(ChunkDataList const* chunks, Advisories& advisories) -> void {
    auto unresolved = std::size_t{};
    file_size = 0;
    for (auto& part : chunk_parts) {
        part.chunk = chunks ? chunks->find(part.parent_guid) : std::nullopt;
        if (!part.chunk) {
            ++unresolved;
        }
        file_size += part.size;
    }
    if (unresolved) {
        advise(advisories,
               AdvisoryKind::UnresolvedChunk,
               "{}: {} of {} chunk parts reference chunks missing from the catalog",
               filename,
               unresolved,
               chunk_parts.size());
    }
    if (mime_type.empty()) {
        mime_type = mime_type_of(filename);
    }
}

auto FileManifestList::resolve(ChunkDataList const* chunks, Advisories& advisories) -> void {
    for (auto& file : files) {
        file.resolve(chunks, advisories);
    }
}

auto FileManifestList::read(Reader& reader, ChunkDataList const* chunks, Advisories& advisories)
    -> std::optional<FileManifestList> {
    auto header = SectionHeader{};
    auto body = Reader{};
    if (!open_section(reader, "file list", header, body, advisories)) {
        return std::nullopt;
    }
    auto result = FileManifestList{.data_size = header.data_size, .data_version = header.data_version};
    auto status = read_fields(body, header.data_version, result, FILE_FIELDS);
    close_section(reader, "file list", header, body, status, advisories);
    result.resolve(chunks, advisories);
    return result;
}
