#include "echunk.hpp"

using namespace eglib;

static auto read_count(Reader& reader, ChunkDataList& list) -> ReadStatus {
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

static auto read_guids(Reader& reader, ChunkDataList& list) -> ReadStatus {
    list.elements.reserve(std::min((std::size_t)list.count, reader.remains() / 16));
    for (std::uint32_t i = 0; i != list.count; ++i) {
        auto& chunk = list.elements.emplace_back();
        if (auto status = reader.read(chunk.guid); status != ReadStatus::Ok) {
            list.elements.pop_back();
            return status;
        }
    }
    return ReadStatus::Ok;
}

template <auto Member>
static auto read_column(Reader& reader, ChunkDataList& list) -> ReadStatus {
    return reader.read_each(list.elements, [](Reader& reader, Chunk& chunk) { return reader.read(chunk.*Member); });
}

static auto read_sha_column(Reader& reader, ChunkDataList& list) -> ReadStatus {
    return reader.read_each(list.elements,
                            [](Reader& reader, Chunk& chunk) { return reader.read_digest(chunk.sha_hash, 20); });
}

static constexpr auto CHUNK_FIELDS = std::array<Field<ChunkDataList>, 7>{{
    {0, &read_count},
    {0, &read_guids},
    {0, &read_column<&Chunk::hash>},
    {0, &read_sha_column},
    {0, &read_column<&Chunk::group>},
    {0, &read_column<&Chunk::window_size>},
    {0, &read_column<&Chunk::file_size>},
}};

auto ChunkDataList::find(Guid const& guid) const -> std::optional<std::size_t> {
    if (auto i = lookup.find(guid.str()); i != lookup.end()) {
        return i->second;
    }
    return std::nullopt;
}

auto ChunkDataList::download_size() const noexcept -> std::uint64_t {
    auto result = std::uint64_t{};
    for (auto const& chunk : elements) {
        result += (std::uint64_t)std::max(chunk.file_size, std::int64_t{0});
    }
    return result;
}

auto ChunkDataList::install_size() const noexcept -> std::uint64_t {
    auto result = std::uint64_t{};
    for (auto const& chunk : elements) {
        if (chunk.window_size) {
            result += chunk.window_size;
        } else {
            result += (std::uint64_t)std::max(chunk.file_size, std::int64_t{0});
        }
    }
    return result;
}

auto ChunkDataList::index(Advisories& advisories) -> void {
    lookup.clear();
    lookup.reserve(elements.size());
    for (std::size_t i = 0; i != elements.size(); ++i) {
        auto [iter, inserted] = lookup.emplace(elements[i].guid.str(), i);
        if (!inserted) {
            advise(advisories,
                   AdvisoryKind::DuplicateChunk,
                   "chunk {} at index {} repeats index {}",
                   iter->first,
                   i,
                   iter->second);
        }
    }
}

auto ChunkDataList::read(Reader& reader, Advisories& advisories) -> std::optional<ChunkDataList> {
    auto header = SectionHeader{};
    auto body = Reader{};
    if (!open_section(reader, "chunk list", header, body, advisories)) {
        return std::nullopt;
    }
    auto result = ChunkDataList{.data_size = header.data_size, .data_version = header.data_version};
    auto status = read_fields(body, header.data_version, result, CHUNK_FIELDS);
    close_section(reader, "chunk list", header, body, status, advisories);
    result.index(advisories);
    return result;
}
