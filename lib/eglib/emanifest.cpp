#include "emanifest.hpp"

#include <algorithm>

#include "ejson.hpp"
#include "epayload.hpp"
#include "iofile.hpp"
#include "reader.hpp"

using namespace eglib;

auto Manifest::chunk_of(ChunkPart const& part) const noexcept -> Chunk const* {
    if (!part.chunk || !chunk_list || *part.chunk >= chunk_list->elements.size()) {
        return nullptr;
    }
    return &chunk_list->elements[*part.chunk];
}

auto Manifest::has_advisory(AdvisoryKind kind) const noexcept -> bool {
    return std::any_of(advisories.begin(), advisories.end(), [kind](Advisory const& a) { return a.kind == kind; });
}

auto Manifest::detect(std::span<char const> data) noexcept -> Format {
    return ManifestHeader::detect(data) ? Format::Binary : Format::Json;
}

auto Manifest::read_binary(std::span<char const> data) -> Manifest {
    auto result = Manifest{.format = Format::Binary};
    result.header = ManifestHeader::read(data);
    if (result.header.is_encrypted()) {
        advise(result.advisories, AdvisoryKind::Encrypted, "payload is encrypted, sections were not decoded");
        return result;
    }
    auto payload = Payload::read(result.header, result.header.payload(data), result.advisories);
    auto reader = Reader(payload.data);
    result.meta = ManifestMeta::read(reader, result.advisories);
    result.chunk_list = ChunkDataList::read(reader, result.advisories);
    result.file_list =
        FileManifestList::read(reader, result.chunk_list ? &*result.chunk_list : nullptr, result.advisories);
    result.custom_fields = CustomFields::read(reader, result.advisories);
    return result;
}

auto Manifest::read(std::span<char const> data, ReadOptions const& options) -> Manifest {
    auto result = Manifest{};
    switch (detect(data)) {
        case Format::Binary:
            result = read_binary(data);
            break;
        case Format::Json:
            result = read_json_manifest(data);
            break;
    }
    if (options.strict) {
        for (auto const& advisory : result.advisories) {
            if (advisory.is_integrity()) {
                eglib_error(fmt::format(": {}: {}", advisory.kind, advisory.message));
            }
        }
    }
    return result;
}

auto Manifest::read_file(fs::path const& path, ReadOptions const& options) -> Manifest {
    eglib_trace("manifest: %s", path.generic_string().c_str());
    auto infile = IO::File(path);
    auto data = infile.read_all();
    return Manifest::read(data, options);
}

auto Manifest::read_file_async(fs::path path, ReadOptions options) -> std::future<Manifest> {
    return std::async(std::launch::async, [path = std::move(path), options] {
        try {
            return Manifest::read_file(path, options);
        } catch (std::exception const& e) {
            // traces live on the worker thread, carry them over to the caller
            auto message = std::string(e.what());
            for (auto const& error : error_stack()) {
                message += "\n";
                message += error;
            }
            error_stack().clear();
            throw std::runtime_error(message);
        }
    });
}
