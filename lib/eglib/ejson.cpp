#include "ejson.hpp"

#include <array>
#include <limits>
#include <nlohmann/json.hpp>

using namespace eglib;
using json = nlohmann::json;

namespace {
    // Manifests written before ManifestFileVersion was stored.
    constexpr std::int32_t UNSTORED_VERSION = 1;
    // Fixed window of every chunk in a JSON manifest.
    constexpr std::uint32_t CHUNK_DATA_SIZE = 1 * MiB;

    struct JsonReader {
        Advisories& advisories;

        auto invalid(std::string_view where, std::string_view what) -> void {
            advise(advisories, AdvisoryKind::SectionInvalid, "json {}: bad {}", where, what);
        }

        auto find(json const& object, char const* key) -> json const* {
            if (auto i = object.find(key); i != object.end() && !i->is_null()) {
                return &*i;
            }
            return nullptr;
        }

        auto string(json const& object, char const* key) -> std::string {
            auto value = find(object, key);
            if (!value) {
                return {};
            }
            if (!value->is_string()) {
                invalid(key, "string");
                return {};
            }
            return value->get<std::string>();
        }

        auto boolean(json const& object, char const* key) -> bool {
            auto value = find(object, key);
            if (!value) {
                return false;
            }
            if (!value->is_boolean()) {
                invalid(key, "boolean");
                return false;
            }
            return value->get<bool>();
        }

        auto strings(json const& object, char const* key) -> std::vector<std::string> {
            auto result = std::vector<std::string>{};
            auto value = find(object, key);
            if (!value) {
                return result;
            }
            if (!value->is_array()) {
                invalid(key, "array");
                return result;
            }
            for (auto const& item : *value) {
                if (!item.is_string()) {
                    invalid(key, "string");
                    continue;
                }
                result.push_back(item.get<std::string>());
            }
            return result;
        }

        template <typename T>
        auto number(json const& value, std::string_view where) -> std::optional<T> {
            if (value.is_number_integer()) {
                if (value.is_number_unsigned()) {
                    auto raw = value.get<std::uint64_t>();
                    if (raw <= (std::uint64_t)std::numeric_limits<T>::max()) {
                        return static_cast<T>(raw);
                    }
                } else {
                    auto raw = value.get<std::int64_t>();
                    if (raw >= (std::int64_t)std::numeric_limits<T>::min() &&
                        (std::is_signed_v<T> || raw >= 0) &&
                        (std::uint64_t)raw <= (std::uint64_t)std::numeric_limits<T>::max()) {
                        return static_cast<T>(raw);
                    }
                }
            } else if (value.is_string()) {
                if (auto result = blob_to<T>(value.get_ref<std::string const&>())) {
                    return result;
                }
            }
            invalid(where, "number");
            return std::nullopt;
        }

        template <typename T>
        auto number(json const& object, char const* key, T fallback) -> T {
            if (auto value = find(object, key)) {
                return number<T>(*value, key).value_or(fallback);
            }
            return fallback;
        }

        auto guid(std::string_view text, std::string_view where) -> std::optional<Guid> {
            auto result = Guid::parse(text);
            if (!result) {
                invalid(where, fmt::format("guid \"{}\"", text));
            }
            return result;
        }

        // Object keyed by chunk guid, visited for the chunks that exist in the catalog.
        template <typename Func>
        auto each_chunk(json const& root, char const* key, ChunkDataList& list, Func&& func) -> bool {
            auto value = find(root, key);
            if (!value) {
                return false;
            }
            if (!value->is_object()) {
                invalid(key, "object");
                return false;
            }
            for (auto const& [name, item] : value->items()) {
                auto guid = this->guid(name, key);
                if (!guid) {
                    continue;
                }
                if (auto index = list.find(*guid)) {
                    func(list.elements[*index], item);
                }
            }
            return true;
        }

        auto meta(json const& root, std::int32_t version) -> ManifestMeta {
            auto result = ManifestMeta{};
            result.feature_level = version;
            result.app_id = number<std::uint32_t>(root, "AppID", 0);
            result.app_name = string(root, "AppNameString");
            result.build_version = string(root, "BuildVersionString");
            result.launch_exe = string(root, "LaunchExeString");
            result.launch_command = string(root, "LaunchCommand");
            result.prereq_ids = strings(root, "PrereqIds");
            result.prereq_name = string(root, "PrereqName");
            result.prereq_path = string(root, "PrereqPath");
            result.prereq_args = string(root, "PrereqArgs");
            if (find(root, "BuildId")) {
                result.build_id = string(root, "BuildId");
            }
            result.uninstall_action_path = string(root, "UninstallActionPath");
            result.uninstall_action_args = string(root, "UninstallActionArgs");
            if (auto value = find(root, "bIsFileData"); value && value->is_boolean()) {
                result.is_file_data = value->get<bool>();
            } else {
                auto hashes = find(root, "ChunkHashList");
                result.is_file_data = !hashes || hashes->empty();
            }
            return result;
        }

        auto file_hash(json const& object) -> std::string {
            auto value = find(object, "FileHash");
            if (!value) {
                return {};
            }
            if (value->is_string()) {
                if (auto bytes = blob_to_bytes(value->get_ref<std::string const&>(), 20); bytes && bytes->size() == 20) {
                    return to_hex(*bytes);
                }
            }
            invalid("FileHash", "blob");
            return {};
        }

        auto part(json const& value) -> ChunkPart {
            auto result = ChunkPart{};
            if (!value.is_object()) {
                invalid("FileChunkParts", "object");
                return result;
            }
            result.parent_guid = guid(string(value, "Guid"), "Guid").value_or(Guid{});
            result.offset = number<std::uint32_t>(value, "Offset", 0);
            result.size = number<std::uint32_t>(value, "Size", 0);
            return result;
        }

        auto file(json const& value) -> FileManifest {
            auto result = FileManifest{};
            if (!value.is_object()) {
                invalid("FileManifestList", "object");
                return result;
            }
            result.filename = clean_path(string(value, "Filename"));
            result.symlink_target = string(value, "SymlinkTarget");
            result.sha_hash = file_hash(value);
            result.install_tags = strings(value, "InstallTags");
            result.mime_type = string(value, "MimeType");
            if (boolean(value, "bIsReadOnly")) {
                result.file_meta_flags |= FileManifest::FLAG_READ_ONLY;
            }
            if (boolean(value, "bIsCompressed")) {
                result.file_meta_flags |= FileManifest::FLAG_COMPRESSED;
            }
            if (boolean(value, "bIsUnixExecutable")) {
                result.file_meta_flags |= FileManifest::FLAG_UNIX_EXECUTABLE;
            }
            if (auto parts = find(value, "FileChunkParts")) {
                if (!parts->is_array()) {
                    invalid("FileChunkParts", "array");
                } else {
                    for (auto const& item : *parts) {
                        result.chunk_parts.push_back(part(item));
                    }
                }
            }
            return result;
        }

        auto files(json const& root) -> FileManifestList {
            auto result = FileManifestList{};
            if (auto list = find(root, "FileManifestList")) {
                if (!list->is_array()) {
                    invalid("FileManifestList", "array");
                } else {
                    for (auto const& item : *list) {
                        result.files.push_back(file(item));
                    }
                }
            }
            result.count = (std::uint32_t)result.files.size();
            return result;
        }

        // Catalog of every guid a part references, in order of first reference.
        auto chunks(json const& root, FileManifestList const& files) -> ChunkDataList {
            auto result = ChunkDataList{};
            for (auto const& file : files.files) {
                for (auto const& part : file.chunk_parts) {
                    if (!part.parent_guid.is_valid()) {
                        continue;
                    }
                    auto key = part.parent_guid.str();
                    if (result.lookup.contains(key)) {
                        continue;
                    }
                    result.lookup.emplace(std::move(key), result.elements.size());
                    result.elements.push_back(Chunk{
                        .guid = part.parent_guid,
                        .window_size = CHUNK_DATA_SIZE,
                        .file_size = CHUNK_DATA_SIZE,
                    });
                }
            }
            result.count = (std::uint32_t)result.elements.size();
            each_chunk(root, "ChunkHashList", result, [this](Chunk& chunk, json const& value) {
                chunk.hash = number<std::uint64_t>(value, "ChunkHashList").value_or(0);
            });
            each_chunk(root, "ChunkShaList", result, [this](Chunk& chunk, json const& value) {
                auto bytes = std::array<std::uint8_t, 20>{};
                if (!value.is_string() || !from_hex(value.get_ref<std::string const&>(), bytes)) {
                    invalid("ChunkShaList", "sha1");
                    return;
                }
                chunk.sha_hash = to_hex(bytes);
            });
            each_chunk(root, "DataGroupList", result, [this](Chunk& chunk, json const& value) {
                chunk.group = number<std::uint8_t>(value, "DataGroupList").value_or(0);
            });
            each_chunk(root, "ChunkFilesizeList", result, [this](Chunk& chunk, json const& value) {
                chunk.file_size = number<std::int64_t>(value, "ChunkFilesizeList").value_or(CHUNK_DATA_SIZE);
            });
            return result;
        }

        auto custom(json const& root) -> std::optional<CustomFields> {
            auto value = find(root, "CustomFields");
            if (!value) {
                return std::nullopt;
            }
            auto result = CustomFields{};
            if (!value->is_object()) {
                invalid("CustomFields", "object");
                return result;
            }
            for (auto const& [key, item] : value->items()) {
                if (!item.is_string()) {
                    invalid("CustomFields", "string");
                    continue;
                }
                result.fields.emplace_back(key, item.get<std::string>());
            }
            result.count = (std::uint32_t)result.fields.size();
            return result;
        }
    };
}

auto eglib::blob_to_bytes(std::string_view blob, std::size_t size) -> std::optional<std::vector<std::uint8_t>> {
    if (blob.size() % 3 != 0 || blob.size() / 3 > size) {
        return std::nullopt;
    }
    auto result = std::vector<std::uint8_t>{};
    result.reserve(blob.size() / 3);
    for (std::size_t i = 0; i != blob.size(); i += 3) {
        auto value = 0u;
        for (auto c : blob.substr(i, 3)) {
            if (c < '0' || c > '9') {
                return std::nullopt;
            }
            value = value * 10 + (unsigned)(c - '0');
        }
        if (value > 0xFF) {
            return std::nullopt;
        }
        result.push_back((std::uint8_t)value);
    }
    return result;
}

auto eglib::read_json_manifest(std::span<char const> data) -> Manifest {
    eglib_trace("json manifest: %zu bytes", data.size());
    auto root = json::parse(data.begin(), data.end(), nullptr, false);
    if (root.is_discarded()) {
        eglib_error(": not a binary manifest and not valid json");
    }
    if (!root.is_object()) {
        eglib_error(": json manifest root is not an object");
    }
    auto result = Manifest{.format = Format::Json};
    auto reader = JsonReader{.advisories = result.advisories};
    result.header.version = reader.number<std::int32_t>(root, "ManifestFileVersion", UNSTORED_VERSION);
    result.meta = reader.meta(root, result.header.version);
    result.file_list = reader.files(root);
    result.chunk_list = reader.chunks(root, *result.file_list);
    result.file_list->resolve(&*result.chunk_list, result.advisories);
    result.custom_fields = reader.custom(root);
    return result;
}
