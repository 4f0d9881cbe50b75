#include "edump.hpp"

using namespace eglib;
using json = nlohmann::json;

void eglib::to_json(json& j, ManifestHeader const& header) {
    j = {
        {"headerSize", header.header_size},
        {"dataSizeUncompressed", header.data_size_uncompressed},
        {"dataSizeCompressed", header.data_size_compressed},
        {"sha1Hash", header.sha1_hash},
        {"storedAs", header.stored_as},
        {"version", header.version},
        {"guid", header.guid.str()},
        {"rollingHash", header.rolling_hash},
        {"hashType", header.hash_type},
    };
}

void eglib::to_json(json& j, ManifestMeta const& meta) {
    j = {
        {"dataSize", meta.data_size},
        {"dataVersion", meta.data_version},
        {"featureLevel", meta.feature_level},
        {"isFileData", meta.is_file_data},
        {"appId", meta.app_id},
        {"appName", meta.app_name},
        {"buildVersion", meta.build_version},
        {"launchExe", meta.launch_exe},
        {"launchCommand", meta.launch_command},
        {"prereqIds", meta.prereq_ids},
        {"prereqName", meta.prereq_name},
        {"prereqPath", meta.prereq_path},
        {"prereqArgs", meta.prereq_args},
        {"uninstallActionPath", meta.uninstall_action_path},
        {"uninstallActionArgs", meta.uninstall_action_args},
    };
    if (meta.build_id) {
        j["buildId"] = *meta.build_id;
    }
}

void eglib::to_json(json& j, Chunk const& chunk) {
    j = {
        {"guid", chunk.guid.str()},
        {"hash", fmt::format("{:016x}", chunk.hash)},
        {"shaHash", chunk.sha_hash},
        {"group", chunk.group},
        {"windowSize", chunk.window_size},
        {"fileSize", std::to_string(chunk.file_size)},
    };
}

void eglib::to_json(json& j, ChunkDataList const& list) {
    j = {
        {"dataSize", list.data_size},
        {"dataVersion", list.data_version},
        {"count", list.count},
        {"elements", list.elements},
    };
}

void eglib::to_json(json& j, ChunkPart const& part) {
    j = {
        {"dataSize", part.data_size},
        {"parentGuid", part.parent_guid.str()},
        {"offset", part.offset},
        {"size", part.size},
    };
}

void eglib::to_json(json& j, FileManifest const& file) {
    j = {
        {"filename", file.filename},
        {"symlinkTarget", file.symlink_target},
        {"shaHash", file.sha_hash},
        {"fileMetaFlags", file.file_meta_flags},
        {"installTags", file.install_tags},
        {"chunkParts", file.chunk_parts},
        {"fileSize", file.file_size},
        {"mimeType", file.mime_type},
        {"md5", file.md5},
        {"sha256", file.sha256},
    };
}

void eglib::to_json(json& j, FileManifestList const& list) {
    j = {
        {"dataSize", list.data_size},
        {"dataVersion", list.data_version},
        {"count", list.count},
        {"fileManifestList", list.files},
    };
}

void eglib::to_json(json& j, CustomFields const& custom) {
    auto fields = json::object();
    for (auto const& [key, value] : custom.fields) {
        fields[key] = value;
    }
    j = {
        {"dataSize", custom.data_size},
        {"dataVersion", custom.data_version},
        {"count", custom.count},
        {"fields", std::move(fields)},
    };
}

void eglib::to_json(json& j, Advisory const& advisory) {
    j = {
        {"kind", std::string(to_string(advisory.kind))},
        {"message", advisory.message},
    };
}

auto eglib::dump(Manifest const& manifest) -> json {
    auto result = json::object();
    result["format"] = manifest.format == Format::Binary ? "binary" : "json";
    result["header"] = manifest.header;
    if (manifest.meta) {
        result["meta"] = *manifest.meta;
    }
    if (manifest.chunk_list) {
        result["chunkList"] = *manifest.chunk_list;
    }
    if (manifest.file_list) {
        result["fileList"] = *manifest.file_list;
    }
    if (manifest.custom_fields) {
        result["customFields"] = *manifest.custom_fields;
    }
    if (!manifest.advisories.empty()) {
        result["advisories"] = manifest.advisories;
    }
    return result;
}
