#pragma once
#include <nlohmann/json.hpp>

#include "emanifest.hpp"

namespace eglib {
    void to_json(nlohmann::json& j, ManifestHeader const& header);

    void to_json(nlohmann::json& j, ManifestMeta const& meta);

    void to_json(nlohmann::json& j, Chunk const& chunk);

    void to_json(nlohmann::json& j, ChunkDataList const& list);

    void to_json(nlohmann::json& j, ChunkPart const& part);

    void to_json(nlohmann::json& j, FileManifest const& file);

    void to_json(nlohmann::json& j, FileManifestList const& list);

    void to_json(nlohmann::json& j, CustomFields const& custom);

    void to_json(nlohmann::json& j, Advisory const& advisory);

    // Lower camel case view of the model. Chunk file sizes are decimal strings, chunk hashes are
    // 16 hex digits.
    extern auto dump(Manifest const& manifest) -> nlohmann::json;
}
