#pragma once
#include <cinttypes>
#include <optional>
#include <string>
#include <vector>

#include "advisory.hpp"
#include "reader.hpp"

namespace eglib {
    struct ManifestMeta {
        std::uint32_t data_size = {};
        std::uint8_t data_version = {};
        std::int32_t feature_level = {};
        bool is_file_data = {};
        std::uint32_t app_id = {};
        std::string app_name = {};
        std::string build_version = {};
        std::string launch_exe = {};
        std::string launch_command = {};
        std::vector<std::string> prereq_ids = {};
        std::string prereq_name = {};
        std::string prereq_path = {};
        std::string prereq_args = {};
        std::optional<std::string> build_id = {};
        std::string uninstall_action_path = {};
        std::string uninstall_action_args = {};

        // Absent only when the section header itself can not be read.
        static auto read(Reader& reader, Advisories& advisories) -> std::optional<ManifestMeta>;

        bool operator==(ManifestMeta const&) const = default;
    };
}
