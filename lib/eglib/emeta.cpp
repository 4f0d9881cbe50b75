#include "emeta.hpp"

using namespace eglib;

template <auto Member>
static auto read_member(Reader& reader, ManifestMeta& meta) -> ReadStatus {
    return reader.read(meta.*Member);
}

static auto read_build_id(Reader& reader, ManifestMeta& meta) -> ReadStatus {
    auto value = std::string{};
    auto status = reader.read(value);
    if (status == ReadStatus::Ok) {
        meta.build_id = std::move(value);
    }
    return status;
}

static constexpr auto META_FIELDS = std::array<Field<ManifestMeta>, 14>{{
    {0, &read_member<&ManifestMeta::feature_level>},
    {0, &read_member<&ManifestMeta::is_file_data>},
    {0, &read_member<&ManifestMeta::app_id>},
    {0, &read_member<&ManifestMeta::app_name>},
    {0, &read_member<&ManifestMeta::build_version>},
    {0, &read_member<&ManifestMeta::launch_exe>},
    {0, &read_member<&ManifestMeta::launch_command>},
    {0, &read_member<&ManifestMeta::prereq_ids>},
    {0, &read_member<&ManifestMeta::prereq_name>},
    {0, &read_member<&ManifestMeta::prereq_path>},
    {0, &read_member<&ManifestMeta::prereq_args>},
    {1, &read_build_id},
    {2, &read_member<&ManifestMeta::uninstall_action_path>},
    {2, &read_member<&ManifestMeta::uninstall_action_args>},
}};

auto ManifestMeta::read(Reader& reader, Advisories& advisories) -> std::optional<ManifestMeta> {
    auto header = SectionHeader{};
    auto body = Reader{};
    if (!open_section(reader, "meta", header, body, advisories)) {
        return std::nullopt;
    }
    auto result = ManifestMeta{.data_size = header.data_size, .data_version = header.data_version};
    auto status = read_fields(body, header.data_version, result, META_FIELDS);
    close_section(reader, "meta", header, body, status, advisories);
    return result;
}
