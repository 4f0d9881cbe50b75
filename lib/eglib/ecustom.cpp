#include "ecustom.hpp"

using namespace eglib;

static auto read_count(Reader& reader, CustomFields& custom) -> ReadStatus {
    auto count = std::int32_t{};
    if (auto status = reader.read(count); status != ReadStatus::Ok) {
        return status;
    }
    if (count < 0) {
        return ReadStatus::Invalid;
    }
    custom.count = (std::uint32_t)count;
    return ReadStatus::Ok;
}

static auto read_keys(Reader& reader, CustomFields& custom) -> ReadStatus {
    custom.fields.reserve(std::min((std::size_t)custom.count, reader.remains() / sizeof(std::int32_t)));
    for (std::uint32_t i = 0; i != custom.count; ++i) {
        auto key = std::string{};
        if (auto status = reader.read(key); status != ReadStatus::Ok) {
            return status;
        }
        custom.fields.emplace_back(std::move(key), std::string{});
    }
    return ReadStatus::Ok;
}

static auto read_values(Reader& reader, CustomFields& custom) -> ReadStatus {
    return reader.read_each(custom.fields, [](Reader& reader, auto& field) { return reader.read(field.second); });
}

static constexpr auto CUSTOM_FIELDS = std::array<Field<CustomFields>, 3>{{
    {0, &read_count},
    {0, &read_keys},
    {0, &read_values},
}};

auto CustomFields::find(std::string_view key) const noexcept -> std::string const* {
    for (auto const& [k, v] : fields) {
        if (k == key) {
            return &v;
        }
    }
    return nullptr;
}

auto CustomFields::read(Reader& reader, Advisories& advisories) -> std::optional<CustomFields> {
    if (reader.remains() == 0) {
        return std::nullopt;
    }
    auto header = SectionHeader{};
    auto body = Reader{};
    if (!open_section(reader, "custom fields", header, body, advisories)) {
        return std::nullopt;
    }
    auto result = CustomFields{.data_size = header.data_size, .data_version = header.data_version};
    auto status = read_fields(body, header.data_version, result, CUSTOM_FIELDS);
    close_section(reader, "custom fields", header, body, status, advisories);
    return result;
}
