#include "eheader.hpp"

#include "reader.hpp"

using namespace eglib;

auto ManifestHeader::payload(std::span<char const> data) const noexcept -> std::span<char const> {
    auto const offset = std::min(payload_offset(), data.size());
    auto const size = std::min(stored_size(), data.size() - offset);
    return data.subspan(offset, size);
}

auto ManifestHeader::detect(std::span<char const> data) noexcept -> bool {
    if (data.size() < sizeof(std::uint32_t)) {
        return false;
    }
    return load_le<std::uint32_t>(reinterpret_cast<std::uint8_t const*>(data.data())) == MAGIC;
}

auto ManifestHeader::read(std::span<char const> data) -> ManifestHeader {
    eglib_trace("header bytes: %zu", data.size());
    eglib_assert(detect(data));
    if (data.size() < MIN_SIZE) {
        eglib_error(fmt::format(": header needs {} bytes, got {}", MIN_SIZE, data.size()));
    }
    auto reader = Reader(data);
    auto magic = std::uint32_t{};
    auto result = ManifestHeader{};
    eglib_assert(reader.read(magic) == ReadStatus::Ok);
    eglib_assert(reader.read(result.header_size) == ReadStatus::Ok);
    eglib_assert(reader.read(result.data_size_uncompressed) == ReadStatus::Ok);
    eglib_assert(reader.read(result.data_size_compressed) == ReadStatus::Ok);
    eglib_assert(reader.read_digest(result.sha1_hash, 20) == ReadStatus::Ok);
    eglib_assert(reader.read(result.stored_as) == ReadStatus::Ok);
    if (result.version_present()) {
        // a header cut short right before the version keeps the default
        (void)reader.read(result.version);
    }
    return result;
}
