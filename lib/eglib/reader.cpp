#include "reader.hpp"

#include <limits>

using namespace eglib;

static auto utf16_to_utf8(std::uint8_t const* src, std::size_t units) -> std::string {
    auto result = std::string{};
    result.reserve(units);
    auto const put = [&result](std::uint32_t cp) {
        if (cp < 0x80) {
            result.push_back((char)cp);
        } else if (cp < 0x800) {
            result.push_back((char)(0xC0 | (cp >> 6)));
            result.push_back((char)(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            result.push_back((char)(0xE0 | (cp >> 12)));
            result.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
            result.push_back((char)(0x80 | (cp & 0x3F)));
        } else {
            result.push_back((char)(0xF0 | (cp >> 18)));
            result.push_back((char)(0x80 | ((cp >> 12) & 0x3F)));
            result.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
            result.push_back((char)(0x80 | (cp & 0x3F)));
        }
    };
    for (std::size_t i = 0; i < units; ++i) {
        std::uint32_t unit = load_le<std::uint16_t>(src + i * 2);
        if (unit >= 0xD800 && unit <= 0xDBFF && i + 1 < units) {
            std::uint32_t next = load_le<std::uint16_t>(src + (i + 1) * 2);
            if (next >= 0xDC00 && next <= 0xDFFF) {
                put(0x10000 + ((unit - 0xD800) << 10) + (next - 0xDC00));
                ++i;
                continue;
            }
        }
        if (unit >= 0xD800 && unit <= 0xDFFF) {
            unit = 0xFFFD;
        }
        put(unit);
    }
    return result;
}

auto Reader::skip(std::size_t count) noexcept -> ReadStatus {
    if (remains() < count) {
        pos_ = end_;
        return ReadStatus::Exhausted;
    }
    pos_ += count;
    return ReadStatus::Ok;
}

auto Reader::seek(std::size_t pos) noexcept -> ReadStatus {
    if (pos > end_) {
        pos_ = end_;
        return ReadStatus::Exhausted;
    }
    pos_ = std::max(pos, pos_);
    return ReadStatus::Ok;
}

auto Reader::read(bool& value) noexcept -> ReadStatus {
    auto raw = std::uint8_t{};
    auto status = read(raw);
    if (status == ReadStatus::Ok) {
        value = raw != 0;
    }
    return status;
}

auto Reader::read(Guid& value) noexcept -> ReadStatus {
    if (remains() < 16) {
        return ReadStatus::Exhausted;
    }
    for (auto& word : value.words) {
        (void)read(word);
    }
    return ReadStatus::Ok;
}

auto Reader::read(std::string& value) -> ReadStatus {
    auto const start = pos_;
    auto length = std::int32_t{};
    if (auto status = read(length); status != ReadStatus::Ok) {
        return status;
    }
    if (length == 0) {
        value.clear();
        return ReadStatus::Ok;
    }
    if (length > 0) {
        if ((std::size_t)length > remains()) {
            pos_ = start;
            return ReadStatus::Exhausted;
        }
        value.assign(data_.data() + pos_, (std::size_t)length);
        pos_ += (std::size_t)length;
        value = trim_nul(std::move(value));
        return ReadStatus::Ok;
    }
    if (length == std::numeric_limits<std::int32_t>::min()) {
        pos_ = start;
        return ReadStatus::Invalid;
    }
    auto const units = (std::size_t)(-length);
    if (units > remains() / 2) {
        pos_ = start;
        return ReadStatus::Exhausted;
    }
    value = trim_nul(utf16_to_utf8(reinterpret_cast<std::uint8_t const*>(data_.data() + pos_), units));
    pos_ += units * 2;
    return ReadStatus::Ok;
}

auto Reader::read(std::vector<std::string>& value) -> ReadStatus {
    auto const start = pos_;
    auto status = read_array(value, sizeof(std::int32_t), [](Reader& reader, std::string& item) {
        return reader.read(item);
    });
    if (status == ReadStatus::Invalid) {
        pos_ = start;
    }
    return status;
}

auto Reader::read_digest(std::string& value, std::size_t count) -> ReadStatus {
    if (remains() < count) {
        return ReadStatus::Exhausted;
    }
    value = to_hex({reinterpret_cast<std::uint8_t const*>(data_.data() + pos_), count});
    pos_ += count;
    return ReadStatus::Ok;
}

auto Reader::section(SectionHeader& header, Reader& body) noexcept -> ReadStatus {
    auto const start = pos_;
    auto data_size = std::uint32_t{};
    if (auto status = read(data_size); status != ReadStatus::Ok) {
        return status;
    }
    if (data_size < SectionHeader::MIN_SIZE || data_size > SectionHeader::MAX_SIZE) {
        pos_ = start;
        return ReadStatus::Invalid;
    }
    header = SectionHeader{.start = start, .data_size = data_size};
    body = *this;
    body.end_ = std::min(header.end(), end_);
    body.truncated_ = truncated_ || header.end() > end_;
    (void)body.read(header.data_version);
    return ReadStatus::Ok;
}

auto eglib::open_section(
    Reader& reader, std::string_view name, SectionHeader& header, Reader& body, Advisories& advisories) -> bool {
    auto const offset = reader.tell();
    switch (reader.section(header, body)) {
        case ReadStatus::Ok:
            return true;
        case ReadStatus::Exhausted:
            advise(advisories, AdvisoryKind::SectionMissing, "{} section missing at offset {}", name, offset);
            return false;
        case ReadStatus::Invalid:
            advise(advisories, AdvisoryKind::SectionInvalid, "{} section has a bad size at offset {}", name, offset);
            return false;
    }
    return false;
}

auto eglib::close_section(Reader& reader,
                          std::string_view name,
                          SectionHeader const& header,
                          Reader const& body,
                          ReadStatus status,
                          Advisories& advisories) -> void {
    if (status == ReadStatus::Invalid) {
        advise(advisories,
               AdvisoryKind::SectionInvalid,
               "{} section v{} holds an invalid value at offset {}",
               name,
               header.data_version,
               body.tell());
    } else if (status == ReadStatus::Exhausted || body.truncated()) {
        advise(advisories,
               AdvisoryKind::SectionTruncated,
               "{} section declares {} bytes, {} present",
               name,
               header.data_size,
               std::min<std::size_t>(header.data_size, reader.tell() - header.start + reader.remains()));
    }
    (void)reader.seek(header.end());
}
