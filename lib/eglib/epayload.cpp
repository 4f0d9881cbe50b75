#include "epayload.hpp"

#include <miniz.h>

#include <digestpp.hpp>
#include <limits>

using namespace eglib;

auto eglib::zlib_inflate(std::span<char const> src, std::size_t size) -> std::vector<char> {
    eglib_assert(size <= std::numeric_limits<unsigned int>::max());
    auto result = std::vector<char>{};
    auto stream = mz_stream{};
    stream.next_in = reinterpret_cast<unsigned char const*>(src.data());
    stream.avail_in = (unsigned int)std::min(src.size(), (std::size_t)std::numeric_limits<unsigned int>::max());
    if (auto error = mz_inflateInit(&stream); error != MZ_OK) {
        eglib_error(fmt::format(": mz_inflateInit: {}", mz_error(error)));
    }
    // The output grows with what the stream yields, never past size.
    auto produced = std::size_t{};
    while (produced < size) {
        if (produced == result.size()) {
            result.resize(std::min(size, std::max(result.size() * 2, 64 * KiB)));
            stream.next_out = reinterpret_cast<unsigned char*>(result.data() + produced);
            stream.avail_out = (unsigned int)(result.size() - produced);
        }
        auto const status = mz_inflate(&stream, MZ_SYNC_FLUSH);
        auto const progress = (std::size_t)stream.total_out != produced;
        produced = (std::size_t)stream.total_out;
        // MZ_BUF_ERROR and MZ_DATA_ERROR leave total_out at the last good byte.
        if (status == MZ_STREAM_END || status < 0 || (!progress && stream.avail_out != 0)) {
            break;
        }
    }
    mz_inflateEnd(&stream);
    result.resize(std::min(produced, size));
    return result;
}

auto eglib::sha1_hex(std::span<char const> src) -> std::string {
    using digestpp::sha1;
    return sha1().absorb((std::uint8_t const*)src.data(), src.size()).hexdigest();
}

auto Payload::read(ManifestHeader const& header, std::span<char const> stored, Advisories& advisories)
    -> Payload {
    eglib_trace("stored payload: %zu bytes, stored_as: %u", stored.size(), (unsigned)header.stored_as);
    eglib_assert(!header.is_encrypted());
    auto result = Payload{};
    auto const expected = (std::size_t)header.data_size_uncompressed;
    if (header.is_compressed()) {
        result.data = zlib_inflate(stored, expected);
        if (result.data.size() < expected) {
            advise(advisories,
                   AdvisoryKind::InflateShortfall,
                   "inflated {} of {} declared bytes",
                   result.data.size(),
                   expected);
        }
    } else {
        if (header.data_size_compressed != header.data_size_uncompressed) {
            advise(advisories,
                   AdvisoryKind::SizeMismatch,
                   "uncompressed payload declares {} stored and {} uncompressed bytes",
                   header.data_size_compressed,
                   header.data_size_uncompressed);
        }
        result.data.assign(stored.begin(), stored.end());
        if (result.data.size() < expected) {
            advise(advisories,
                   AdvisoryKind::PayloadShortfall,
                   "payload holds {} of {} declared bytes",
                   result.data.size(),
                   expected);
        }
    }
    result.complete = result.data.size() == expected;
    result.sha1_hash = sha1_hex(result.data);
    result.verified = str_eq_ci(result.sha1_hash, header.sha1_hash);
    if (!result.verified) {
        advise(advisories,
               AdvisoryKind::HashMismatch,
               "payload sha1 {} does not match header sha1 {}",
               result.sha1_hash,
               header.sha1_hash);
    }
    return result;
}
