#include <eglib/reader.hpp>

#include "../manifest_builder.hpp"
#include "../test_logger.hpp"

using namespace eglib;
using namespace eglib::tests;

namespace {
    struct Sample {
        std::uint32_t a = {};
        std::uint32_t b = {};
        std::uint32_t c = {};
    };

    auto read_a(Reader& reader, Sample& out) -> ReadStatus { return reader.read(out.a); }
    auto read_b(Reader& reader, Sample& out) -> ReadStatus { return reader.read(out.b); }
    auto read_c(Reader& reader, Sample& out) -> ReadStatus { return reader.read(out.c); }

    constexpr auto SAMPLE_FIELDS = std::array<Field<Sample>, 3>{{
        {0, &read_a},
        {1, &read_b},
        {2, &read_c},
    }};
}

int main() {
    return run("reader_test", [] {
        {
            log("scenario: little endian integers");
            auto bytes = Bytes{};
            bytes.put(std::uint16_t{0x1234}).put(std::int32_t{-2}).put(std::uint64_t{0x0102030405060708});
            auto reader = Reader(bytes.data);
            auto u16 = std::uint16_t{};
            auto i32 = std::int32_t{};
            auto u64 = std::uint64_t{};
            require(reader.read(u16) == ReadStatus::Ok && u16 == 0x1234, "u16");
            require(reader.read(i32) == ReadStatus::Ok && i32 == -2, "i32");
            require(reader.read(u64) == ReadStatus::Ok && u64 == 0x0102030405060708, "u64");
            require(reader.remains() == 0, "all bytes consumed");
        }

        {
            log("scenario: exhausted read leaves value and cursor alone");
            auto bytes = Bytes{};
            bytes.put(std::uint16_t{7});
            auto reader = Reader(bytes.data);
            auto value = std::uint32_t{42};
            require(reader.read(value) == ReadStatus::Exhausted, "short u32 is exhausted");
            require(value == 42, "value untouched");
            require(reader.tell() == 0, "cursor untouched");
            auto text = std::string("keep");
            require(reader.read(text) == ReadStatus::Exhausted, "short string length is exhausted");
            require(text == "keep", "string untouched");
        }

        {
            log("scenario: 8-bit and utf-16 strings");
            auto bytes = Bytes{};
            bytes.put_string("TheFalconeer.exe");
            bytes.put_utf16(u"Café \U0001F600");
            bytes.put(std::int32_t{0});
            auto reader = Reader(bytes.data);
            auto first = std::string{};
            auto second = std::string{};
            auto third = std::string("x");
            require(reader.read(first) == ReadStatus::Ok && first == "TheFalconeer.exe", "ansi string");
            require(reader.read(second) == ReadStatus::Ok, "utf-16 string");
            log_kv("utf16", second);
            require(second == "Caf\xc3\xa9 \xf0\x9f\x98\x80", "utf-16 converted to utf-8");
            require(reader.read(third) == ReadStatus::Ok && third.empty(), "empty string");
        }

        {
            log("scenario: string longer than the buffer");
            auto bytes = Bytes{};
            bytes.put(std::int32_t{100}).put_raw(std::string_view("abc"));
            auto reader = Reader(bytes.data);
            auto text = std::string{};
            require(reader.read(text) == ReadStatus::Exhausted, "overlong string is exhausted");
            require(reader.tell() == 0, "cursor restored");
        }

        {
            log("scenario: string arrays");
            auto bytes = Bytes{};
            bytes.put_strings({"a", "bc"});
            bytes.put(std::int32_t{-1});
            auto reader = Reader(bytes.data);
            auto values = std::vector<std::string>{};
            require(reader.read(values) == ReadStatus::Ok, "array read");
            require(values == std::vector<std::string>{"a", "bc"}, "array values");
            auto bad = std::vector<std::string>{};
            auto const before = reader.tell();
            require(reader.read(bad) == ReadStatus::Invalid, "negative count is invalid");
            require(reader.tell() == before, "invalid count restores cursor");
        }

        {
            log("scenario: guid and digest");
            auto bytes = Bytes{};
            bytes.put_guid(guid("00112233445566778899AABBCCDDEEFF"));
            bytes.put_hex("000102030405060708090a0b0c0d0e0f10111213", 20);
            auto reader = Reader(bytes.data);
            auto value = Guid{};
            auto digest = std::string{};
            require(reader.read(value) == ReadStatus::Ok, "guid read");
            require(value.str() == "00112233-4455-6677-8899-aabbccddeeff", "guid text");
            require(reader.read_digest(digest, 20) == ReadStatus::Ok, "digest read");
            require(digest == "000102030405060708090a0b0c0d0e0f10111213", "digest hex");
        }

        {
            log("scenario: section bounds");
            auto body = Bytes{};
            body.put(std::uint32_t{1}).put(std::uint32_t{2});
            auto bytes = section(3, body);
            bytes.put(std::uint32_t{0xDEADBEEF});
            auto reader = Reader(bytes.data);
            auto header = SectionHeader{};
            auto inner = Reader{};
            require(reader.section(header, inner) == ReadStatus::Ok, "section opens");
            require(header.data_size == 13 && header.data_version == 3, "section header");
            require(inner.remains() == 8 && !inner.truncated(), "body is bounded");
            require(reader.seek(header.end()) == ReadStatus::Ok, "seek to section end");
            auto tail = std::uint32_t{};
            require(reader.read(tail) == ReadStatus::Ok && tail == 0xDEADBEEF, "data after section");
        }

        {
            log("scenario: truncated and invalid sections");
            auto body = Bytes{};
            body.put(std::uint32_t{1}).put(std::uint32_t{2});
            auto bytes = section(0, body);
            bytes.data.resize(bytes.data.size() - 3);
            auto reader = Reader(bytes.data);
            auto header = SectionHeader{};
            auto inner = Reader{};
            require(reader.section(header, inner) == ReadStatus::Ok, "truncated section opens");
            require(inner.truncated() && inner.remains() == 5, "truncated body knows it");
            require(inner.stop_status() == ReadStatus::Exhausted, "truncated stop is exhausted");

            auto tiny = Bytes{};
            tiny.put(std::uint32_t{2}).put(std::uint8_t{0});
            auto tiny_reader = Reader(tiny.data);
            require(tiny_reader.section(header, inner) == ReadStatus::Invalid, "size below header is invalid");
            require(tiny_reader.tell() == 0, "invalid section restores cursor");

            auto huge = Bytes{};
            huge.put(std::uint32_t{0xFFFFFFFF}).put(std::uint8_t{0});
            auto huge_reader = Reader(huge.data);
            require(huge_reader.section(header, inner) == ReadStatus::Invalid, "size above limit is invalid");
        }

        {
            log("scenario: version gated fields");
            auto body = Bytes{};
            body.put(std::uint32_t{10}).put(std::uint32_t{20}).put(std::uint32_t{30});
            auto reader = Reader(body.data);
            auto out = Sample{};
            require(read_fields(reader, 1, out, SAMPLE_FIELDS) == ReadStatus::Ok, "v1 read");
            require(out.a == 10 && out.b == 20 && out.c == 0, "v1 stops before the v2 field");

            auto short_body = Bytes{};
            short_body.put(std::uint32_t{10});
            auto short_reader = Reader(short_body.data);
            auto partial = Sample{};
            require(read_fields(short_reader, 2, partial, SAMPLE_FIELDS) == ReadStatus::Ok,
                    "declared end reached is a clean stop");
            require(partial.a == 10 && partial.b == 0, "defaults kept after clean stop");

            auto cut = Bytes{};
            cut.put(std::uint32_t{10}).put(std::uint16_t{1});
            auto cut_reader = Reader(cut.data);
            auto torn = Sample{};
            require(read_fields(cut_reader, 2, torn, SAMPLE_FIELDS) == ReadStatus::Exhausted,
                    "field cut in half is exhausted");
            require(torn.a == 10 && torn.b == 0, "value before the cut kept");
        }

        {
            log("scenario: skip and seek clamp");
            auto bytes = Bytes{};
            bytes.put(std::uint32_t{1});
            auto reader = Reader(bytes.data);
            require(reader.skip(8) == ReadStatus::Exhausted && reader.remains() == 0, "skip past end clamps");
            auto other = Reader(bytes.data);
            require(other.seek(2) == ReadStatus::Ok && other.tell() == 2, "seek forward");
            require(other.seek(1) == ReadStatus::Ok && other.tell() == 2, "seek never goes back");
            require(other.seek(100) == ReadStatus::Exhausted && other.remains() == 0, "seek past end clamps");
        }
    });
}
