#include <eglib/emanifest.hpp>
#include <eglib/iofile.hpp>

#include <fstream>

#include "../manifest_builder.hpp"
#include "../test_logger.hpp"

using namespace eglib;
using namespace eglib::tests;

namespace {
    struct TempFile {
        fs::path path;

        explicit TempFile(std::string_view name, std::span<char const> data)
            : path(fs::temp_directory_path() / fs::path(name)) {
            auto out = std::ofstream(path, std::ios::binary | std::ios::trunc);
            out.write(data.data(), (std::streamsize)data.size());
            require(out.good(), "write temp file");
        }

        ~TempFile() noexcept {
            auto ec = std::error_code{};
            fs::remove(path, ec);
        }
    };

    auto sample_payload() -> Bytes {
        auto meta = ManifestMeta{.feature_level = 18, .app_name = "IoApp", .build_version = "2.0"};
        auto chunk = Chunk{.guid = guid("0123456789ABCDEF0123456789ABCDEF"), .window_size = 1 * MiB, .file_size = 77};
        auto file = FileManifest{.filename = "Game/io.bin", .chunk_parts = {part(chunk.guid, 0, 512)}};
        auto payload = Bytes{};
        payload.put_raw(meta_section(meta).data);
        payload.put_raw(chunk_section({chunk}).data);
        payload.put_raw(file_section({file}).data);
        return payload;
    }
}

int main() {
    return run("io_test", [] {
        auto const data = container(sample_payload(), {.compress = true});
        auto const name = fmt::format("egman-io-test-{}.manifest", (std::uintptr_t)&data);

        {
            log("scenario: read_all returns the file bytes");
            auto temp = TempFile(name, data);
            auto file = IO::File(temp.path);
            require(file.size() == data.size(), "size");
            require(file.fd() != -1, "open handle");
            require(file.read_all() == data, "contents");
            auto tail = std::vector<char>(4);
            require(file.read(data.size() - 4, tail), "offset read");
            require(std::equal(tail.begin(), tail.end(), data.end() - 4), "offset contents");
            auto past = std::vector<char>(8);
            require(!file.read(data.size() - 4, past), "read past the end fails");
            auto moved = std::move(file);
            require(moved.size() == data.size() && file.fd() == -1, "handle moves");
        }

        {
            log("scenario: sync, async and buffer reads agree");
            auto temp = TempFile(name, data);
            auto from_buffer = Manifest::read(data);
            auto from_file = Manifest::read_file(temp.path);
            auto pending = Manifest::read_file_async(temp.path);
            auto from_async = pending.get();
            require(from_buffer.advisories.empty(), "clean buffer read");
            require(from_buffer.meta->app_name == "IoApp", "app name");
            require(from_buffer.file_list->files[0].file_size == 512, "file size");
            require(from_file == from_buffer, "sync equals buffer");
            require(from_async == from_buffer, "async equals buffer");
        }

        {
            log("scenario: strict option reaches the file reader");
            auto corrupt = data;
            corrupt[20] ^= 0x01;
            auto temp = TempFile(name, corrupt);
            auto relaxed = Manifest::read_file(temp.path);
            require(relaxed.has_advisory(AdvisoryKind::HashMismatch), "hash advisory");
            expect_throw(
                "strict file", [&] { Manifest::read_file(temp.path, {.strict = true}); }, "hash-mismatch");
            expect_throw(
                "strict async",
                [&] { Manifest::read_file_async(temp.path, {.strict = true}).get(); },
                "hash-mismatch");
        }

        {
            log("scenario: missing file");
            auto const missing = fs::temp_directory_path() / "egman-io-test-missing.manifest";
            expect_throw("sync missing", [&] { Manifest::read_file(missing); });
            expect_throw("async missing", [&] { Manifest::read_file_async(missing).get(); });
        }

        {
            log("scenario: directory is not a manifest");
            expect_throw("directory", [] {
                auto file = IO::File(fs::temp_directory_path());
                (void)file;
            });
        }
    });
}
