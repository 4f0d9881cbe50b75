#include <fmt/format.h>

#include <argparse/argparse.hpp>
#include <eglib/common.hpp>
#include <eglib/emanifest.hpp>
#include <iostream>

using namespace eglib;

struct Main {
    struct CLI {
        std::string manifest = {};
        ReadOptions options = {};
    } cli = {};

    auto parse_args(int argc, char** argv) -> void {
        argparse::ArgumentParser program(fs::path(argv[0]).filename().generic_string());
        program.add_description("Prints manifest summary.");
        program.add_argument("manifest").help("Manifest file to read from.").required();

        program.add_argument("--strict")
            .help("Fail on hash mismatch, short or encrypted payload.")
            .default_value(false)
            .implicit_value(true);

        program.parse_args(argc, argv);

        cli.options.strict = program.get<bool>("--strict");
        cli.manifest = program.get<std::string>("manifest");
    }

    auto run() -> void {
        eglib_trace("Manifest file: %s", cli.manifest.c_str());
        auto manifest = Manifest::read_file(cli.manifest, cli.options);
        auto const& header = manifest.header;

        std::cout << fmt::format("format: {}", manifest.format == Format::Binary ? "binary" : "json") << std::endl;
        if (manifest.format == Format::Binary) {
            std::cout << fmt::format("header: version {}, stored as {:#04x}, {} of {} bytes, sha1 {}",
                                     header.version,
                                     header.stored_as,
                                     header.data_size_compressed,
                                     header.data_size_uncompressed,
                                     header.sha1_hash)
                      << std::endl;
        }
        if (auto const& meta = manifest.meta) {
            std::cout << fmt::format("app: {} ({})", meta->app_name, meta->app_id) << std::endl;
            std::cout << fmt::format("build: {}", meta->build_version) << std::endl;
            if (meta->build_id) {
                std::cout << fmt::format("build id: {}", *meta->build_id) << std::endl;
            }
            std::cout << fmt::format("launch: {} {}", meta->launch_exe, meta->launch_command) << std::endl;
            std::cout << fmt::format("feature level: {}, meta v{}", meta->feature_level, meta->data_version)
                      << std::endl;
        }
        if (auto const& chunks = manifest.chunk_list) {
            std::cout << fmt::format("chunks: {} of {} declared", chunks->elements.size(), chunks->count) << std::endl;
            std::cout << fmt::format("download size: {}", chunks->download_size()) << std::endl;
            std::cout << fmt::format("install size: {}", chunks->install_size()) << std::endl;
        }
        if (auto const& files = manifest.file_list) {
            auto total = std::uint64_t{};
            for (auto const& file : files->files) {
                total += file.file_size;
            }
            std::cout << fmt::format("files: {} of {} declared, {} bytes", files->files.size(), files->count, total)
                      << std::endl;
        }
        if (auto const& custom = manifest.custom_fields) {
            for (auto const& [key, value] : custom->fields) {
                std::cout << fmt::format("custom: {} = {}", key, value) << std::endl;
            }
        }
        for (auto const& advisory : manifest.advisories) {
            std::cout << fmt::format("advisory: {}: {}", advisory.kind, advisory.message) << std::endl;
        }
    }
};

int main(int argc, char** argv) {
    auto main = Main{};
    try {
        main.parse_args(argc, argv);
        main.run();
    } catch (std::exception const& e) {
        std::cerr << e.what() << std::endl;
        for (auto const& error : error_stack()) {
            std::cerr << error << std::endl;
        }
        error_stack().clear();
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
