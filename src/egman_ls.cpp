#include <fmt/args.h>
#include <fmt/format.h>

#include <argparse/argparse.hpp>
#include <eglib/common.hpp>
#include <eglib/emanifest.hpp>
#include <iostream>

using namespace eglib;

struct Main {
    struct CLI {
        std::string manifest = {};
        std::string format = {};
        bool verbose = {};
        FileManifest::Match match = {};
    } cli = {};

    auto parse_args(int argc, char** argv) -> void {
        argparse::ArgumentParser program(fs::path(argv[0]).filename().generic_string());
        program.add_description("Lists files in manifest.");
        program.add_argument("manifest").help("Manifest file to read from.").required();

        program.add_argument("--format")
            .help("Format output: {path}, {size}, {hash}, {mime}, {tags}, {parts}.")
            .default_value(std::string("{path},{size},{hash},{tags}"));

        program.add_argument("-p", "--filter-path")
            .help("Filter: path with regex match.")
            .default_value(std::optional<std::regex>{})
            .action([](std::string const& value) -> std::optional<std::regex> {
                if (value.empty()) {
                    return std::nullopt;
                } else {
                    return std::regex{value, std::regex::optimize | std::regex::icase};
                }
            });
        program.add_argument("-t", "--filter-tag")
            .help("Filter: install tags with regex match(^$ for untagged files).")
            .default_value(std::optional<std::regex>{})
            .action([](std::string const& value) -> std::optional<std::regex> {
                if (value.empty()) {
                    return std::nullopt;
                } else {
                    return std::regex{value, std::regex::optimize | std::regex::icase};
                }
            });
        program.add_argument("-v", "--verbose")
            .help("Print advisories to stderr.")
            .default_value(false)
            .implicit_value(true);

        program.parse_args(argc, argv);

        cli.format = program.get<std::string>("--format");
        cli.verbose = program.get<bool>("--verbose");

        cli.match.path = program.get<std::optional<std::regex>>("--filter-path");
        cli.match.tags = program.get<std::optional<std::regex>>("--filter-tag");

        cli.manifest = program.get<std::string>("manifest");
    }

    auto run() -> void {
        eglib_trace("Manifest file: %s", cli.manifest.c_str());
        auto manifest = Manifest::read_file(cli.manifest);

        if (cli.verbose) {
            for (auto const& advisory : manifest.advisories) {
                std::cerr << fmt::format("{}: {}", advisory.kind, advisory.message) << std::endl;
            }
        }
        if (!manifest.file_list) {
            return;
        }
        for (auto const& file : manifest.file_list->files) {
            if (!cli.match(file)) {
                continue;
            }
            fmt::dynamic_format_arg_store<fmt::format_context> store{};
            store.push_back(fmt::arg("path", file.filename));
            store.push_back(fmt::arg("size", file.file_size));
            store.push_back(fmt::arg("hash", file.sha_hash));
            store.push_back(fmt::arg("mime", file.mime_type));
            store.push_back(fmt::arg("tags", file.tags()));
            store.push_back(fmt::arg("parts", file.chunk_parts.size()));
            std::cout << fmt::vformat(cli.format, store) << std::endl;
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
