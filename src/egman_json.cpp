#include <fmt/format.h>

#include <argparse/argparse.hpp>
#include <eglib/common.hpp>
#include <eglib/edump.hpp>
#include <eglib/emanifest.hpp>
#include <iostream>

using namespace eglib;

struct Main {
    struct CLI {
        std::string manifest = {};
        int indent = {};
        bool verbose = {};
    } cli = {};

    auto parse_args(int argc, char** argv) -> void {
        argparse::ArgumentParser program(fs::path(argv[0]).filename().generic_string());
        program.add_description("Dumps manifest as json.");
        program.add_argument("manifest").help("Manifest file to read from.").required();

        program.add_argument("--indent")
            .help("Spaces per indent level, -1 for compact output.")
            .default_value(int{2})
            .action([](std::string const& value) -> int { return std::clamp(std::stoi(value), -1, 16); });
        program.add_argument("-v", "--verbose")
            .help("Print advisories to stderr.")
            .default_value(false)
            .implicit_value(true);

        program.parse_args(argc, argv);

        cli.indent = program.get<int>("--indent");
        cli.verbose = program.get<bool>("--verbose");
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
        // 8-bit names are not guaranteed to be utf-8
        std::cout << dump(manifest).dump(cli.indent, ' ', false, nlohmann::json::error_handler_t::replace)
                  << std::endl;
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
