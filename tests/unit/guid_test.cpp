#include <eglib/guid.hpp>

#include <regex>

#include "../test_logger.hpp"

using namespace eglib;
using namespace eglib::tests;

int main() {
    return run("guid_test", [] {
        auto const pattern =
            std::regex("^[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}$");

        {
            log("scenario: canonical text from words");
            auto guid = Guid{.words = {0x12345678, 0x9ABCDEF0, 0x0FEDCBA9, 0x87654321}};
            log_kv("guid", guid.str());
            require(guid.str() == "12345678-9abc-def0-0fed-cba987654321", "canonical text");
            require(std::regex_match(guid.str(), pattern), "canonical text matches pattern");
            require(fmt::format("{}", guid) == guid.str(), "fmt formatter");
        }

        {
            log("scenario: zero and all ones keep their width");
            require(Guid{}.str() == "00000000-0000-0000-0000-000000000000", "zero guid");
            require(!Guid{}.is_valid(), "zero guid is not valid");
            auto ones = Guid{.words = {0xFFFFFFFF, 0xFFFFFFFF, 0xFFFFFFFF, 0xFFFFFFFF}};
            require(std::regex_match(ones.str(), pattern), "all ones matches pattern");
        }

        {
            log("scenario: accepted input forms");
            auto const expected = Guid{.words = {0x12345678, 0x9ABCDEF0, 0x0FEDCBA9, 0x87654321}};
            for (auto text : {"123456789ABCDEF00FEDCBA987654321",
                              "123456789abcdef00fedcba987654321",
                              "12345678-9ABC-DEF0-0FED-CBA987654321",
                              "12345678-9abc-def0-0fed-cba987654321",
                              "{12345678-9ABC-DEF0-0FED-CBA987654321}"}) {
                auto parsed = Guid::parse(text);
                require(parsed.has_value(), std::string("parse ") + text);
                require(*parsed == expected, std::string("value of ") + text);
            }
            require(Guid::canonical("123456789abcdef00fedcba987654321") == "12345678-9abc-def0-0fed-cba987654321",
                    "canonical from compact form");
        }

        {
            log("scenario: rejected input forms");
            for (auto text : {"",
                              "123456789ABCDEF00FEDCBA98765432",
                              "123456789ABCDEF00FEDCBA9876543210",
                              "123456789ABCDEF00FEDCBA98765432G",
                              "12345678-9ABC-DEF0-0FEDC-BA98765432",
                              "12345678--9ABC-DEF0-0FED-CBA9876543",
                              "[12345678-9ABC-DEF0-0FED-CBA987654321]",
                              "+2345678-9ABC-DEF0-0FED-CBA987654321"}) {
                require(!Guid::parse(text).has_value(), std::string("reject ") + text);
            }
        }

        {
            log("scenario: ordering follows words");
            auto low = Guid{.words = {1, 0, 0, 0}};
            auto high = Guid{.words = {2, 0, 0, 0}};
            require(low < high && low != high, "ordering");
        }
    });
}
