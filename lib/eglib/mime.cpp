#include "mime.hpp"

#include <array>
#include <utility>

#include "common.hpp"

using namespace eglib;

static constexpr std::pair<std::string_view, std::string_view> MIME_TYPES[] = {
    {"7z", "application/x-7z-compressed"},
    {"avi", "video/x-msvideo"},
    {"bat", "application/x-bat"},
    {"bik", "video/vnd.radgametools.bink"},
    {"bin", "application/octet-stream"},
    {"bmp", "image/bmp"},
    {"bk2", "video/vnd.radgametools.bink"},
    {"cfg", "text/plain"},
    {"css", "text/css"},
    {"csv", "text/csv"},
    {"dat", "application/octet-stream"},
    {"dds", "image/vnd-ms.dds"},
    {"dll", "application/x-msdownload"},
    {"dylib", "application/x-mach-binary"},
    {"exe", "application/x-msdownload"},
    {"gif", "image/gif"},
    {"gz", "application/gzip"},
    {"htm", "text/html"},
    {"html", "text/html"},
    {"ico", "image/vnd.microsoft.icon"},
    {"ini", "text/plain"},
    {"jpeg", "image/jpeg"},
    {"jpg", "image/jpeg"},
    {"js", "text/javascript"},
    {"json", "application/json"},
    {"log", "text/plain"},
    {"md", "text/markdown"},
    {"mp3", "audio/mpeg"},
    {"mp4", "video/mp4"},
    {"msi", "application/x-msi"},
    {"ogg", "audio/ogg"},
    {"otf", "font/otf"},
    {"pdb", "application/x-ms-pdb"},
    {"pdf", "application/pdf"},
    {"png", "image/png"},
    {"sh", "application/x-sh"},
    {"so", "application/x-sharedlib"},
    {"svg", "image/svg+xml"},
    {"tga", "image/x-tga"},
    {"ttf", "font/ttf"},
    {"txt", "text/plain"},
    {"wav", "audio/wav"},
    {"webm", "video/webm"},
    {"webp", "image/webp"},
    {"woff", "font/woff"},
    {"woff2", "font/woff2"},
    {"xml", "application/xml"},
    {"zip", "application/zip"},
};

auto eglib::mime_type_of(std::string_view path) noexcept -> std::string_view {
    auto const slash = path.find_last_of("/\\");
    auto const name = slash == std::string_view::npos ? path : path.substr(slash + 1);
    auto const dot = name.find_last_of('.');
    if (dot == std::string_view::npos || dot == 0) {
        return DEFAULT_MIME_TYPE;
    }
    auto const extension = name.substr(dot + 1);
    for (auto const& [key, type] : MIME_TYPES) {
        if (str_eq_ci(key, extension)) {
            return type;
        }
    }
    return DEFAULT_MIME_TYPE;
}
