#include "iofile.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include "common.hpp"

using namespace eglib;

auto IO::read_all() const -> std::vector<char> {
    auto result = std::vector<char>(size());
    if (!read(0, result)) {
        eglib_error(fmt::format(": short read of {} bytes", result.size()));
    }
    return result;
}

#ifdef _WIN32
#    ifndef NOMINMAX
#        define NOMINMAX
#    endif
#    ifndef WIN32_LEAN_AND_MEAN
#        define WIN32_LEAN_AND_MEAN
#    endif
#    include <windows.h>

IO::File::File(fs::path const& path) {
    eglib_trace("path: %s", path.generic_string().c_str());
    auto const fd = ::CreateFileW(path.wstring().c_str(),
                                  GENERIC_READ,
                                  FILE_SHARE_READ,
                                  0,
                                  OPEN_EXISTING,
                                  FILE_ATTRIBUTE_NORMAL | FILE_FLAG_SEQUENTIAL_SCAN,
                                  0);
    if (!fd || fd == INVALID_HANDLE_VALUE) [[unlikely]] {
        auto ec = std::error_code((int)GetLastError(), std::system_category());
        throw_error("CreateFile: ", ec);
    }
    LARGE_INTEGER size = {};
    if (::GetFileSizeEx(fd, &size) == FALSE) [[unlikely]] {
        auto ec = std::error_code((int)GetLastError(), std::system_category());
        ::CloseHandle(fd);
        throw_error("GetFileSizeEx: ", ec);
    }
    impl_ = {.fd = (std::intptr_t)fd, .size = (std::size_t)size.QuadPart};
}

IO::File::~File() noexcept {
    if (auto impl = std::exchange(impl_, {}); impl.fd != -1) {
        ::CloseHandle((HANDLE)impl.fd);
    }
}

auto IO::File::read(std::size_t offset, std::span<char> dst) const noexcept -> bool {
    constexpr std::size_t CHUNK = 0x1000'0000;
    if (impl_.fd == -1) {
        return false;
    }
    while (!dst.empty()) {
        DWORD wanted = (DWORD)std::min(CHUNK, dst.size());
        OVERLAPPED off = {.Offset = (std::uint32_t)offset, .OffsetHigh = (std::uint32_t)(offset >> 32)};
        DWORD got = {};
        ::ReadFile((HANDLE)impl_.fd, dst.data(), wanted, &got, &off);
        if (!got || got > wanted) {
            return false;
        }
        dst = dst.subspan(got);
        offset += got;
    }
    return true;
}
#else
#    include <fcntl.h>
#    include <sys/stat.h>
#    include <unistd.h>

IO::File::File(fs::path const& path) {
    eglib_trace("path: %s", path.generic_string().c_str());
    int fd = ::open(path.string().c_str(), O_RDONLY);
    if (fd == -1) [[unlikely]] {
        auto ec = std::error_code((int)errno, std::system_category());
        throw_error("::open: ", ec);
    }
    struct ::stat size = {};
    if (::fstat(fd, &size) == -1) [[unlikely]] {
        auto ec = std::error_code((int)errno, std::system_category());
        ::close(fd);
        throw_error("::fstat: ", ec);
    }
    if (!S_ISREG(size.st_mode)) [[unlikely]] {
        ::close(fd);
        throw_error("::fstat: ", std::make_error_code(std::errc::invalid_argument));
    }
    impl_ = {.fd = (std::intptr_t)fd, .size = (std::size_t)size.st_size};
}

IO::File::~File() noexcept {
    if (auto impl = std::exchange(impl_, {}); impl.fd != -1) {
        ::close((int)impl.fd);
    }
}

auto IO::File::read(std::size_t offset, std::span<char> dst) const noexcept -> bool {
    if (impl_.fd == -1) {
        return false;
    }
    while (!dst.empty()) {
        auto got = ::pread((int)impl_.fd, dst.data(), dst.size(), (off_t)offset);
        if (got <= 0 || (std::size_t)got > dst.size()) {
            return false;
        }
        dst = dst.subspan((std::size_t)got);
        offset += (std::size_t)got;
    }
    return true;
}
#endif
