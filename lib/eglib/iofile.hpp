#pragma once
#include <cinttypes>
#include <cstddef>
#include <filesystem>
#include <span>
#include <utility>
#include <vector>

namespace eglib {
    namespace fs = std::filesystem;

    struct IO {
        struct File;

        virtual ~IO() noexcept = default;

        virtual auto fd() const noexcept -> std::intptr_t = 0;

        virtual auto size() const noexcept -> std::size_t = 0;

        virtual auto read(std::size_t offset, std::span<char> dst) const noexcept -> bool = 0;

        // Whole contents, throws when the bytes can not be read.
        auto read_all() const -> std::vector<char>;

    private:
        constexpr IO() noexcept = default;
        constexpr IO(IO&& other) noexcept = default;
        constexpr IO(IO const& other) noexcept = delete;
        constexpr IO& operator=(IO const& other) noexcept = delete;
        constexpr IO& operator=(IO&& other) noexcept = default;
    };

    // Read only file handle.
    struct IO::File final : IO {
        constexpr File() noexcept = default;

        constexpr File(File&& other) noexcept : impl_(std::exchange(other.impl_, {})) {}

        constexpr File& operator=(File&& other) noexcept {
            impl_ = std::exchange(other.impl_, {});
            return *this;
        }

        explicit File(fs::path const& path);

        ~File() noexcept;

        auto fd() const noexcept -> std::intptr_t override { return impl_.fd; }

        auto size() const noexcept -> std::size_t override { return impl_.size; }

        auto read(std::size_t offset, std::span<char> dst) const noexcept -> bool override;

    private:
        struct Impl {
            std::intptr_t fd = -1;
            std::size_t size = {};
        } impl_ = {};
    };
}
