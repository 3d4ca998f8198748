#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <utility>

namespace sdm {
    namespace fs = std::filesystem;

    struct IO {
        struct File;

        enum Flags : unsigned;

        virtual ~IO() noexcept = default;

        virtual auto size() const noexcept -> std::uint64_t = 0;

        virtual auto resize(std::uint64_t offset, std::uint64_t count) noexcept -> bool = 0;

        virtual auto read(std::uint64_t offset, std::span<char> dst) const noexcept -> bool = 0;

        // Positioned write, the file cursor is never used.
        virtual auto write(std::uint64_t offset, std::span<char const> src) noexcept -> bool = 0;

    protected:
        constexpr IO() noexcept = default;
        constexpr IO(IO&& other) noexcept = default;
        constexpr IO(IO const& other) noexcept = delete;
        constexpr IO& operator=(IO const& other) noexcept = delete;
        constexpr IO& operator=(IO&& other) noexcept = default;
    };

    enum IO::Flags : unsigned {
        READ = 0,
        WRITE = 1 << 0,
        SEQUENTIAL = 1 << 1,
        RANDOM_ACCESS = 1 << 2,
        TRUNCATE = 1 << 3,
    };

    constexpr auto operator|(IO::Flags lhs, IO::Flags rhs) noexcept -> IO::Flags {
        return (IO::Flags)((unsigned)lhs | (unsigned)rhs);
    }

    constexpr auto operator&(IO::Flags lhs, IO::Flags rhs) noexcept -> IO::Flags {
        return (IO::Flags)((unsigned)lhs & (unsigned)rhs);
    }

    // Writers running on several threads must stay inside the size set by resize().
    struct IO::File final : IO {
        constexpr File() noexcept = default;

        File(File&& other) noexcept : impl_(std::exchange(other.impl_, {})) {}

        File& operator=(File&& other) noexcept {
            std::swap(impl_, other.impl_);
            return *this;
        }

        File(fs::path const& path, Flags flags);

        ~File() noexcept;

        auto size() const noexcept -> std::uint64_t override { return impl_.size; }

        auto resize(std::uint64_t offset, std::uint64_t count) noexcept -> bool override;

        auto read(std::uint64_t offset, std::span<char> dst) const noexcept -> bool override;

        auto write(std::uint64_t offset, std::span<char const> src) noexcept -> bool override;

    private:
        struct Impl {
            std::intptr_t fd = -1;
            std::uint64_t size = {};
            Flags flags = {};
        } impl_ = {};
    };
}
