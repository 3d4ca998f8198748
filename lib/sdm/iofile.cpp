#include "iofile.hpp"

#include <cstring>
#include <stdexcept>

#include "common.hpp"

using namespace sdm;

#ifdef _WIN32
#    ifndef NOMINMAX
#        define NOMINMAX
#    endif
#    ifndef WIN32_LEAN_AND_MEAN
#        define WIN32_LEAN_AND_MEAN
#    endif
#    include <windows.h>

IO::File::File(fs::path const& path, Flags flags) {
    sdm_trace("path: %s", path.generic_string().c_str());
    if ((flags & WRITE) && path.has_parent_path()) {
        auto ec = std::error_code{};
        fs::create_directories(path.parent_path(), ec);
        if (ec) [[unlikely]] {
            throw_error(ErrorKind::IO, "create_directories", ec);
        }
    }
    DWORD access = (flags & WRITE) ? (GENERIC_READ | GENERIC_WRITE) : GENERIC_READ;
    DWORD share = (flags & WRITE) ? FILE_SHARE_READ : FILE_SHARE_READ | FILE_SHARE_WRITE;
    DWORD disposition = (flags & WRITE) ? ((flags & TRUNCATE) ? CREATE_ALWAYS : OPEN_ALWAYS) : OPEN_EXISTING;
    DWORD attributes = FILE_ATTRIBUTE_NORMAL;
    if (flags & SEQUENTIAL) {
        attributes |= FILE_FLAG_SEQUENTIAL_SCAN;
    }
    if (flags & RANDOM_ACCESS) {
        attributes |= FILE_FLAG_RANDOM_ACCESS;
    }
    auto const fd = ::CreateFileW(path.wstring().c_str(), access, share, 0, disposition, attributes, 0);
    if (!fd || fd == INVALID_HANDLE_VALUE) [[unlikely]] {
        auto ec = std::error_code((int)GetLastError(), std::system_category());
        throw_error(ErrorKind::IO, "CreateFile", ec);
    }
    LARGE_INTEGER size = {};
    if (::GetFileSizeEx(fd, &size) == FALSE) [[unlikely]] {
        auto ec = std::error_code((int)GetLastError(), std::system_category());
        ::CloseHandle(fd);
        throw_error(ErrorKind::IO, "GetFileSizeEx", ec);
    }
    impl_ = {.fd = (std::intptr_t)fd, .size = (std::uint64_t)size.QuadPart, .flags = flags};
}

IO::File::~File() noexcept {
    if (auto impl = std::exchange(impl_, {}); impl.fd != -1) {
        ::CloseHandle((HANDLE)impl.fd);
    }
}

auto IO::File::resize(std::uint64_t offset, std::uint64_t count) noexcept -> bool {
    if (impl_.fd == -1 || !(impl_.flags & WRITE)) {
        return false;
    }
    std::uint64_t const total = offset + count;
    if (total < offset || total < count) {
        return false;
    }
    if (impl_.size == total) {
        return true;
    }
    FILE_END_OF_FILE_INFO i = {.EndOfFile = {.QuadPart = (LONGLONG)total}};
    if (::SetFileInformationByHandle((HANDLE)impl_.fd, FileEndOfFileInfo, &i, sizeof(i)) == FALSE) [[unlikely]] {
        return false;
    }
    impl_.size = total;
    return true;
}

auto IO::File::read(std::uint64_t offset, std::span<char> dst) const noexcept -> bool {
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

auto IO::File::write(std::uint64_t offset, std::span<char const> src) noexcept -> bool {
    constexpr std::size_t CHUNK = 0x4000'0000;
    if (impl_.fd == -1 || !(impl_.flags & WRITE)) {
        return false;
    }
    std::uint64_t const write_end = offset + src.size();
    if (write_end < offset || write_end < src.size()) {
        return false;
    }
    while (!src.empty()) {
        DWORD wanted = (DWORD)std::min(CHUNK, src.size());
        OVERLAPPED off = {.Offset = (std::uint32_t)offset, .OffsetHigh = (std::uint32_t)(offset >> 32)};
        DWORD got = {};
        ::WriteFile((HANDLE)impl_.fd, src.data(), wanted, &got, &off);
        if (!got || got > wanted) {
            return false;
        }
        src = src.subspan(got);
        offset += got;
    }
    if (write_end > impl_.size) {
        impl_.size = write_end;
    }
    return true;
}

#else
#    include <errno.h>
#    include <fcntl.h>
#    include <sys/stat.h>
#    include <unistd.h>

IO::File::File(fs::path const& path, Flags flags) {
    sdm_trace("path: %s", path.generic_string().c_str());
    if ((flags & WRITE) && path.has_parent_path()) {
        auto ec = std::error_code{};
        fs::create_directories(path.parent_path(), ec);
        if (ec) [[unlikely]] {
            throw_error(ErrorKind::IO, "create_directories", ec);
        }
    }
    int fd = -1;
    if (flags & WRITE) {
        fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC | ((flags & TRUNCATE) ? O_TRUNC : 0), 0644);
    } else {
        fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    }
    if (fd == -1) [[unlikely]] {
        auto ec = std::error_code((int)errno, std::system_category());
        throw_error(ErrorKind::IO, "::open", ec);
    }
    struct ::stat size = {};
    if (::fstat(fd, &size) == -1) [[unlikely]] {
        auto ec = std::error_code((int)errno, std::system_category());
        ::close(fd);
        throw_error(ErrorKind::IO, "::fstat", ec);
    }
#    ifdef POSIX_FADV_SEQUENTIAL
    if (flags & SEQUENTIAL) {
        ::posix_fadvise(fd, 0, 0, POSIX_FADV_SEQUENTIAL);
    }
    if (flags & RANDOM_ACCESS) {
        ::posix_fadvise(fd, 0, 0, POSIX_FADV_RANDOM);
    }
#    endif
    impl_ = {.fd = (std::intptr_t)fd, .size = (std::uint64_t)size.st_size, .flags = flags};
}

IO::File::~File() noexcept {
    if (auto impl = std::exchange(impl_, {}); impl.fd != -1) {
        ::close((int)impl.fd);
    }
}

auto IO::File::resize(std::uint64_t offset, std::uint64_t count) noexcept -> bool {
    if (impl_.fd == -1 || !(impl_.flags & WRITE)) {
        return false;
    }
    std::uint64_t const total = offset + count;
    if (total < offset || total < count) {
        return false;
    }
    if (impl_.size == total) {
        return true;
    }
    if (::ftruncate((int)impl_.fd, (off_t)total) == -1) [[unlikely]] {
        return false;
    }
    impl_.size = total;
    return true;
}

auto IO::File::read(std::uint64_t offset, std::span<char> dst) const noexcept -> bool {
    if (impl_.fd == -1) {
        return false;
    }
    while (!dst.empty()) {
        auto got = ::pread((int)impl_.fd, dst.data(), dst.size(), (off_t)offset);
        if (got == -1 && errno == EINTR) {
            continue;
        }
        if (got <= 0 || (std::size_t)got > dst.size()) {
            return false;
        }
        dst = dst.subspan(got);
        offset += got;
    }
    return true;
}

auto IO::File::write(std::uint64_t offset, std::span<char const> src) noexcept -> bool {
    if (impl_.fd == -1 || !(impl_.flags & WRITE)) {
        return false;
    }
    std::uint64_t const write_end = offset + src.size();
    if (write_end < offset || write_end < src.size()) {
        return false;
    }
    while (!src.empty()) {
        auto got = ::pwrite((int)impl_.fd, src.data(), src.size(), (off_t)offset);
        if (got == -1 && errno == EINTR) {
            continue;
        }
        if (got <= 0 || (std::size_t)got > src.size()) {
            return false;
        }
        src = src.subspan(got);
        offset += got;
    }
    if (write_end > impl_.size) {
        impl_.size = write_end;
    }
    return true;
}

#endif
