#include "imagegeom/image_file.h"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <utility>

#if defined(_WIN32)
#    define WIN32_LEAN_AND_MEAN
#    include <windows.h>
#else
#    include <fcntl.h>
#    include <sys/mman.h>
#    include <sys/stat.h>
#    include <unistd.h>
#endif

namespace imagegeom {
namespace {

    // Result of mapping the head of a file. `data` is null when `mapped` is 0.
    struct PrefixMapping final {
        const std::byte* data = nullptr;
        uint64_t mapped       = 0;
        uint64_t file_size    = 0;
    };


    static uint64_t prefix_length(uint64_t file_size,
                                  uint64_t max_map_bytes) noexcept
    {
        if (max_map_bytes == 0U || max_map_bytes > file_size) {
            return file_size;
        }
        return max_map_bytes;
    }


    static bool exceeds_upload_cap(uint64_t file_size,
                                   uint64_t max_file_bytes) noexcept
    {
        return max_file_bytes != 0U && file_size > max_file_bytes;
    }


    static bool fits_address_space(uint64_t len) noexcept
    {
        return len <= static_cast<uint64_t>(std::numeric_limits<size_t>::max());
    }

#if defined(_WIN32)

    static ImageFileStatus map_prefix(const char* path, uint64_t max_file_bytes,
                                      uint64_t max_map_bytes,
                                      PrefixMapping* out) noexcept
    {
        HANDLE file = ::CreateFileA(path, GENERIC_READ, FILE_SHARE_READ,
                                    nullptr, OPEN_EXISTING,
                                    FILE_ATTRIBUTE_NORMAL, nullptr);
        if (file == INVALID_HANDLE_VALUE) {
            return ImageFileStatus::OpenFailed;
        }

        LARGE_INTEGER sz;
        if (!::GetFileSizeEx(file, &sz) || sz.QuadPart < 0) {
            ::CloseHandle(file);
            return ImageFileStatus::StatFailed;
        }
        out->file_size = static_cast<uint64_t>(sz.QuadPart);
        if (exceeds_upload_cap(out->file_size, max_file_bytes)) {
            ::CloseHandle(file);
            return ImageFileStatus::TooLarge;
        }

        const uint64_t len = prefix_length(out->file_size, max_map_bytes);
        if (!fits_address_space(len)) {
            ::CloseHandle(file);
            return ImageFileStatus::TooLarge;
        }
        if (len == 0U) {
            ::CloseHandle(file);
            return ImageFileStatus::Ok;
        }

        // The view keeps the section alive; both handles can go right away.
        HANDLE section = ::CreateFileMappingA(file, nullptr, PAGE_READONLY, 0,
                                              0, nullptr);
        ::CloseHandle(file);
        if (!section) {
            return ImageFileStatus::MapFailed;
        }
        void* view = ::MapViewOfFile(section, FILE_MAP_READ, 0, 0,
                                     static_cast<SIZE_T>(len));
        ::CloseHandle(section);
        if (!view) {
            return ImageFileStatus::MapFailed;
        }

        out->data   = static_cast<const std::byte*>(view);
        out->mapped = len;
        return ImageFileStatus::Ok;
    }


    static void unmap_prefix(const std::byte* data, uint64_t) noexcept
    {
        (void)::UnmapViewOfFile(static_cast<const void*>(data));
    }

#else

    static ImageFileStatus map_prefix(const char* path, uint64_t max_file_bytes,
                                      uint64_t max_map_bytes,
                                      PrefixMapping* out) noexcept
    {
        const int fd = ::open(path, O_RDONLY | O_CLOEXEC);
        if (fd < 0) {
            return ImageFileStatus::OpenFailed;
        }

        struct stat st {};
        if (::fstat(fd, &st) != 0 || st.st_size < 0) {
            (void)::close(fd);
            return ImageFileStatus::StatFailed;
        }
        out->file_size = static_cast<uint64_t>(st.st_size);
        if (exceeds_upload_cap(out->file_size, max_file_bytes)) {
            (void)::close(fd);
            return ImageFileStatus::TooLarge;
        }

        const uint64_t len = prefix_length(out->file_size, max_map_bytes);
        if (!fits_address_space(len)) {
            (void)::close(fd);
            return ImageFileStatus::TooLarge;
        }
        if (len == 0U) {
            // mmap rejects zero-length mappings.
            (void)::close(fd);
            return ImageFileStatus::Ok;
        }

        void* view = ::mmap(nullptr, static_cast<size_t>(len), PROT_READ,
                            MAP_PRIVATE, fd, 0);
        (void)::close(fd);
        if (view == MAP_FAILED) {
            return ImageFileStatus::MapFailed;
        }

        out->data   = static_cast<const std::byte*>(view);
        out->mapped = len;
        return ImageFileStatus::Ok;
    }


    static void unmap_prefix(const std::byte* data, uint64_t len) noexcept
    {
        (void)::munmap(const_cast<void*>(static_cast<const void*>(data)),
                       static_cast<size_t>(len));
    }

#endif

}  // namespace

ImageFile::~ImageFile() noexcept
{
    close();
}


ImageFile::ImageFile(ImageFile&& other) noexcept
    : data_(std::exchange(other.data_, nullptr))
    , mapped_size_(std::exchange(other.mapped_size_, 0))
    , file_size_(std::exchange(other.file_size_, 0))
    , open_(std::exchange(other.open_, false))
{
}


ImageFile&
ImageFile::operator=(ImageFile&& other) noexcept
{
    if (this != &other) {
        close();
        data_        = std::exchange(other.data_, nullptr);
        mapped_size_ = std::exchange(other.mapped_size_, 0);
        file_size_   = std::exchange(other.file_size_, 0);
        open_        = std::exchange(other.open_, false);
    }
    return *this;
}


ImageFileStatus
ImageFile::open(const char* path, uint64_t max_file_bytes,
                uint64_t max_map_bytes) noexcept
{
    close();
    if (!path || !*path) {
        return ImageFileStatus::OpenFailed;
    }

    PrefixMapping mapping;
    const ImageFileStatus status = map_prefix(path, max_file_bytes,
                                              max_map_bytes, &mapping);
    if (status != ImageFileStatus::Ok) {
        return status;
    }

    data_        = mapping.data;
    mapped_size_ = mapping.mapped;
    file_size_   = mapping.file_size;
    open_        = true;
    return ImageFileStatus::Ok;
}


void
ImageFile::close() noexcept
{
    if (data_) {
        unmap_prefix(data_, mapped_size_);
    }
    data_        = nullptr;
    mapped_size_ = 0;
    file_size_   = 0;
    open_        = false;
}


std::span<const std::byte>
ImageFile::bytes() const noexcept
{
    if (!data_) {
        return {};
    }
    return std::span<const std::byte>(data_,
                                      static_cast<size_t>(mapped_size_));
}


const char*
image_file_status_name(ImageFileStatus status) noexcept
{
    switch (status) {
    case ImageFileStatus::Ok: return "ok";
    case ImageFileStatus::OpenFailed: return "open_failed";
    case ImageFileStatus::StatFailed: return "stat_failed";
    case ImageFileStatus::TooLarge: return "too_large";
    case ImageFileStatus::MapFailed: return "map_failed";
    }
    return "unknown";
}

}  // namespace imagegeom
