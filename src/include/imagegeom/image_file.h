#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file image_file.h
 * \brief Header-prefix access to a queued image file.
 */

namespace imagegeom {

/// Upload cap of the posting service (bytes). Larger files are rejected.
inline constexpr uint64_t kDefaultMaxImageFileBytes = 1000000ULL;

/// Status code for \ref ImageFile::open.
enum class ImageFileStatus : uint8_t {
    Ok,
    OpenFailed,
    StatFailed,
    /// The file exceeds the upload cap. Nothing was mapped.
    TooLarge,
    MapFailed,
};

/**
 * \brief Read-only view of the leading bytes of an image file.
 *
 * Only the container headers are needed to measure an image, so \ref open
 * maps at most \p max_map_bytes from the start of the file. The full on-disk
 * size is checked against the upload cap before anything is mapped.
 *
 * The file descriptor is released as soon as the view exists; the object
 * owns the mapping only.
 */
class ImageFile final {
public:
    ImageFile() noexcept = default;
    ~ImageFile() noexcept;

    ImageFile(const ImageFile&)            = delete;
    ImageFile& operator=(const ImageFile&) = delete;

    ImageFile(ImageFile&& other) noexcept;
    ImageFile& operator=(ImageFile&& other) noexcept;

    /**
     * \brief Opens \p path and maps its leading bytes.
     *
     * - \p max_file_bytes: upload cap on the whole file (0 = unlimited).
     * - \p max_map_bytes: how many leading bytes to map (0 = whole file).
     */
    ImageFileStatus open(const char* path,
                         uint64_t max_file_bytes = kDefaultMaxImageFileBytes,
                         uint64_t max_map_bytes  = 0) noexcept;

    void close() noexcept;

    bool is_open() const noexcept { return open_; }

    /// On-disk size of the file, independent of the mapped prefix.
    uint64_t file_size() const noexcept { return file_size_; }

    /// True when \ref bytes covers less than the whole file.
    bool truncated() const noexcept { return mapped_size_ < file_size_; }

    /// The mapped prefix. Empty for empty files and after \ref close.
    std::span<const std::byte> bytes() const noexcept;

private:
    const std::byte* data_ = nullptr;
    uint64_t mapped_size_  = 0;
    uint64_t file_size_    = 0;
    bool open_             = false;
};

/// Stable lowercase name (e.g. "too_large").
const char*
image_file_status_name(ImageFileStatus status) noexcept;

}  // namespace imagegeom
