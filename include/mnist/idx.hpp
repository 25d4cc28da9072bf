#pragma once

/**
 * @file idx.hpp
 * @brief Decoders for the IDX label and image streams.
 *
 * The IDX format stores a short big endian header followed by records laid
 * out back to back without padding. Label files carry an 8 byte header and
 * one byte per label. Image files carry a 16 byte header holding the magic,
 * the record count and the row and column counts, followed by
 * `count * rows * cols` unsigned pixel bytes.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "mnist/errors.hpp"

namespace mnist {

/// One label per image, normally in the range 0-9.
using Label = std::uint8_t;

/// Flat row-major image with intensities normalised to [0, 1].
using Image = std::vector<float>;

constexpr std::size_t kLabelHeaderSize = 8;
constexpr std::size_t kImageHeaderSize = 16;

/// Decoded header of an IDX image stream.
struct ImageHeader {
    std::uint32_t magic{0};
    std::uint32_t count{0};
    std::uint32_t rows{0};
    std::uint32_t cols{0};

    std::size_t image_size() const {
        return static_cast<std::size_t>(rows) * static_cast<std::size_t>(cols);
    }
};

/**
 * @brief Read a big endian 32-bit integer starting at @p offset.
 */
inline std::uint32_t read_be32(const std::vector<std::uint8_t>& data, std::size_t offset) {
    if (data.size() < 4 || offset > data.size() - 4)
        throw LoadError(ErrorKind::Corrupt,
                        "read past end of IDX data at offset " + std::to_string(offset));
    return (static_cast<std::uint32_t>(data[offset]) << 24) |
           (static_cast<std::uint32_t>(data[offset + 1]) << 16) |
           (static_cast<std::uint32_t>(data[offset + 2]) << 8) |
           static_cast<std::uint32_t>(data[offset + 3]);
}

/**
 * @brief Extract labels from a decompressed label stream.
 *
 * The 8 byte header is skipped without being interpreted; every byte after
 * it is one label. Values are not range checked.
 */
inline std::vector<Label> decode_labels(const std::vector<std::uint8_t>& data) {
    if (data.size() < kLabelHeaderSize)
        throw LoadError(ErrorKind::Corrupt, "IDX label stream shorter than its header (" +
                                                std::to_string(data.size()) + " bytes)");
    return std::vector<Label>(data.begin() + kLabelHeaderSize, data.end());
}

inline ImageHeader read_image_header(const std::vector<std::uint8_t>& data) {
    if (data.size() < kImageHeaderSize)
        throw LoadError(ErrorKind::Corrupt, "IDX image stream shorter than its header (" +
                                                std::to_string(data.size()) + " bytes)");
    ImageHeader header;
    header.magic = read_be32(data, 0);
    header.count = read_be32(data, 4);
    header.rows = read_be32(data, 8);
    header.cols = read_be32(data, 12);
    return header;
}

/**
 * @brief Decode every image of a decompressed image stream.
 *
 * The record size comes from the header. A buffer too short to hold
 * `count` records is treated as corruption and rejected before any image is
 * produced. Bytes beyond the last record are ignored.
 */
inline std::vector<Image> decode_images(const std::vector<std::uint8_t>& data) {
    ImageHeader header = read_image_header(data);
    const std::size_t image_size = header.image_size();
    const std::size_t payload = data.size() - kImageHeaderSize;
    if (image_size == 0 && header.count > 0)
        throw LoadError(ErrorKind::Corrupt, "IDX image header declares " +
                                                std::to_string(header.count) +
                                                " images with zero rows or columns");
    if (header.count > payload / image_size)
        throw LoadError(ErrorKind::Corrupt,
                        "truncated IDX image data: header declares " +
                            std::to_string(header.count) + " images of " +
                            std::to_string(image_size) + " bytes but only " +
                            std::to_string(payload) + " bytes follow");

    std::vector<Image> images;
    images.reserve(header.count);
    for (std::size_t i = 0; i < header.count; ++i) {
        const std::uint8_t* p = data.data() + kImageHeaderSize + i * image_size;
        Image image(image_size);
        for (std::size_t j = 0; j < image_size; ++j)
            image[j] = static_cast<float>(p[j]) / 255.0f;
        images.push_back(std::move(image));
    }
    return images;
}

} // namespace mnist
