#pragma once

#include "types/image.hpp"

#include <cstdint>
#include <span>
#include <string_view>

namespace imgen_core::decoding {

    struct ImageDimensions {
        uint32_t width = 0;
        uint32_t height = 0;

        bool operator==(const ImageDimensions&) const = default;
    };

    /**
     * @brief Identifies an encoded image by its leading signature.
     *
     * `FF D8` is JPEG, the 8-byte `\x89PNG\r\n\x1a\n` signature is PNG,
     * anything else is UNKNOWN.
     */
    [[nodiscard]] ImageFormat detect_image_format(std::span<const uint8_t> bytes) noexcept;

    /// "png", "jpg"; throws FormatError for UNKNOWN.
    [[nodiscard]] std::string_view image_extension(ImageFormat format);

    /**
     * @brief Reads pixel dimensions from a PNG IHDR chunk or a JPEG SOF marker.
     * @throws FormatError if the data is neither, or the header is truncated
     */
    [[nodiscard]] ImageDimensions read_image_dimensions(std::span<const uint8_t> bytes);

} // namespace imgen_core::decoding
