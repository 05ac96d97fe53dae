#include "decoding/image_format.hpp"
#include "errors.hpp"

#include <algorithm>
#include <array>

namespace imgen_core::decoding {

    namespace {

        constexpr std::array<uint8_t, 8> PNG_SIGNATURE = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
        constexpr std::array<uint8_t, 2> JPEG_SIGNATURE = {0xFF, 0xD8};

        // Signature (8) + IHDR length (4) + "IHDR" (4) + width (4) + height (4)
        constexpr size_t PNG_HEADER_SIZE = 24;

        uint16_t read_be16(std::span<const uint8_t> bytes, size_t offset) {
            return static_cast<uint16_t>((bytes[offset] << 8) | bytes[offset + 1]);
        }

        uint32_t read_be32(std::span<const uint8_t> bytes, size_t offset) {
            return (static_cast<uint32_t>(bytes[offset]) << 24) |
                   (static_cast<uint32_t>(bytes[offset + 1]) << 16) |
                   (static_cast<uint32_t>(bytes[offset + 2]) << 8) |
                   static_cast<uint32_t>(bytes[offset + 3]);
        }

        bool starts_with(std::span<const uint8_t> bytes, std::span<const uint8_t> prefix) {
            return bytes.size() >= prefix.size() && std::equal(prefix.begin(), prefix.end(), bytes.begin());
        }

        bool is_sof_marker(uint8_t marker) {
            return (marker >= 0xC0 && marker <= 0xC3) ||
                   (marker >= 0xC5 && marker <= 0xC7) ||
                   (marker >= 0xC9 && marker <= 0xCB);
        }

        ImageDimensions read_png_dimensions(std::span<const uint8_t> bytes) {
            if (bytes.size() < PNG_HEADER_SIZE) {
                throw FormatError("PNG header truncated");
            }
            return {read_be32(bytes, 16), read_be32(bytes, 20)};
        }

        ImageDimensions read_jpeg_dimensions(std::span<const uint8_t> bytes) {
            size_t offset = 2;
            // Each segment: FF <marker> <length:2> <payload: length-2>
            while (offset + 4 <= bytes.size()) {
                if (bytes[offset] != 0xFF) {
                    throw FormatError("JPEG segment does not start with a marker");
                }
                const uint8_t marker = bytes[offset + 1];
                const uint16_t length = read_be16(bytes, offset + 2);
                if (length < 2) {
                    throw FormatError("JPEG segment length is invalid");
                }
                if (is_sof_marker(marker)) {
                    // <precision:1> <height:2> <width:2>
                    if (offset + 9 > bytes.size()) {
                        throw FormatError("JPEG SOF segment truncated");
                    }
                    return {read_be16(bytes, offset + 7), read_be16(bytes, offset + 5)};
                }
                offset += 2 + length;
            }
            throw FormatError("Could not extract dimensions from JPEG image");
        }

    } // namespace

    ImageFormat detect_image_format(std::span<const uint8_t> bytes) noexcept {
        if (starts_with(bytes, JPEG_SIGNATURE)) return ImageFormat::JPEG;
        if (starts_with(bytes, PNG_SIGNATURE)) return ImageFormat::PNG;
        return ImageFormat::UNKNOWN;
    }

    std::string_view image_extension(ImageFormat format) {
        switch (format) {
            case ImageFormat::PNG: return "png";
            case ImageFormat::JPEG: return "jpg";
            case ImageFormat::UNKNOWN: break;
        }
        throw FormatError("No file extension for an unknown image format");
    }

    ImageDimensions read_image_dimensions(std::span<const uint8_t> bytes) {
        switch (detect_image_format(bytes)) {
            case ImageFormat::PNG: return read_png_dimensions(bytes);
            case ImageFormat::JPEG: return read_jpeg_dimensions(bytes);
            case ImageFormat::UNKNOWN: break;
        }
        throw FormatError("Unsupported image format");
    }

} // namespace imgen_core::decoding
