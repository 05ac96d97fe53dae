#pragma once

#include "types/image.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace imgen_core::decoding {

    /**
     * @brief Decodes a fully buffered event stream.
     *
     * Undecodable frames are skipped. A truncated trailing frame is logged
     * and ignored.
     *
     * @throws FormatError if the response is empty
     */
    [[nodiscard]] std::vector<StreamEvent> parse_events(std::span<const uint8_t> response);

    /**
     * @brief The images of every FINAL event, in stream order.
     * @throws FormatError if the response is empty
     */
    [[nodiscard]] std::vector<Image> extract_final_images(std::span<const uint8_t> response);

} // namespace imgen_core::decoding
