#pragma once

#include "types/image.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace imgen_core::decoding {

    inline constexpr std::string_view EVENT_TYPE_INTERMEDIATE = "intermediate";
    inline constexpr std::string_view EVENT_TYPE_FINAL = "final";

    /**
     * @brief Decodes one length-stripped frame payload (a MessagePack map)
     * into a StreamEvent.
     *
     * Returns std::nullopt, logging at debug level, when the payload is not a
     * map, lacks `event_type`/`samp_ix`/`gen_id`/`image` (or `step_ix` on an
     * intermediate event), names an unknown event type, or carries an image
     * that is neither PNG nor JPEG. Never throws on malformed input.
     */
    [[nodiscard]] std::optional<StreamEvent> decode_frame(std::span<const uint8_t> payload);

} // namespace imgen_core::decoding
