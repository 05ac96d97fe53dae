#include "decoding/batch_event_parser.hpp"
#include "decoding/stream_event_parser.hpp"
#include "errors.hpp"

#include <spdlog/spdlog.h>

namespace imgen_core::decoding {

    std::vector<StreamEvent> parse_events(std::span<const uint8_t> response) {
        if (response.empty()) {
            throw FormatError("Received empty event stream response");
        }

        StreamEventParser parser;
        std::vector<StreamEvent> events = parser.feed_chunk(response);

        if (parser.buffered_bytes() > 0) {
            spdlog::warn("BatchEventParser: Ignoring {} trailing bytes of a truncated frame",
                         parser.buffered_bytes());
        }
        spdlog::debug("BatchEventParser: Decoded {} events from {} bytes ({} frames dropped)",
                      events.size(), response.size(), parser.frames_dropped());
        return events;
    }

    std::vector<Image> extract_final_images(std::span<const uint8_t> response) {
        std::vector<Image> images;
        for (auto& event : parse_events(response)) {
            if (event.event_type == EventType::FINAL) {
                images.push_back(std::move(event.image));
            }
        }
        return images;
    }

} // namespace imgen_core::decoding
