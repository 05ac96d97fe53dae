#include "decoding/stream_event_parser.hpp"
#include "decoding/frame_decoder.hpp"

#include <spdlog/spdlog.h>

namespace imgen_core::decoding {

    std::vector<StreamEvent> StreamEventParser::feed_chunk(std::span<const uint8_t> chunk) {
        buffer_.insert(buffer_.end(), chunk.begin(), chunk.end());

        std::vector<StreamEvent> events;
        while (true) {
            if (!expected_length_) {
                if (buffered_bytes() < LENGTH_PREFIX_SIZE) {
                    break;
                }
                const uint8_t* prefix = buffer_.data() + read_offset_;
                expected_length_ = (static_cast<uint32_t>(prefix[0]) << 24) |
                                   (static_cast<uint32_t>(prefix[1]) << 16) |
                                   (static_cast<uint32_t>(prefix[2]) << 8) |
                                   static_cast<uint32_t>(prefix[3]);
                read_offset_ += LENGTH_PREFIX_SIZE;
            }

            if (buffered_bytes() < *expected_length_) {
                break;
            }

            const std::span<const uint8_t> payload(buffer_.data() + read_offset_, *expected_length_);
            read_offset_ += *expected_length_;
            expected_length_.reset();

            if (auto event = decode_frame(payload)) {
                events.push_back(std::move(*event));
                ++frames_emitted_;
            } else {
                ++frames_dropped_;
                spdlog::warn("StreamEventParser: Dropped undecodable frame of {} bytes ({} dropped so far)",
                             payload.size(), frames_dropped_);
            }
        }

        compact();
        return events;
    }

    void StreamEventParser::reset() noexcept {
        buffer_.clear();
        read_offset_ = 0;
        expected_length_.reset();
    }

    void StreamEventParser::compact() {
        if (read_offset_ == 0) {
            return;
        }
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(read_offset_));
        read_offset_ = 0;
    }

} // namespace imgen_core::decoding
