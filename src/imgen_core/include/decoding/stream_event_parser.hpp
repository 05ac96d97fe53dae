#pragma once

#include "types/image.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace imgen_core::decoding {

    /**
     * @brief Incremental decoder for the length-prefixed event stream.
     *
     * Each frame is a 4-byte big-endian length followed by that many bytes
     * of MessagePack. Chunks may split frames (or the length prefix) at any
     * byte boundary. Frames that fail to decode are consumed and counted so
     * the parser stays in sync with the stream.
     *
     * Not thread-safe; use one instance per response.
     */
    class StreamEventParser {
    public:
        static constexpr size_t LENGTH_PREFIX_SIZE = 4;

        StreamEventParser() = default;

        /**
         * @brief Appends a chunk and decodes every frame it completes.
         * @param chunk Raw bytes as received
         * @return Events completed by this chunk, in stream order
         */
        [[nodiscard]] std::vector<StreamEvent> feed_chunk(std::span<const uint8_t> chunk);

        /// Drops buffered bytes and the pending length; counters are kept.
        void reset() noexcept;

        /// Bytes received but not yet consumed by a complete frame.
        [[nodiscard]] size_t buffered_bytes() const noexcept { return buffer_.size() - read_offset_; }

        /// Payload length of the frame in progress, once its prefix has arrived.
        [[nodiscard]] std::optional<uint32_t> pending_frame_length() const noexcept { return expected_length_; }

        [[nodiscard]] uint64_t frames_emitted() const noexcept { return frames_emitted_; }
        [[nodiscard]] uint64_t frames_dropped() const noexcept { return frames_dropped_; }

    private:
        void compact();

        std::vector<uint8_t> buffer_;
        size_t read_offset_ = 0;
        std::optional<uint32_t> expected_length_;

        uint64_t frames_emitted_ = 0;
        uint64_t frames_dropped_ = 0;
    };

} // namespace imgen_core::decoding
