#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace imgen_core {

    enum class ImageFormat {
        UNKNOWN,
        PNG,
        JPEG,
    };

    /**
     * @brief One decoded image: advisory filename plus the raw encoded bytes.
     *
     * The byte buffer is fixed at construction; only the filename may change.
     */
    class Image {
    public:
        Image(std::string filename, std::vector<uint8_t> data, ImageFormat format = ImageFormat::UNKNOWN)
            : filename_(std::move(filename)), data_(std::move(data)), format_(format) {}

        [[nodiscard]] const std::string& filename() const noexcept { return filename_; }
        void set_filename(std::string filename) { filename_ = std::move(filename); }

        [[nodiscard]] const std::vector<uint8_t>& data() const noexcept { return data_; }
        [[nodiscard]] size_t size() const noexcept { return data_.size(); }
        [[nodiscard]] ImageFormat format() const noexcept { return format_; }

    private:
        std::string filename_;
        std::vector<uint8_t> data_;
        ImageFormat format_;
    };

    enum class EventType {
        INTERMEDIATE,   // denoising step preview, JPEG
        FINAL,          // finished sample, PNG
    };

    /**
     * @brief One event decoded from the current-protocol response stream.
     *
     * `step_ix` and `sigma` are only meaningful for INTERMEDIATE events and
     * are zero on FINAL events.
     */
    struct StreamEvent {
        EventType event_type;
        int64_t samp_ix = 0;
        int64_t step_ix = 0;
        std::string gen_id;
        double sigma = 0.0;
        Image image;
    };

} // namespace imgen_core
