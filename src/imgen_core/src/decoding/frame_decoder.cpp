#include "decoding/frame_decoder.hpp"
#include "decoding/image_format.hpp"
#include "utils/timestamp.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <string>
#include <vector>

namespace imgen_core::decoding {

    namespace {

        using json = nlohmann::json;

        std::optional<std::vector<uint8_t>> image_bytes(const json& value) {
            if (value.is_binary()) {
                const auto& binary = value.get_binary();
                return std::vector<uint8_t>(binary.begin(), binary.end());
            }
            if (value.is_string()) {
                const auto& text = value.get_ref<const std::string&>();
                return std::vector<uint8_t>(text.begin(), text.end());
            }
            return std::nullopt;
        }

        // Frame strings are not UTF-8 checked by from_msgpack; invalid bytes are replaced.
        std::string to_text(const json& value) {
            return value.dump(-1, ' ', false, json::error_handler_t::replace);
        }

        std::optional<EventType> parse_event_type(const json& value) {
            if (!value.is_string()) return std::nullopt;
            const auto& name = value.get_ref<const std::string&>();
            if (name == EVENT_TYPE_INTERMEDIATE) return EventType::INTERMEDIATE;
            if (name == EVENT_TYPE_FINAL) return EventType::FINAL;
            return std::nullopt;
        }

    } // namespace

    std::optional<StreamEvent> decode_frame(std::span<const uint8_t> payload) {
        const json record = json::from_msgpack(payload.begin(), payload.end(),
                                               /*strict=*/false, /*allow_exceptions=*/false);
        if (record.is_discarded() || !record.is_object()) {
            spdlog::debug("FrameDecoder: Frame of {} bytes is not a MessagePack map", payload.size());
            return std::nullopt;
        }

        auto type_it = record.find("event_type");
        if (type_it == record.end()) {
            spdlog::debug("FrameDecoder: Frame has no event_type");
            return std::nullopt;
        }
        const auto event_type = parse_event_type(*type_it);
        if (!event_type) {
            spdlog::debug("FrameDecoder: Unknown event_type {}", to_text(*type_it));
            return std::nullopt;
        }

        auto samp_it = record.find("samp_ix");
        auto gen_it = record.find("gen_id");
        auto image_it = record.find("image");
        if (samp_it == record.end() || !samp_it->is_number_integer() ||
            gen_it == record.end() || image_it == record.end()) {
            spdlog::debug("FrameDecoder: Frame is missing samp_ix, gen_id or image");
            return std::nullopt;
        }

        int64_t step_ix = 0;
        auto step_it = record.find("step_ix");
        if (step_it != record.end() && step_it->is_number_integer()) {
            step_ix = step_it->get<int64_t>();
        } else if (*event_type == EventType::INTERMEDIATE) {
            spdlog::debug("FrameDecoder: Intermediate frame has no step_ix");
            return std::nullopt;
        }

        double sigma = 0.0;
        auto sigma_it = record.find("sigma");
        if (sigma_it != record.end() && sigma_it->is_number()) {
            sigma = sigma_it->get<double>();
        }

        auto bytes = image_bytes(*image_it);
        if (!bytes) {
            spdlog::debug("FrameDecoder: Image field has type {}", image_it->type_name());
            return std::nullopt;
        }
        const ImageFormat format = detect_image_format(*bytes);
        if (format == ImageFormat::UNKNOWN) {
            spdlog::debug("FrameDecoder: Unsupported image signature in frame ({} bytes)", bytes->size());
            return std::nullopt;
        }

        const std::string timestamp = utils::filename_timestamp();
        std::string filename = *event_type == EventType::FINAL
            ? fmt::format("{}_final.{}", timestamp, image_extension(format))
            : fmt::format("{}_step_{:02d}.{}", timestamp, step_ix, image_extension(format));

        std::string gen_id = gen_it->is_string() ? gen_it->get<std::string>() : to_text(*gen_it);

        return StreamEvent{
            .event_type = *event_type,
            .samp_ix = samp_it->get<int64_t>(),
            .step_ix = step_ix,
            .gen_id = std::move(gen_id),
            .sigma = sigma,
            .image = Image(std::move(filename), std::move(*bytes), format),
        };
    }

} // namespace imgen_core::decoding
