#include "director/director_request.hpp"
#include "decoding/archive_extractor.hpp"
#include "decoding/image_format.hpp"
#include "utils/timestamp.hpp"
#include "errors.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <array>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace imgen_core::director {

    namespace {

        constexpr std::array ALL_EMOTIONS = {
            Emotion::NEUTRAL, Emotion::HAPPY, Emotion::SAD, Emotion::ANGRY,
            Emotion::SCARED, Emotion::SURPRISED, Emotion::TIRED, Emotion::EXCITED,
            Emotion::NERVOUS, Emotion::THINKING, Emotion::CONFUSED, Emotion::SHY,
            Emotion::DISGUSTED, Emotion::SMUG, Emotion::BORED, Emotion::LAUGHING,
            Emotion::IRRITATED, Emotion::AROUSED, Emotion::EMBARRASSED, Emotion::WORRIED,
            Emotion::LOVE, Emotion::DETERMINED, Emotion::HURT, Emotion::PLAYFUL,
        };

        struct ToolText {
            std::string prompt;
            int defry = 0;
        };

        template <typename Tool>
        ToolText tool_text(const Tool&) {
            return {};
        }

        ToolText tool_text(const Colorize& tool) {
            return {tool.prompt, tool.defry};
        }

        ToolText tool_text(const ChangeEmotion& tool) {
            std::string prompt = fmt::format("{};;", emotion_name(tool.emotion));
            if (!tool.prompt.empty()) {
                prompt += fmt::format("{},", tool.prompt);
            }
            return {std::move(prompt), static_cast<int>(tool.level)};
        }

    } // namespace

    std::string_view emotion_name(Emotion emotion) {
        switch (emotion) {
            case Emotion::NEUTRAL: return "neutral";
            case Emotion::HAPPY: return "happy";
            case Emotion::SAD: return "sad";
            case Emotion::ANGRY: return "angry";
            case Emotion::SCARED: return "scared";
            case Emotion::SURPRISED: return "surprised";
            case Emotion::TIRED: return "tired";
            case Emotion::EXCITED: return "excited";
            case Emotion::NERVOUS: return "nervous";
            case Emotion::THINKING: return "thinking";
            case Emotion::CONFUSED: return "confused";
            case Emotion::SHY: return "shy";
            case Emotion::DISGUSTED: return "disgusted";
            case Emotion::SMUG: return "smug";
            case Emotion::BORED: return "bored";
            case Emotion::LAUGHING: return "laughing";
            case Emotion::IRRITATED: return "irritated";
            case Emotion::AROUSED: return "aroused";
            case Emotion::EMBARRASSED: return "embarrassed";
            case Emotion::WORRIED: return "worried";
            case Emotion::LOVE: return "love";
            case Emotion::DETERMINED: return "determined";
            case Emotion::HURT: return "hurt";
            case Emotion::PLAYFUL: return "playful";
        }
        throw std::logic_error("emotion_name: unhandled emotion");
    }

    Emotion parse_emotion(std::string_view name) {
        for (Emotion emotion : ALL_EMOTIONS) {
            if (emotion_name(emotion) == name) {
                return emotion;
            }
        }
        throw ValidationError("emotion", fmt::format("Unknown emotion '{}'", name));
    }

    std::string_view tool_name(const DirectorTool& tool) {
        return std::visit([](const auto& t) { return std::decay_t<decltype(t)>::req_type; }, tool);
    }

    DirectorRequest make_director_request(std::span<const uint8_t> image_bytes,
                                          std::string image_base64,
                                          DirectorTool tool) {
        const auto dimensions = decoding::read_image_dimensions(image_bytes);
        return DirectorRequest{
            .width = static_cast<int>(dimensions.width),
            .height = static_cast<int>(dimensions.height),
            .image = std::move(image_base64),
            .tool = std::move(tool),
        };
    }

    nlohmann::json build_director_payload(const DirectorRequest& request) {
        if (request.width <= 0 || request.height <= 0) {
            throw ValidationError("width", fmt::format("Director image dimensions must be positive, got {}x{}",
                                                       request.width, request.height));
        }
        if (request.image.empty()) {
            throw ValidationError("image", "Director request has no image");
        }

        ToolText text = std::visit([](const auto& t) { return tool_text(t); }, request.tool);
        return nlohmann::json{
            {"req_type", tool_name(request.tool)},
            {"width", request.width},
            {"height", request.height},
            {"image", request.image},
            {"prompt", std::move(text.prompt)},
            {"defry", text.defry},
        };
    }

    Image decode_director_response(std::span<const uint8_t> body, const DirectorTool& tool) {
        auto entry = decoding::read_first_entry(body);
        const ImageFormat format = decoding::detect_image_format(entry.data);
        spdlog::debug("Director: Decoded '{}' result entry '{}' ({} bytes)", tool_name(tool), entry.name, entry.data.size());
        return Image(fmt::format("{}_{}.png", utils::filename_timestamp(), tool_name(tool)),
                     std::move(entry.data), format);
    }

} // namespace imgen_core::director
