#pragma once

#include "types/image.hpp"

#include <nlohmann/json.hpp>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <variant>

namespace imgen_core::director {

    enum class Emotion {
        NEUTRAL,
        HAPPY,
        SAD,
        ANGRY,
        SCARED,
        SURPRISED,
        TIRED,
        EXCITED,
        NERVOUS,
        THINKING,
        CONFUSED,
        SHY,
        DISGUSTED,
        SMUG,
        BORED,
        LAUGHING,
        IRRITATED,
        AROUSED,
        EMBARRASSED,
        WORRIED,
        LOVE,
        DETERMINED,
        HURT,
        PLAYFUL,
    };

    // Sent as `defry`; higher values weaken the emotion change.
    enum class EmotionLevel {
        NORMAL = 0,
        SLIGHTLY_WEAK = 1,
        WEAK = 2,
        EVEN_WEAKER = 3,
        VERY_WEAK = 4,
        WEAKEST = 5,
    };

    [[nodiscard]] std::string_view emotion_name(Emotion emotion);
    [[nodiscard]] Emotion parse_emotion(std::string_view name);

    // --- Tool kinds ---

    struct LineArt {
        static constexpr std::string_view req_type = "lineart";
    };

    struct Sketch {
        static constexpr std::string_view req_type = "sketch";
    };

    struct BackgroundRemoval {
        static constexpr std::string_view req_type = "bg-removal";
    };

    struct Declutter {
        static constexpr std::string_view req_type = "declutter";
    };

    struct Colorize {
        static constexpr std::string_view req_type = "colorize";
        std::string prompt;
        int defry = 0;
    };

    struct ChangeEmotion {
        static constexpr std::string_view req_type = "emotion";
        Emotion emotion = Emotion::NEUTRAL;
        EmotionLevel level = EmotionLevel::NORMAL;
        std::string prompt;
    };

    using DirectorTool = std::variant<LineArt, Sketch, BackgroundRemoval, Declutter, Colorize, ChangeEmotion>;

    /**
     * @brief One call to an image-to-image director tool.
     */
    struct DirectorRequest {
        int width = 0;
        int height = 0;
        std::string image;   // base64
        DirectorTool tool;
    };

    [[nodiscard]] std::string_view tool_name(const DirectorTool& tool);

    /**
     * @brief Builds a request, reading width and height from the raw image.
     * @param image_bytes Encoded PNG or JPEG
     * @param image_base64 The same image, base64-encoded for the payload
     * @throws FormatError if the image dimensions cannot be read
     */
    [[nodiscard]] DirectorRequest make_director_request(std::span<const uint8_t> image_bytes,
                                                        std::string image_base64,
                                                        DirectorTool tool);

    /**
     * @brief `{req_type, width, height, image, prompt, defry}`.
     *
     * ChangeEmotion sends `"<emotion>;;"`, followed by `"<prompt>,"` when a
     * prompt is given, and its level as `defry`.
     *
     * @throws ValidationError on non-positive dimensions or an empty image
     */
    [[nodiscard]] nlohmann::json build_director_payload(const DirectorRequest& request);

    /**
     * @brief Unpacks the single image of a director response, named
     * `<timestamp>_<req_type>.png`.
     * @throws FormatError if the body is not an archive holding a file
     */
    [[nodiscard]] Image decode_director_response(std::span<const uint8_t> body, const DirectorTool& tool);

} // namespace imgen_core::director
