#pragma once

#include <cstdint>
#include <string_view>

namespace imgen_core {

    enum class Model {
        V3,
        V3_INP,
        V4,
        V4_INP,
        V4_CUR,
        V4_CUR_INP,
        V4_5,
        V4_5_INP,
        V4_5_CUR,
        V4_5_CUR_INP,
        FURRY,
        FURRY_INP,
    };

    // Models sharing prompt presets (base model and its inpainting variant).
    enum class ModelFamily {
        V3,
        FURRY,
        V4_FULL,
        V4_CURATED,
        V4_5_FULL,
        V4_5_CURATED,
    };

    enum class Action {
        GENERATE,
        INPAINT,
        IMG2IMG,
    };

    enum class Resolution {
        SMALL_PORTRAIT,
        SMALL_LANDSCAPE,
        SMALL_SQUARE,
        NORMAL_PORTRAIT,
        NORMAL_LANDSCAPE,
        NORMAL_SQUARE,
        LARGE_PORTRAIT,
        LARGE_LANDSCAPE,
        LARGE_SQUARE,
        WALLPAPER_PORTRAIT,
        WALLPAPER_LANDSCAPE,
    };

    enum class Sampler {
        EULER,
        EULER_ANC,
        DPM2S_ANC,
        DPM2M,
        DPM2MSDE,
        DPMSDE,
        DDIM,
    };

    // NATIVE is deprecated on V4 curated and later models.
    enum class Noise {
        NATIVE,
        KARRAS,
        EXPONENTIAL,
        POLYEXPONENTIAL,
    };

    enum class Controlnet {
        PALETTESWAP,
        FORMLOCK,
        SCRIBBLER,
        BUILDINGCONTROL,
        LANDSCAPER,
    };

    struct ResolutionSize {
        int width;
        int height;
    };

    // Seeds are drawn from [MIN_SEED, MAX_SEED]; the service adds the sample
    // index to the seed, so the top 7 values are reserved.
    constexpr uint64_t MIN_SEED = 1;
    constexpr uint64_t MAX_SEED = 4294967295ULL - 7;

    [[nodiscard]] std::string_view model_id(Model model);
    [[nodiscard]] ModelFamily model_family(Model model);

    /**
     * @brief True for V4 and V4.5 models, which take structured captions and
     * answer with a framed event stream instead of a ZIP archive.
     */
    [[nodiscard]] bool is_current_protocol(Model model);

    [[nodiscard]] std::string_view action_name(Action action);
    [[nodiscard]] std::string_view resolution_name(Resolution resolution);
    [[nodiscard]] ResolutionSize resolution_size(Resolution resolution);
    [[nodiscard]] std::string_view sampler_name(Sampler sampler);
    [[nodiscard]] std::string_view noise_name(Noise noise);
    [[nodiscard]] std::string_view controlnet_name(Controlnet controlnet);

    // Wire name -> enum. Unknown names throw ValidationError.
    [[nodiscard]] Model parse_model(std::string_view id);
    [[nodiscard]] Action parse_action(std::string_view name);
    [[nodiscard]] Resolution parse_resolution(std::string_view name);
    [[nodiscard]] Sampler parse_sampler(std::string_view name);
    [[nodiscard]] Noise parse_noise(std::string_view name);
    [[nodiscard]] Controlnet parse_controlnet(std::string_view name);

} // namespace imgen_core
