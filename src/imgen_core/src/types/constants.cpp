#include "types/constants.hpp"
#include "errors.hpp"

#include <array>
#include <string>

namespace imgen_core {

    namespace {

        constexpr std::array ALL_MODELS = {
            Model::V3, Model::V3_INP,
            Model::V4, Model::V4_INP,
            Model::V4_CUR, Model::V4_CUR_INP,
            Model::V4_5, Model::V4_5_INP,
            Model::V4_5_CUR, Model::V4_5_CUR_INP,
            Model::FURRY, Model::FURRY_INP,
        };

        constexpr std::array ALL_ACTIONS = {
            Action::GENERATE, Action::INPAINT, Action::IMG2IMG,
        };

        constexpr std::array ALL_RESOLUTIONS = {
            Resolution::SMALL_PORTRAIT, Resolution::SMALL_LANDSCAPE, Resolution::SMALL_SQUARE,
            Resolution::NORMAL_PORTRAIT, Resolution::NORMAL_LANDSCAPE, Resolution::NORMAL_SQUARE,
            Resolution::LARGE_PORTRAIT, Resolution::LARGE_LANDSCAPE, Resolution::LARGE_SQUARE,
            Resolution::WALLPAPER_PORTRAIT, Resolution::WALLPAPER_LANDSCAPE,
        };

        constexpr std::array ALL_SAMPLERS = {
            Sampler::EULER, Sampler::EULER_ANC, Sampler::DPM2S_ANC, Sampler::DPM2M,
            Sampler::DPM2MSDE, Sampler::DPMSDE, Sampler::DDIM,
        };

        constexpr std::array ALL_NOISES = {
            Noise::NATIVE, Noise::KARRAS, Noise::EXPONENTIAL, Noise::POLYEXPONENTIAL,
        };

        constexpr std::array ALL_CONTROLNETS = {
            Controlnet::PALETTESWAP, Controlnet::FORMLOCK, Controlnet::SCRIBBLER,
            Controlnet::BUILDINGCONTROL, Controlnet::LANDSCAPER,
        };

        template <typename Enum, size_t N, typename NameFn>
        Enum parse_by_name(const std::array<Enum, N>& values,
                           NameFn name_of,
                           std::string_view name,
                           const char* field) {
            for (Enum value : values) {
                if (name_of(value) == name) {
                    return value;
                }
            }
            throw ValidationError(field, "Invalid " + std::string(field) + ": '" + std::string(name) + "'");
        }

    } // namespace

    std::string_view model_id(Model model) {
        switch (model) {
            case Model::V3:           return "nai-diffusion-3";
            case Model::V3_INP:       return "nai-diffusion-3-inpainting";
            case Model::V4:           return "nai-diffusion-4-full";
            case Model::V4_INP:       return "nai-diffusion-4-full-inpainting";
            case Model::V4_CUR:       return "nai-diffusion-4-curated-preview";
            case Model::V4_CUR_INP:   return "nai-diffusion-4-curated-inpainting";
            case Model::V4_5:         return "nai-diffusion-4-5-full";
            case Model::V4_5_INP:     return "nai-diffusion-4-5-full-inpainting";
            case Model::V4_5_CUR:     return "nai-diffusion-4-5-curated";
            case Model::V4_5_CUR_INP: return "nai-diffusion-4-5-curated-inpainting";
            case Model::FURRY:        return "nai-diffusion-furry-3";
            case Model::FURRY_INP:    return "nai-diffusion-furry-3-inpainting";
        }
        throw std::logic_error("model_id: unhandled model");
    }

    ModelFamily model_family(Model model) {
        switch (model) {
            case Model::V3:
            case Model::V3_INP:
                return ModelFamily::V3;
            case Model::FURRY:
            case Model::FURRY_INP:
                return ModelFamily::FURRY;
            case Model::V4:
            case Model::V4_INP:
                return ModelFamily::V4_FULL;
            case Model::V4_CUR:
            case Model::V4_CUR_INP:
                return ModelFamily::V4_CURATED;
            case Model::V4_5:
            case Model::V4_5_INP:
                return ModelFamily::V4_5_FULL;
            case Model::V4_5_CUR:
            case Model::V4_5_CUR_INP:
                return ModelFamily::V4_5_CURATED;
        }
        throw std::logic_error("model_family: unhandled model");
    }

    bool is_current_protocol(Model model) {
        switch (model_family(model)) {
            case ModelFamily::V3:
            case ModelFamily::FURRY:
                return false;
            case ModelFamily::V4_FULL:
            case ModelFamily::V4_CURATED:
            case ModelFamily::V4_5_FULL:
            case ModelFamily::V4_5_CURATED:
                return true;
        }
        throw std::logic_error("is_current_protocol: unhandled model family");
    }

    std::string_view action_name(Action action) {
        switch (action) {
            case Action::GENERATE: return "generate";
            case Action::INPAINT:  return "infill";
            case Action::IMG2IMG:  return "img2img";
        }
        throw std::logic_error("action_name: unhandled action");
    }

    std::string_view resolution_name(Resolution resolution) {
        switch (resolution) {
            case Resolution::SMALL_PORTRAIT:      return "small_portrait";
            case Resolution::SMALL_LANDSCAPE:     return "small_landscape";
            case Resolution::SMALL_SQUARE:        return "small_square";
            case Resolution::NORMAL_PORTRAIT:     return "normal_portrait";
            case Resolution::NORMAL_LANDSCAPE:    return "normal_landscape";
            case Resolution::NORMAL_SQUARE:       return "normal_square";
            case Resolution::LARGE_PORTRAIT:      return "large_portrait";
            case Resolution::LARGE_LANDSCAPE:     return "large_landscape";
            case Resolution::LARGE_SQUARE:        return "large_square";
            case Resolution::WALLPAPER_PORTRAIT:  return "wallpaper_portrait";
            case Resolution::WALLPAPER_LANDSCAPE: return "wallpaper_landscape";
        }
        throw std::logic_error("resolution_name: unhandled resolution");
    }

    ResolutionSize resolution_size(Resolution resolution) {
        switch (resolution) {
            case Resolution::SMALL_PORTRAIT:      return {512, 768};
            case Resolution::SMALL_LANDSCAPE:     return {768, 512};
            case Resolution::SMALL_SQUARE:        return {640, 640};
            case Resolution::NORMAL_PORTRAIT:     return {832, 1216};
            case Resolution::NORMAL_LANDSCAPE:    return {1216, 832};
            case Resolution::NORMAL_SQUARE:       return {1024, 1024};
            case Resolution::LARGE_PORTRAIT:      return {1024, 1536};
            case Resolution::LARGE_LANDSCAPE:     return {1536, 1024};
            case Resolution::LARGE_SQUARE:        return {1472, 1472};
            case Resolution::WALLPAPER_PORTRAIT:  return {1088, 1920};
            case Resolution::WALLPAPER_LANDSCAPE: return {1920, 1088};
        }
        throw std::logic_error("resolution_size: unhandled resolution");
    }

    std::string_view sampler_name(Sampler sampler) {
        switch (sampler) {
            case Sampler::EULER:     return "k_euler";
            case Sampler::EULER_ANC: return "k_euler_ancestral";
            case Sampler::DPM2S_ANC: return "k_dpmpp_2s_ancestral";
            case Sampler::DPM2M:     return "k_dpmpp_2m";
            case Sampler::DPM2MSDE:  return "k_dpmpp_2m_sde";
            case Sampler::DPMSDE:    return "k_dpmpp_sde";
            case Sampler::DDIM:      return "ddim_v3";
        }
        throw std::logic_error("sampler_name: unhandled sampler");
    }

    std::string_view noise_name(Noise noise) {
        switch (noise) {
            case Noise::NATIVE:          return "native";
            case Noise::KARRAS:          return "karras";
            case Noise::EXPONENTIAL:     return "exponential";
            case Noise::POLYEXPONENTIAL: return "polyexponential";
        }
        throw std::logic_error("noise_name: unhandled noise schedule");
    }

    std::string_view controlnet_name(Controlnet controlnet) {
        switch (controlnet) {
            case Controlnet::PALETTESWAP:     return "hed";
            case Controlnet::FORMLOCK:        return "midas";
            case Controlnet::SCRIBBLER:       return "fake_scribble";
            case Controlnet::BUILDINGCONTROL: return "mlsd";
            case Controlnet::LANDSCAPER:      return "uniformer";
        }
        throw std::logic_error("controlnet_name: unhandled controlnet");
    }

    Model parse_model(std::string_view id) {
        return parse_by_name(ALL_MODELS, model_id, id, "model");
    }

    Action parse_action(std::string_view name) {
        return parse_by_name(ALL_ACTIONS, action_name, name, "action");
    }

    Resolution parse_resolution(std::string_view name) {
        return parse_by_name(ALL_RESOLUTIONS, resolution_name, name, "res_preset");
    }

    Sampler parse_sampler(std::string_view name) {
        return parse_by_name(ALL_SAMPLERS, sampler_name, name, "sampler");
    }

    Noise parse_noise(std::string_view name) {
        return parse_by_name(ALL_NOISES, noise_name, name, "noise_schedule");
    }

    Controlnet parse_controlnet(std::string_view name) {
        return parse_by_name(ALL_CONTROLNETS, controlnet_name, name, "controlnet_model");
    }

} // namespace imgen_core
