#include "metadata/request_json.hpp"
#include "errors.hpp"

#include <spdlog/fmt/fmt.h>
#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>
#include <utility>

namespace imgen_core {

    using json = nlohmann::json;

    void to_json(json& j, const PositionCoords& coords) {
        j = json{{"x", coords.x}, {"y", coords.y}};
    }

    void from_json(const json& j, PositionCoords& coords) {
        coords.x = j.at("x").get<double>();
        coords.y = j.at("y").get<double>();
    }

    void to_json(json& j, const CharacterPrompt& cp) {
        j = json{{"prompt", cp.prompt}, {"uc", cp.uc}};
        if (cp.center) j["center"] = *cp.center;
        if (cp.enabled) j["enabled"] = *cp.enabled;
    }

    void from_json(const json& j, CharacterPrompt& cp) {
        cp.prompt = j.value("prompt", std::string{});
        cp.uc = j.value("uc", std::string{});
        if (j.contains("center") && !j.at("center").is_null()) {
            cp.center = j.at("center").get<PositionCoords>();
        }
        if (j.contains("enabled") && !j.at("enabled").is_null()) {
            cp.enabled = j.at("enabled").get<bool>();
        }
    }

    void to_json(json& j, const CharacterCaption& caption) {
        j = json{{"char_caption", caption.char_caption}, {"centers", caption.centers}};
    }

    void from_json(const json& j, CharacterCaption& caption) {
        caption.char_caption = j.at("char_caption").get<std::string>();
        caption.centers = j.value("centers", std::vector<PositionCoords>{});
    }

    void to_json(json& j, const CaptionFormat& caption) {
        j = json{{"base_caption", caption.base_caption}, {"char_captions", caption.char_captions}};
    }

    void from_json(const json& j, CaptionFormat& caption) {
        caption.base_caption = j.at("base_caption").get<std::string>();
        caption.char_captions = j.value("char_captions", std::vector<CharacterCaption>{});
    }

    void to_json(json& j, const V4PromptFormat& format) {
        j = json{{"caption", format.caption}, {"use_coords", format.use_coords}, {"use_order", format.use_order}};
    }

    void from_json(const json& j, V4PromptFormat& format) {
        format.caption = j.at("caption").get<CaptionFormat>();
        format.use_coords = j.value("use_coords", false);
        format.use_order = j.value("use_order", true);
    }

    void to_json(json& j, const V4NegativePromptFormat& format) {
        j = json{{"caption", format.caption}, {"legacy_uc", format.legacy_uc}};
    }

    void from_json(const json& j, V4NegativePromptFormat& format) {
        format.caption = j.at("caption").get<CaptionFormat>();
        format.legacy_uc = j.value("legacy_uc", false);
    }

} // namespace imgen_core

namespace imgen_core::metadata {

    namespace {

        ValidationError invalid_field(const char* key, const json::exception& e) {
            return ValidationError(key, fmt::format("Invalid value for '{}': {}", key, e.what()));
        }

        template <typename T, typename Wire>
        T narrow_integer(Wire v, const char* key) {
            if (!std::in_range<T>(v)) {
                throw ValidationError(key, fmt::format("'{}' is out of range, got {}", key, v));
            }
            return static_cast<T>(v);
        }

        // Integral fields take integral JSON numbers that fit the target type.
        template <typename T>
        T read_integer(const json& value, const char* key) {
            if (!value.is_number_integer()) {
                throw ValidationError(key, fmt::format("'{}' must be an integer, got {}", key, value.type_name()));
            }
            if (value.is_number_unsigned()) {
                return narrow_integer<T>(value.get<uint64_t>(), key);
            }
            return narrow_integer<T>(value.get<int64_t>(), key);
        }

        template <typename T>
        T read_value(const json& value, const char* key) {
            if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
                return read_integer<T>(value, key);
            } else if constexpr (std::is_floating_point_v<T>) {
                if (!value.is_number()) {
                    throw ValidationError(key, fmt::format("'{}' must be a number, got {}", key, value.type_name()));
                }
                return value.get<T>();
            } else {
                try {
                    return value.template get<T>();
                } catch (const json::exception& e) {
                    throw invalid_field(key, e);
                }
            }
        }

        template <typename T>
        void read_field(const json& j, const char* key, T& out) {
            auto it = j.find(key);
            if (it == j.end() || it->is_null()) {
                return;
            }
            out = read_value<T>(*it, key);
        }

        // An explicit null clears an optional field.
        template <typename T>
        void read_field(const json& j, const char* key, std::optional<T>& out) {
            auto it = j.find(key);
            if (it == j.end()) {
                return;
            }
            if (it->is_null()) {
                out.reset();
                return;
            }
            out = read_value<T>(*it, key);
        }

        const std::string* read_name(const json& j, const char* key) {
            auto it = j.find(key);
            if (it == j.end() || it->is_null()) {
                return nullptr;
            }
            if (!it->is_string()) {
                throw ValidationError(key, fmt::format("'{}' must be a string, got {}", key, it->type_name()));
            }
            return &it->get_ref<const std::string&>();
        }

        template <typename E>
        void read_enum(const json& j, const char* key, E& out, E (*parse)(std::string_view)) {
            if (const std::string* name = read_name(j, key)) {
                out = parse(*name);
            }
        }

        void add_if_set(json& params, const char* key, const auto& value) {
            if (value) {
                params[key] = *value;
            }
        }

    } // namespace

    json build_payload(const GenerationRequest& request) {
        json params = {
            {"negative_prompt", request.negative_prompt},
            {"qualityToggle", request.quality_toggle},
            {"n_samples", request.n_samples},
            {"steps", request.steps},
            {"scale", request.scale},
            {"dynamic_thresholding", request.dynamic_thresholding},
            {"sampler", sampler_name(request.sampler)},
            {"cfg_rescale", request.cfg_rescale},
            {"noise_schedule", noise_name(request.noise_schedule)},
            {"controlnet_strength", request.controlnet_strength},
            {"add_original_image", request.add_original_image},
            {"params_version", request.params_version},
            {"autoSmea", request.auto_smea},
            {"use_coords", request.use_coords},
            {"legacy_uc", request.legacy_uc},
            {"normalize_reference_strength_multiple", request.normalize_reference_strength_multiple},
            {"deliberate_euler_ancestral_bug", request.deliberate_euler_ancestral_bug},
            {"prefer_brownian", request.prefer_brownian},
            {"legacy", request.legacy},
            {"legacy_v3_extend", request.legacy_v3_extend},
        };

        add_if_set(params, "ucPreset", request.uc_preset);
        add_if_set(params, "width", request.width);
        add_if_set(params, "height", request.height);
        add_if_set(params, "seed", request.seed);
        add_if_set(params, "extra_noise_seed", request.extra_noise_seed);
        add_if_set(params, "sm", request.sm);
        add_if_set(params, "sm_dyn", request.sm_dyn);
        add_if_set(params, "image", request.image);
        add_if_set(params, "strength", request.strength);
        add_if_set(params, "noise", request.noise);
        add_if_set(params, "controlnet_condition", request.controlnet_condition);
        add_if_set(params, "mask", request.mask);
        add_if_set(params, "reference_image_multiple", request.reference_image_multiple);
        add_if_set(params, "reference_information_extracted_multiple", request.reference_information_extracted_multiple);
        add_if_set(params, "reference_strength_multiple", request.reference_strength_multiple);
        add_if_set(params, "characterPrompts", request.character_prompts);
        add_if_set(params, "skip_cfg_above_sigma", request.skip_cfg_above_sigma);
        add_if_set(params, "inpaintImg2ImgStrength", request.inpaint_img2img_strength);
        add_if_set(params, "stream", request.stream);
        if (request.controlnet_model) {
            params["controlnet_model"] = controlnet_name(*request.controlnet_model);
        }

        if (is_current_protocol(request.model)) {
            add_if_set(params, "v4_prompt", request.v4_prompt);
            add_if_set(params, "v4_negative_prompt", request.v4_negative_prompt);
        }

        return json{
            {"input", request.prompt},
            {"model", model_id(request.model)},
            {"action", action_name(request.action)},
            {"parameters", std::move(params)},
        };
    }

    GenerationRequest request_from_json(const json& j) {
        if (!j.is_object()) {
            throw ValidationError("request", fmt::format("Request must be a JSON object, got {}", j.type_name()));
        }

        GenerationRequest request;

        read_field(j, "prompt", request.prompt);
        read_enum(j, "model", request.model, &parse_model);
        read_enum(j, "action", request.action, &parse_action);
        read_enum(j, "res_preset", request.res_preset, &parse_resolution);

        read_field(j, "negative_prompt", request.negative_prompt);
        read_field(j, "qualityToggle", request.quality_toggle);
        read_field(j, "ucPreset", request.uc_preset);

        read_field(j, "width", request.width);
        read_field(j, "height", request.height);
        read_field(j, "n_samples", request.n_samples);

        read_field(j, "steps", request.steps);
        read_field(j, "scale", request.scale);
        read_field(j, "dynamic_thresholding", request.dynamic_thresholding);
        read_field(j, "seed", request.seed);
        read_field(j, "extra_noise_seed", request.extra_noise_seed);
        read_enum(j, "sampler", request.sampler, &parse_sampler);
        read_field(j, "sm", request.sm);
        read_field(j, "sm_dyn", request.sm_dyn);
        read_field(j, "cfg_rescale", request.cfg_rescale);
        read_enum(j, "noise_schedule", request.noise_schedule, &parse_noise);

        read_field(j, "image", request.image);
        read_field(j, "strength", request.strength);
        read_field(j, "noise", request.noise);
        read_field(j, "controlnet_strength", request.controlnet_strength);
        read_field(j, "controlnet_condition", request.controlnet_condition);
        if (const std::string* name = read_name(j, "controlnet_model")) {
            request.controlnet_model = parse_controlnet(*name);
        }

        read_field(j, "add_original_image", request.add_original_image);
        read_field(j, "mask", request.mask);

        read_field(j, "reference_image_multiple", request.reference_image_multiple);
        read_field(j, "reference_information_extracted_multiple", request.reference_information_extracted_multiple);
        read_field(j, "reference_strength_multiple", request.reference_strength_multiple);

        read_field(j, "params_version", request.params_version);
        read_field(j, "autoSmea", request.auto_smea);
        read_field(j, "characterPrompts", request.character_prompts);
        read_field(j, "v4_prompt", request.v4_prompt);
        read_field(j, "v4_negative_prompt", request.v4_negative_prompt);
        read_field(j, "skip_cfg_above_sigma", request.skip_cfg_above_sigma);
        read_field(j, "use_coords", request.use_coords);
        read_field(j, "legacy_uc", request.legacy_uc);
        read_field(j, "normalize_reference_strength_multiple", request.normalize_reference_strength_multiple);
        read_field(j, "deliberate_euler_ancestral_bug", request.deliberate_euler_ancestral_bug);
        read_field(j, "prefer_brownian", request.prefer_brownian);
        read_field(j, "inpaintImg2ImgStrength", request.inpaint_img2img_strength);

        read_field(j, "legacy", request.legacy);
        read_field(j, "legacy_v3_extend", request.legacy_v3_extend);
        read_field(j, "stream", request.stream);

        return request;
    }

} // namespace imgen_core::metadata
