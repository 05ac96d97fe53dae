#pragma once

#include "types/constants.hpp"
#include "types/character_prompt.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace imgen_core {

    /**
     * @brief Parameters of one image generation call.
     *
     * `prompt`, `model`, `action` and `res_preset` form the envelope of the
     * request payload; every other field goes into `parameters`. Optional
     * fields that stay unset are omitted from the payload.
     */
    struct GenerationRequest {
        // --- General ---
        std::string prompt;
        Model model = Model::V4_5;
        Action action = Action::GENERATE;
        Resolution res_preset = Resolution::NORMAL_SQUARE;

        // --- Prompt ---
        std::string negative_prompt;
        bool quality_toggle = true;
        std::optional<int> uc_preset = 0;   // 0 heavy, 1 light, 2/3 family specific

        // --- Image settings ---
        std::optional<int> width;
        std::optional<int> height;
        int n_samples = 1;

        // --- Sampling ---
        int steps = 28;
        double scale = 6.0;
        bool dynamic_thresholding = false;
        std::optional<uint64_t> seed;
        std::optional<uint64_t> extra_noise_seed;
        Sampler sampler = Sampler::EULER_ANC;
        std::optional<bool> sm;       // legacy SMEA
        std::optional<bool> sm_dyn;   // legacy SMEA DYN
        double cfg_rescale = 0.0;
        Noise noise_schedule = Noise::KARRAS;

        // --- img2img ---
        std::optional<std::string> image;   // base64
        std::optional<double> strength;
        std::optional<double> noise;
        double controlnet_strength = 1.0;
        std::optional<std::string> controlnet_condition;
        std::optional<Controlnet> controlnet_model;

        // --- Inpaint ---
        bool add_original_image = true;
        std::optional<std::string> mask;

        // --- Vibe transfer (parallel lists) ---
        std::optional<std::vector<std::string>> reference_image_multiple;
        std::optional<std::vector<double>> reference_information_extracted_multiple;
        std::optional<std::vector<double>> reference_strength_multiple;

        // --- V4 / V4.5 ---
        int params_version = 3;
        bool auto_smea = false;
        std::optional<std::vector<CharacterPrompt>> character_prompts = std::vector<CharacterPrompt>{};
        std::optional<V4PromptFormat> v4_prompt;
        std::optional<V4NegativePromptFormat> v4_negative_prompt;
        std::optional<int> skip_cfg_above_sigma;
        bool use_coords = false;
        bool legacy_uc = false;
        bool normalize_reference_strength_multiple = true;
        bool deliberate_euler_ancestral_bug = false;
        bool prefer_brownian = false;
        std::optional<int> inpaint_img2img_strength;   // V4.5 full only

        // --- Misc ---
        bool legacy = false;
        bool legacy_v3_extend = false;
        std::optional<std::string> stream;

        bool operator==(const GenerationRequest&) const = default;
    };

} // namespace imgen_core
