#include "metadata/metadata_normalizer.hpp"
#include "metadata/prompt_presets.hpp"
#include "metadata/tag_deduplicator.hpp"
#include "errors.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <string>

namespace imgen_core::metadata {

    namespace {

        constexpr int MIN_DIMENSION = 64;
        constexpr int MAX_DIMENSION = 49152;
        constexpr int DIMENSION_STEP = 64;
        constexpr PositionCoords DEFAULT_CENTER{0.5, 0.5};

        template <typename T>
        void check_range(const char* field, T value, T low, T high) {
            if (value < low || value > high) {
                throw ValidationError(field, fmt::format("{} must be within [{}, {}], got {}", field, low, high, value));
            }
        }

        int round_up_to_step(int value) {
            return (value + DIMENSION_STEP - 1) / DIMENSION_STEP * DIMENSION_STEP;
        }

        bool is_image_to_image_action(Action action) {
            return action == Action::IMG2IMG || action == Action::INPAINT;
        }

        template <typename T>
        void align_to(std::optional<std::vector<T>>& values, size_t size, T fill) {
            if (!values) {
                values.emplace();
            }
            values->resize(size, fill);
        }

    } // namespace

    int max_n_samples(int width, int height) {
        const int64_t area = static_cast<int64_t>(width) * height;
        if (area <= 512 * 704) return 8;
        if (area <= 640 * 640) return 6;
        if (area <= 1024 * 3072) return 4;
        return 0;
    }

    namespace stages {

        GenerationRequest validate_input(const GenerationRequest& request, const StageContext& ctx) {
            check_range("steps", request.steps, 1, 50);
            check_range("scale", request.scale, 0.0, 10.0);
            check_range("cfg_rescale", request.cfg_rescale, 0.0, 1.0);
            check_range("n_samples", request.n_samples, 1, 8);
            check_range("controlnet_strength", request.controlnet_strength, 0.1, 2.0);
            check_range("params_version", request.params_version, 1, 3);

            if (request.width) check_range("width", *request.width, MIN_DIMENSION, MAX_DIMENSION);
            if (request.height) check_range("height", *request.height, MIN_DIMENSION, MAX_DIMENSION);
            if (request.uc_preset) check_range("ucPreset", *request.uc_preset, 0, 3);
            if (request.seed) check_range("seed", *request.seed, MIN_SEED, MAX_SEED);
            if (request.extra_noise_seed) check_range("extra_noise_seed", *request.extra_noise_seed, MIN_SEED, MAX_SEED);
            if (request.strength) check_range("strength", *request.strength, 0.01, 0.99);
            if (request.noise) check_range("noise", *request.noise, 0.0, 0.99);

            if (request.character_prompts) {
                for (const auto& cp : *request.character_prompts) {
                    if (!cp.center) continue;
                    check_range("characterPrompts.center.x", cp.center->x, 0.1, 0.9);
                    check_range("characterPrompts.center.y", cp.center->y, 0.1, 0.9);
                }
            }
            if (request.reference_information_extracted_multiple) {
                for (double value : *request.reference_information_extracted_multiple) {
                    check_range("reference_information_extracted_multiple", value, 0.01, 1.0);
                }
            }
            if (request.reference_strength_multiple) {
                for (double value : *request.reference_strength_multiple) {
                    check_range("reference_strength_multiple", value, 0.01, 1.0);
                }
            }

            GenerationRequest result = request;
            if (!result.seed) {
                result.seed = ctx.seed_source.next_seed();
            }
            return result;
        }

        GenerationRequest resolve_resolution(const GenerationRequest& request, const StageContext&) {
            GenerationRequest result = request;
            if (!result.width || !result.height) {
                const auto preset = resolution_size(result.res_preset);
                result.width = preset.width;
                result.height = preset.height;
            } else {
                result.width = round_up_to_step(*result.width);
                result.height = round_up_to_step(*result.height);
            }

            const int64_t area = static_cast<int64_t>(*result.width) * *result.height;
            if (area < MIN_PIXEL_AREA || area > MAX_PIXEL_AREA) {
                throw ValidationError("width", fmt::format(
                    "The maximum allowed total resolution is ({} px), got {}x{}={}.",
                    MAX_PIXEL_AREA, *result.width, *result.height, area));
            }

            const int cap = max_n_samples(*result.width, *result.height);
            if (result.n_samples > cap) {
                throw SampleCountError(cap, result.n_samples, *result.width, *result.height);
            }
            return result;
        }

        GenerationRequest append_quality_tags(const GenerationRequest& request, const StageContext&) {
            if (!request.quality_toggle) {
                return request;
            }
            GenerationRequest result = request;
            result.prompt += quality_tags(model_family(result.model));
            return result;
        }

        GenerationRequest apply_uc_preset(const GenerationRequest& request, const StageContext&) {
            if (!request.uc_preset) {
                return request;
            }
            const auto block = undesired_content_preset(model_family(request.model), *request.uc_preset);
            if (!block) {
                return request;
            }
            GenerationRequest result = request;
            result.negative_prompt = std::string(*block) + ", " + result.negative_prompt;
            return result;
        }

        GenerationRequest deduplicate_prompts(const GenerationRequest& request, const StageContext&) {
            GenerationRequest result = request;
            result.prompt = deduplicate_tags(result.prompt);
            result.negative_prompt = deduplicate_tags(result.negative_prompt);
            return result;
        }

        GenerationRequest infer_use_coords(const GenerationRequest& request, const StageContext&) {
            if (!request.character_prompts) {
                return request;
            }
            const bool moved = std::any_of(
                request.character_prompts->begin(), request.character_prompts->end(),
                [](const CharacterPrompt& cp) { return cp.center && *cp.center != DEFAULT_CENTER; });
            if (!moved) {
                return request;
            }
            GenerationRequest result = request;
            result.use_coords = true;
            return result;
        }

        GenerationRequest default_character_prompts(const GenerationRequest& request, const StageContext&) {
            GenerationRequest result = request;
            if (result.action != Action::GENERATE) {
                result.character_prompts.reset();
                return result;
            }
            if (!result.character_prompts) {
                return result;
            }

            for (auto& cp : *result.character_prompts) {
                cp.prompt = deduplicate_tags(cp.prompt.empty() ? DEFAULT_CHARACTER_PROMPT : cp.prompt);
                cp.uc = deduplicate_tags(cp.uc.empty() ? DEFAULT_CHARACTER_UC : cp.uc);
                cp.center = cp.center.value_or(DEFAULT_CENTER);
                cp.enabled = cp.enabled.value_or(true);
            }
            return result;
        }

        GenerationRequest set_stream_mode(const GenerationRequest& request, const StageContext&) {
            if (!is_current_protocol(request.model) || request.action != Action::GENERATE) {
                return request;
            }
            GenerationRequest result = request;
            result.stream = STREAM_FORMAT_MSGPACK;
            return result;
        }

        GenerationRequest synthesize_captions(const GenerationRequest& request, const StageContext&) {
            if (!is_current_protocol(request.model) || request.action == Action::IMG2IMG) {
                return request;
            }

            GenerationRequest result = request;
            const std::vector<CharacterPrompt> no_characters;
            const auto& characters = result.character_prompts ? *result.character_prompts : no_characters;

            if (!result.v4_prompt) {
                V4PromptFormat prompt_format;
                prompt_format.caption.base_caption = result.prompt;
                for (const auto& cp : characters) {
                    if (!cp.enabled.value_or(true)) continue;
                    prompt_format.caption.char_captions.push_back(
                        {cp.prompt, {cp.center.value_or(DEFAULT_CENTER)}});
                }
                prompt_format.use_coords = result.use_coords;
                prompt_format.use_order = true;
                result.v4_prompt = std::move(prompt_format);
            }

            if (!result.v4_negative_prompt) {
                V4NegativePromptFormat negative_format;
                negative_format.caption.base_caption = result.negative_prompt;
                for (const auto& cp : characters) {
                    if (!cp.enabled.value_or(true) || cp.uc.empty()) continue;
                    negative_format.caption.char_captions.push_back(
                        {cp.uc, {cp.center.value_or(DEFAULT_CENTER)}});
                }
                negative_format.legacy_uc = result.legacy_uc;
                result.v4_negative_prompt = std::move(negative_format);
            }
            return result;
        }

        GenerationRequest default_inpaint_strength(const GenerationRequest& request, const StageContext&) {
            if (model_family(request.model) != ModelFamily::V4_5_FULL || request.inpaint_img2img_strength) {
                return request;
            }
            GenerationRequest result = request;
            result.inpaint_img2img_strength = 1;
            return result;
        }

        GenerationRequest default_img2img_extras(const GenerationRequest& request, const StageContext& ctx) {
            if (!is_image_to_image_action(request.action)) {
                return request;
            }
            GenerationRequest result = request;
            result.strength = result.strength.value_or(DEFAULT_IMG2IMG_STRENGTH);
            result.noise = result.noise.value_or(DEFAULT_IMG2IMG_NOISE);
            if (!result.extra_noise_seed) {
                result.extra_noise_seed = ctx.seed_source.next_seed();
            }
            return result;
        }

        GenerationRequest align_vibe_transfer(const GenerationRequest& request, const StageContext&) {
            GenerationRequest result = request;
            if (!result.reference_image_multiple || result.reference_image_multiple->empty()) {
                result.reference_image_multiple.reset();
                result.reference_information_extracted_multiple.reset();
                result.reference_strength_multiple.reset();
                return result;
            }

            const size_t count = result.reference_image_multiple->size();
            align_to(result.reference_information_extracted_multiple, count, DEFAULT_REFERENCE_INFORMATION_EXTRACTED);
            align_to(result.reference_strength_multiple, count, DEFAULT_REFERENCE_STRENGTH);
            return result;
        }

        GenerationRequest apply_sampler_flags(const GenerationRequest& request, const StageContext&) {
            if (request.sampler != Sampler::EULER_ANC || request.action != Action::GENERATE) {
                return request;
            }
            GenerationRequest result = request;
            result.deliberate_euler_ancestral_bug = false;
            result.prefer_brownian = true;
            return result;
        }

    } // namespace stages

    const NormalizationPipeline& normalization_pipeline() {
        static const NormalizationPipeline pipeline = {{
            {"validate_input", &stages::validate_input},
            {"resolve_resolution", &stages::resolve_resolution},
            {"append_quality_tags", &stages::append_quality_tags},
            {"apply_uc_preset", &stages::apply_uc_preset},
            {"deduplicate_prompts", &stages::deduplicate_prompts},
            {"infer_use_coords", &stages::infer_use_coords},
            {"default_character_prompts", &stages::default_character_prompts},
            {"set_stream_mode", &stages::set_stream_mode},
            {"synthesize_captions", &stages::synthesize_captions},
            {"default_inpaint_strength", &stages::default_inpaint_strength},
            {"default_img2img_extras", &stages::default_img2img_extras},
            {"align_vibe_transfer", &stages::align_vibe_transfer},
            {"apply_sampler_flags", &stages::apply_sampler_flags},
        }};
        return pipeline;
    }

    MetadataNormalizer::MetadataNormalizer(ISeedSource& seed_source)
        : seed_source_(seed_source) {}

    GenerationRequest MetadataNormalizer::normalize(const GenerationRequest& request) const {
        spdlog::debug("MetadataNormalizer: Normalizing request for model='{}', action='{}'",
                      model_id(request.model), action_name(request.action));

        const StageContext ctx{seed_source_};
        GenerationRequest snapshot = request;

        for (const auto& stage : normalization_pipeline()) {
            try {
                snapshot = stage.apply(snapshot, ctx);
            } catch (const ValidationError& e) {
                spdlog::warn("MetadataNormalizer: Stage '{}' rejected request (field '{}'): {}",
                             stage.name, e.field(), e.what());
                throw;
            }
            spdlog::trace("MetadataNormalizer: Stage '{}' complete", stage.name);
        }

        spdlog::debug("MetadataNormalizer: Normalized to {}x{}, n_samples={}, steps={}, sampler='{}'",
                      *snapshot.width, *snapshot.height, snapshot.n_samples, snapshot.steps,
                      sampler_name(snapshot.sampler));
        return snapshot;
    }

} // namespace imgen_core::metadata
