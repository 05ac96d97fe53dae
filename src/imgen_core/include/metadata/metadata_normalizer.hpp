#pragma once

#include "types/generation_request.hpp"
#include "metadata/seed_source.hpp"

#include <array>
#include <cstdint>

namespace imgen_core::metadata {

    // Pixel-area bounds of a normalized request.
    constexpr int64_t MIN_PIXEL_AREA = 64 * 64;
    constexpr int64_t MAX_PIXEL_AREA = 3047424;

    // Defaults filled in by the normalizer.
    inline constexpr const char* DEFAULT_CHARACTER_PROMPT = "1girl, cute";
    inline constexpr const char* DEFAULT_CHARACTER_UC = "lowres, aliasing,";
    inline constexpr const char* STREAM_FORMAT_MSGPACK = "msgpack";
    constexpr double DEFAULT_IMG2IMG_STRENGTH = 0.3;
    constexpr double DEFAULT_IMG2IMG_NOISE = 0.0;
    constexpr double DEFAULT_REFERENCE_INFORMATION_EXTRACTED = 1.0;
    constexpr double DEFAULT_REFERENCE_STRENGTH = 0.6;

    /**
     * @brief Context shared by all stages of one normalization run
     */
    struct StageContext {
        ISeedSource& seed_source;
    };

    /**
     * @brief One pure step of the normalization pipeline.
     *
     * Takes a request snapshot and returns the transformed snapshot; may throw
     * ValidationError. Every stage is idempotent.
     */
    struct NormalizationStage {
        const char* name;
        GenerationRequest (*apply)(const GenerationRequest&, const StageContext&);
    };

    namespace stages {
        GenerationRequest validate_input(const GenerationRequest& request, const StageContext& ctx);
        GenerationRequest resolve_resolution(const GenerationRequest& request, const StageContext& ctx);
        GenerationRequest append_quality_tags(const GenerationRequest& request, const StageContext& ctx);
        GenerationRequest apply_uc_preset(const GenerationRequest& request, const StageContext& ctx);
        GenerationRequest deduplicate_prompts(const GenerationRequest& request, const StageContext& ctx);
        GenerationRequest infer_use_coords(const GenerationRequest& request, const StageContext& ctx);
        GenerationRequest default_character_prompts(const GenerationRequest& request, const StageContext& ctx);
        GenerationRequest set_stream_mode(const GenerationRequest& request, const StageContext& ctx);
        GenerationRequest synthesize_captions(const GenerationRequest& request, const StageContext& ctx);
        GenerationRequest default_inpaint_strength(const GenerationRequest& request, const StageContext& ctx);
        GenerationRequest default_img2img_extras(const GenerationRequest& request, const StageContext& ctx);
        GenerationRequest align_vibe_transfer(const GenerationRequest& request, const StageContext& ctx);
        GenerationRequest apply_sampler_flags(const GenerationRequest& request, const StageContext& ctx);
    } // namespace stages

    using NormalizationPipeline = std::array<NormalizationStage, 13>;

    /**
     * @brief The fixed stage order. Later stages read fields set by earlier ones.
     */
    [[nodiscard]] const NormalizationPipeline& normalization_pipeline();

    /**
     * @brief Maximum n_samples allowed for a pixel area; 0 means none allowed.
     */
    [[nodiscard]] int max_n_samples(int width, int height);

    /**
     * @brief Turns a sparse GenerationRequest into a complete, valid one.
     *
     * Normalizing an already-normalized request returns it unchanged.
     */
    class MetadataNormalizer {
    public:
        /**
         * @brief Constructor.
         * @param seed_source Source for seeds the caller left unset. Must outlive the normalizer.
         */
        explicit MetadataNormalizer(ISeedSource& seed_source);

        /**
         * @brief Runs every pipeline stage in order.
         * @param request Sparse request
         * @return Normalized request
         * @throws ValidationError naming the first violated constraint
         */
        [[nodiscard]] GenerationRequest normalize(const GenerationRequest& request) const;

    private:
        ISeedSource& seed_source_;
    };

} // namespace imgen_core::metadata
