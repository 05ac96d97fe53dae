#include <gtest/gtest.h>
#include "metadata/metadata_normalizer.hpp"
#include "metadata/prompt_presets.hpp"
#include "errors.hpp"

#include <string>
#include <vector>

using namespace imgen_core;

// -----------------------------------------------------------------------------
// Test fixture: fixed seeds so normalization is deterministic
// -----------------------------------------------------------------------------
class MetadataNormalizerTest : public ::testing::Test {
public:
    static constexpr uint64_t FIRST_SEED  = 42;
    static constexpr uint64_t SECOND_SEED = 77;

protected:
    metadata::FixedSeedSource seeds_{{FIRST_SEED, SECOND_SEED}};
    metadata::MetadataNormalizer normalizer_{seeds_};

    GenerationRequest normalize(const GenerationRequest& request) {
        return normalizer_.normalize(request);
    }
};

// --------------------------------------------------------------------------
// Small helpers to keep individual tests concise
// --------------------------------------------------------------------------
namespace {

GenerationRequest request_for(Model model, std::string prompt = "1girl, solo") {
    GenerationRequest request;
    request.prompt = std::move(prompt);
    request.model = model;
    return request;
}

CharacterPrompt character(std::string prompt, std::string uc = "",
                          std::optional<PositionCoords> center = std::nullopt,
                          std::optional<bool> enabled = std::nullopt) {
    return CharacterPrompt{std::move(prompt), std::move(uc), center, enabled};
}

} // namespace

// --------------------------------------------------------------------------
// Resolution
// --------------------------------------------------------------------------
TEST_F(MetadataNormalizerTest, PresetFillsDimensions) {
    auto request = request_for(Model::V4_5);
    request.res_preset = Resolution::NORMAL_PORTRAIT;

    const auto out = normalize(request);
    ASSERT_TRUE(out.width && out.height);
    EXPECT_EQ(*out.width, 832);
    EXPECT_EQ(*out.height, 1216);
}

TEST_F(MetadataNormalizerTest, PresetUsedWhenOnlyOneDimensionSet) {
    auto request = request_for(Model::V4_5);
    request.width = 640;

    const auto out = normalize(request);
    EXPECT_EQ(*out.width, 1024);
    EXPECT_EQ(*out.height, 1024);
}

TEST_F(MetadataNormalizerTest, ExplicitDimensionsRoundUpToMultipleOf64) {
    auto request = request_for(Model::V4_5);
    request.width = 1000;
    request.height = 700;

    const auto out = normalize(request);
    EXPECT_EQ(*out.width, 1024);
    EXPECT_EQ(*out.height, 704);
}

TEST_F(MetadataNormalizerTest, AreaAboveLimitRejected) {
    auto request = request_for(Model::V4_5);
    request.width = 2048;
    request.height = 2048;
    EXPECT_THROW((void)normalize(request), ValidationError);
}

TEST_F(MetadataNormalizerTest, AreaAtLimitAccepted) {
    auto request = request_for(Model::V4_5);
    request.width = 1024;
    request.height = 2944;   // 3014656 px
    EXPECT_NO_THROW((void)normalize(request));
}

// --------------------------------------------------------------------------
// n_samples cap
// --------------------------------------------------------------------------
TEST_F(MetadataNormalizerTest, MaxSamplesBands) {
    EXPECT_EQ(metadata::max_n_samples(512, 704), 8);
    EXPECT_EQ(metadata::max_n_samples(512, 768), 6);
    EXPECT_EQ(metadata::max_n_samples(640, 640), 6);
    EXPECT_EQ(metadata::max_n_samples(1024, 1024), 4);
    EXPECT_EQ(metadata::max_n_samples(1024, 3072), 4);
    EXPECT_EQ(metadata::max_n_samples(1088, 3072), 0);
}

TEST_F(MetadataNormalizerTest, SampleCountAboveCapReportsCap) {
    auto request = request_for(Model::V4_5);
    request.n_samples = 5;

    try {
        (void)normalize(request);
        FAIL() << "expected SampleCountError";
    } catch (const SampleCountError& e) {
        EXPECT_EQ(e.cap(), 4);
        EXPECT_EQ(e.requested(), 5);
        EXPECT_EQ(e.field(), "n_samples");
        EXPECT_NE(std::string(e.what()).find("1024x1024"), std::string::npos);
    }
}

TEST_F(MetadataNormalizerTest, SmallResolutionAllowsEightSamples) {
    auto request = request_for(Model::V4_5);
    request.width = 512;
    request.height = 704;
    request.n_samples = 8;
    EXPECT_EQ(normalize(request).n_samples, 8);
}

// --------------------------------------------------------------------------
// Prompt presets
// --------------------------------------------------------------------------
TEST_F(MetadataNormalizerTest, QualityTagsAppended) {
    const auto out = normalize(request_for(Model::V4_5, "1girl"));
    EXPECT_EQ(out.prompt, "1girl, very aesthetic, masterpiece, no text");
}

TEST_F(MetadataNormalizerTest, QualityTagsFollowModelFamily) {
    const auto out = normalize(request_for(Model::V3_INP, "1girl"));
    EXPECT_EQ(out.prompt, "1girl, best quality, amazing quality, very aesthetic, absurdres");
}

TEST_F(MetadataNormalizerTest, QualityToggleOff) {
    auto request = request_for(Model::V4_5, "1girl, 1girl");
    request.quality_toggle = false;
    EXPECT_EQ(normalize(request).prompt, "1girl");
}

TEST_F(MetadataNormalizerTest, UndesiredContentPresetPrepended) {
    auto request = request_for(Model::V4_5);
    request.negative_prompt = "bad hands";

    const auto out = normalize(request);
    EXPECT_EQ(out.negative_prompt.rfind("nsfw, lowres, artistic error", 0), 0u);
    EXPECT_EQ(out.negative_prompt.substr(out.negative_prompt.size() - 11), ", bad hands");
}

TEST_F(MetadataNormalizerTest, UnmappedPresetLeavesNegativeUnchanged) {
    auto request = request_for(Model::V4);
    request.uc_preset = 3;
    request.negative_prompt = "bad hands";
    EXPECT_EQ(normalize(request).negative_prompt, "bad hands");

    request.uc_preset.reset();
    EXPECT_EQ(normalize(request).negative_prompt, "bad hands");
}

TEST_F(MetadataNormalizerTest, EveryFamilyHasHeavyAndLightPresets) {
    for (auto family : {ModelFamily::V3, ModelFamily::FURRY,
                        ModelFamily::V4_FULL, ModelFamily::V4_CURATED,
                        ModelFamily::V4_5_FULL, ModelFamily::V4_5_CURATED}) {
        EXPECT_TRUE(metadata::undesired_content_preset(family, 0).has_value());
        EXPECT_TRUE(metadata::undesired_content_preset(family, 1).has_value());
        EXPECT_FALSE(metadata::quality_tags(family).empty());
    }
    EXPECT_TRUE(metadata::undesired_content_preset(ModelFamily::V4_5_FULL, 3).has_value());
    EXPECT_FALSE(metadata::undesired_content_preset(ModelFamily::V4_5_CURATED, 3).has_value());
}

// --------------------------------------------------------------------------
// Characters and captions
// --------------------------------------------------------------------------
TEST_F(MetadataNormalizerTest, CharacterDefaultsFilled) {
    auto request = request_for(Model::V4_5);
    request.character_prompts = std::vector{character("")};

    const auto out = normalize(request);
    ASSERT_TRUE(out.character_prompts);
    ASSERT_EQ(out.character_prompts->size(), 1u);
    const auto& cp = out.character_prompts->front();
    EXPECT_EQ(cp.prompt, metadata::DEFAULT_CHARACTER_PROMPT);
    EXPECT_EQ(cp.uc, "lowres, aliasing");
    EXPECT_EQ(cp.center, (PositionCoords{0.5, 0.5}));
    EXPECT_EQ(cp.enabled, true);
    EXPECT_FALSE(out.use_coords);
}

TEST_F(MetadataNormalizerTest, MovedCenterEnablesCoords) {
    auto request = request_for(Model::V4_5);
    request.character_prompts = std::vector{character("girl, girl", "", PositionCoords{0.3, 0.7})};

    const auto out = normalize(request);
    EXPECT_TRUE(out.use_coords);
    EXPECT_EQ(out.character_prompts->front().prompt, "girl");
    ASSERT_TRUE(out.v4_prompt);
    EXPECT_TRUE(out.v4_prompt->use_coords);
    EXPECT_TRUE(out.v4_prompt->use_order);
}

TEST_F(MetadataNormalizerTest, CaptionsIncludeOnlyEnabledCharacters) {
    auto request = request_for(Model::V4_5);
    request.character_prompts = std::vector{
        character("boy", "ugly", PositionCoords{0.3, 0.3}),
        character("cat", "blurry", std::nullopt, false),
    };

    const auto out = normalize(request);
    ASSERT_TRUE(out.v4_prompt && out.v4_negative_prompt);
    EXPECT_EQ(out.v4_prompt->caption.base_caption, out.prompt);
    ASSERT_EQ(out.v4_prompt->caption.char_captions.size(), 1u);
    EXPECT_EQ(out.v4_prompt->caption.char_captions[0].char_caption, "boy");
    EXPECT_EQ(out.v4_prompt->caption.char_captions[0].centers,
              (std::vector<PositionCoords>{{0.3, 0.3}}));

    EXPECT_EQ(out.v4_negative_prompt->caption.base_caption, out.negative_prompt);
    ASSERT_EQ(out.v4_negative_prompt->caption.char_captions.size(), 1u);
    EXPECT_EQ(out.v4_negative_prompt->caption.char_captions[0].char_caption, "ugly");
    EXPECT_FALSE(out.v4_negative_prompt->legacy_uc);
}

TEST_F(MetadataNormalizerTest, ExistingCaptionsKept) {
    auto request = request_for(Model::V4_5);
    V4PromptFormat custom;
    custom.caption.base_caption = "custom";
    request.v4_prompt = custom;

    EXPECT_EQ(normalize(request).v4_prompt->caption.base_caption, "custom");
}

TEST_F(MetadataNormalizerTest, LegacyModelsGetNoCaptionsOrStream) {
    const auto out = normalize(request_for(Model::V3));
    EXPECT_FALSE(out.v4_prompt);
    EXPECT_FALSE(out.v4_negative_prompt);
    EXPECT_FALSE(out.stream);
}

TEST_F(MetadataNormalizerTest, CurrentModelsStreamMsgpack) {
    const auto out = normalize(request_for(Model::V4_CUR));
    EXPECT_EQ(out.stream, std::string(metadata::STREAM_FORMAT_MSGPACK));
    EXPECT_TRUE(out.v4_prompt);
}

TEST_F(MetadataNormalizerTest, NonGenerateActionsDropCharacters) {
    auto request = request_for(Model::V4_5_INP);
    request.action = Action::INPAINT;
    request.character_prompts = std::vector{character("boy")};

    const auto out = normalize(request);
    EXPECT_FALSE(out.character_prompts);
    EXPECT_FALSE(out.stream);
    ASSERT_TRUE(out.v4_prompt);
    EXPECT_TRUE(out.v4_prompt->caption.char_captions.empty());
}

// --------------------------------------------------------------------------
// Action specific defaults
// --------------------------------------------------------------------------
TEST_F(MetadataNormalizerTest, SeedDrawnFromSource) {
    EXPECT_EQ(normalize(request_for(Model::V4_5)).seed, FIRST_SEED);

    auto request = request_for(Model::V4_5);
    request.seed = 1234;
    EXPECT_EQ(normalize(request).seed, 1234u);
}

TEST_F(MetadataNormalizerTest, Img2ImgDefaults) {
    auto request = request_for(Model::V4_5);
    request.action = Action::IMG2IMG;
    request.image = "aGVsbG8=";

    const auto out = normalize(request);
    EXPECT_EQ(out.strength, metadata::DEFAULT_IMG2IMG_STRENGTH);
    EXPECT_EQ(out.noise, metadata::DEFAULT_IMG2IMG_NOISE);
    EXPECT_EQ(out.seed, FIRST_SEED);
    EXPECT_EQ(out.extra_noise_seed, SECOND_SEED);
    EXPECT_FALSE(out.v4_prompt);
}

TEST_F(MetadataNormalizerTest, Img2ImgKeepsExplicitValues) {
    auto request = request_for(Model::V4_5);
    request.action = Action::IMG2IMG;
    request.strength = 0.7;
    request.noise = 0.1;
    request.extra_noise_seed = 5;

    const auto out = normalize(request);
    EXPECT_EQ(out.strength, 0.7);
    EXPECT_EQ(out.noise, 0.1);
    EXPECT_EQ(out.extra_noise_seed, 5u);
}

TEST_F(MetadataNormalizerTest, InpaintStrengthOnlyForFullV45) {
    EXPECT_EQ(normalize(request_for(Model::V4_5)).inpaint_img2img_strength, 1);
    EXPECT_EQ(normalize(request_for(Model::V4_5_INP)).inpaint_img2img_strength, 1);
    EXPECT_FALSE(normalize(request_for(Model::V4_5_CUR)).inpaint_img2img_strength);
    EXPECT_FALSE(normalize(request_for(Model::V4)).inpaint_img2img_strength);
}

TEST_F(MetadataNormalizerTest, EulerAncestralFlags) {
    const auto out = normalize(request_for(Model::V4_5));
    EXPECT_FALSE(out.deliberate_euler_ancestral_bug);
    EXPECT_TRUE(out.prefer_brownian);

    auto request = request_for(Model::V4_5);
    request.sampler = Sampler::DPM2M;
    EXPECT_FALSE(normalize(request).prefer_brownian);
}

// --------------------------------------------------------------------------
// Vibe transfer lists
// --------------------------------------------------------------------------
TEST_F(MetadataNormalizerTest, EmptyVibeImagesClearAllLists) {
    auto request = request_for(Model::V3);
    request.reference_image_multiple = std::vector<std::string>{};
    request.reference_strength_multiple = std::vector<double>{0.5};

    const auto out = normalize(request);
    EXPECT_FALSE(out.reference_image_multiple);
    EXPECT_FALSE(out.reference_information_extracted_multiple);
    EXPECT_FALSE(out.reference_strength_multiple);
}

TEST_F(MetadataNormalizerTest, VibeListsPaddedWithDefaults) {
    auto request = request_for(Model::V3);
    request.reference_image_multiple = std::vector<std::string>{"a", "b", "c"};
    request.reference_strength_multiple = std::vector<double>{0.4};

    const auto out = normalize(request);
    EXPECT_EQ(out.reference_information_extracted_multiple, (std::vector<double>{1.0, 1.0, 1.0}));
    EXPECT_EQ(out.reference_strength_multiple, (std::vector<double>{0.4, 0.6, 0.6}));
}

TEST_F(MetadataNormalizerTest, VibeListsTruncatedToImageCount) {
    auto request = request_for(Model::V3);
    request.reference_image_multiple = std::vector<std::string>{"a"};
    request.reference_information_extracted_multiple = std::vector<double>{0.2, 0.3};

    const auto out = normalize(request);
    EXPECT_EQ(out.reference_information_extracted_multiple, (std::vector<double>{0.2}));
}

// --------------------------------------------------------------------------
// Input validation
// --------------------------------------------------------------------------
TEST_F(MetadataNormalizerTest, RejectsOutOfRangeValues) {
    struct Case {
        const char* field;
        void (*mutate)(GenerationRequest&);
    };
    const Case cases[] = {
        {"steps", [](GenerationRequest& r) { r.steps = 0; }},
        {"steps", [](GenerationRequest& r) { r.steps = 51; }},
        {"scale", [](GenerationRequest& r) { r.scale = 10.5; }},
        {"cfg_rescale", [](GenerationRequest& r) { r.cfg_rescale = -0.1; }},
        {"n_samples", [](GenerationRequest& r) { r.n_samples = 9; }},
        {"width", [](GenerationRequest& r) { r.width = 32; r.height = 1024; }},
        {"ucPreset", [](GenerationRequest& r) { r.uc_preset = 4; }},
        {"seed", [](GenerationRequest& r) { r.seed = 0; }},
        {"seed", [](GenerationRequest& r) { r.seed = MAX_SEED + 1; }},
        {"strength", [](GenerationRequest& r) { r.strength = 1.0; }},
        {"noise", [](GenerationRequest& r) { r.noise = 0.995; }},
        {"controlnet_strength", [](GenerationRequest& r) { r.controlnet_strength = 0.05; }},
        {"characterPrompts.center.x",
         [](GenerationRequest& r) { r.character_prompts = std::vector{character("a", "", PositionCoords{0.95, 0.5})}; }},
        {"reference_strength_multiple",
         [](GenerationRequest& r) { r.reference_strength_multiple = std::vector<double>{0.0}; }},
    };

    for (const auto& c : cases) {
        auto request = request_for(Model::V4_5);
        c.mutate(request);
        try {
            (void)normalize(request);
            ADD_FAILURE() << "expected ValidationError for " << c.field;
        } catch (const ValidationError& e) {
            EXPECT_EQ(e.field(), c.field);
        }
    }
}

TEST_F(MetadataNormalizerTest, AcceptsBoundaryValues) {
    auto request = request_for(Model::V4_5);
    request.steps = 50;
    request.scale = 10.0;
    request.seed = MAX_SEED;
    request.character_prompts = std::vector{character("a", "", PositionCoords{0.1, 0.9})};
    EXPECT_NO_THROW((void)normalize(request));
}

// --------------------------------------------------------------------------
// Pipeline shape and idempotence
// --------------------------------------------------------------------------
TEST_F(MetadataNormalizerTest, PipelineOrder) {
    const auto& pipeline = metadata::normalization_pipeline();
    EXPECT_STREQ(pipeline.front().name, "validate_input");
    EXPECT_STREQ(pipeline[1].name, "resolve_resolution");
    EXPECT_STREQ(pipeline.back().name, "apply_sampler_flags");
    for (const auto& stage : pipeline) {
        EXPECT_NE(stage.apply, nullptr) << stage.name;
    }
}

TEST_F(MetadataNormalizerTest, NormalizationIsIdempotent) {
    std::vector<GenerationRequest> requests;

    requests.push_back(request_for(Model::V4_5, "Girl, girl, {smile}"));

    auto multi = request_for(Model::V4_5_CUR, "2girls");
    multi.negative_prompt = "lowres, extra digits";
    multi.character_prompts = std::vector{
        character("red hair", "", PositionCoords{0.3, 0.5}),
        character("", "", std::nullopt, false),
    };
    requests.push_back(multi);

    auto img2img = request_for(Model::V4, "landscape");
    img2img.action = Action::IMG2IMG;
    img2img.width = 900;
    img2img.height = 600;
    requests.push_back(img2img);

    auto legacy = request_for(Model::FURRY, "fox");
    legacy.uc_preset = 1;
    legacy.reference_image_multiple = std::vector<std::string>{"x", "y"};
    requests.push_back(legacy);

    for (const auto& request : requests) {
        const auto once = normalize(request);
        const auto twice = normalize(once);
        EXPECT_EQ(once, twice) << "model " << model_id(request.model);
    }
}
