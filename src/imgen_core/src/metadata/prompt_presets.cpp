#include "metadata/prompt_presets.hpp"

#include <stdexcept>

namespace imgen_core::metadata {

    std::string_view quality_tags(ModelFamily family) {
        switch (family) {
            case ModelFamily::V4_5_FULL:
                return ", very aesthetic, masterpiece, no text";
            case ModelFamily::V4_5_CURATED:
                return ", location, masterpiece, no text, -0.8::feet::, rating:general";
            case ModelFamily::V4_FULL:
                return ", no text, best quality, very aesthetic, absurdres";
            case ModelFamily::V4_CURATED:
                return ", rating:general, amazing quality, very aesthetic, absurdres";
            case ModelFamily::V3:
                return ", best quality, amazing quality, very aesthetic, absurdres";
            case ModelFamily::FURRY:
                return ", {best quality}, {amazing quality}";
        }
        throw std::logic_error("quality_tags: unhandled model family");
    }

    std::optional<std::string_view> undesired_content_preset(ModelFamily family, int preset) {
        switch (family) {
            case ModelFamily::V4_5_FULL:
                switch (preset) {
                    case 0: // heavy
                        return "nsfw, lowres, artistic error, film grain, scan artifacts, worst quality, bad quality, "
                               "jpeg artifacts, very displeasing, chromatic aberration, dithering, halftone, screentone, "
                               "multiple views, logo, too many watermarks, negative space, blank page";
                    case 1: // light
                        return "nsfw, lowres, artistic error, scan artifacts, worst quality, bad quality, jpeg artifacts, "
                               "multiple views, very displeasing, too many watermarks, negative space, blank page";
                    case 2: // furry focus
                        return "nsfw, {worst quality}, distracting watermark, unfinished, bad quality, {widescreen}, "
                               "upscale, {sequence}, {{grandfathered content}}, blurred foreground, chromatic aberration, "
                               "sketch, everyone, [sketch background], simple, [flat colors], ych (character), outline, "
                               "multiple scenes, [[horror (theme)]], comic";
                    case 3: // human focus
                        return "nsfw, lowres, artistic error, film grain, scan artifacts, worst quality, bad quality, "
                               "jpeg artifacts, very displeasing, chromatic aberration, dithering, halftone, screentone, "
                               "multiple views, logo, too many watermarks, negative space, blank page, @_@, "
                               "mismatched pupils, glowing eyes, bad anatomy";
                    default:
                        return std::nullopt;
                }
            case ModelFamily::V4_5_CURATED:
                switch (preset) {
                    case 0:
                        return "blurry, lowres, upscaled, artistic error, film grain, scan artifacts, worst quality, "
                               "bad quality, jpeg artifacts, very displeasing, chromatic aberration, halftone, "
                               "multiple views, logo, too many watermarks, negative space, blank page";
                    case 1:
                        return "blurry, lowres, upscaled, artistic error, scan artifacts, jpeg artifacts, logo, "
                               "too many watermarks, negative space, blank page";
                    case 2:
                        return "blurry, lowres, upscaled, artistic error, film grain, scan artifacts, bad anatomy, "
                               "bad hands, worst quality, bad quality, jpeg artifacts, very displeasing, "
                               "chromatic aberration, halftone, multiple views, logo, too many watermarks, @_@, "
                               "mismatched pupils, glowing eyes, negative space, blank page";
                    default:
                        return std::nullopt;
                }
            case ModelFamily::V4_FULL:
                switch (preset) {
                    case 0:
                        return "blurry, lowres, error, film grain, scan artifacts, worst quality, bad quality, "
                               "jpeg artifacts, very displeasing, chromatic aberration, multiple views, logo, "
                               "too many watermarks";
                    case 1:
                        return "blurry, lowres, error, worst quality, bad quality, jpeg artifacts, very displeasing";
                    default:
                        return std::nullopt;
                }
            case ModelFamily::V4_CURATED:
                switch (preset) {
                    case 0:
                        return "blurry, lowres, error, film grain, scan artifacts, worst quality, bad quality, "
                               "jpeg artifacts, very displeasing, chromatic aberration, logo, dated, signature, "
                               "multiple views, gigantic breasts";
                    case 1:
                        return "blurry, lowres, error, worst quality, bad quality, jpeg artifacts, very displeasing, "
                               "logo, dated, signature";
                    default:
                        return std::nullopt;
                }
            case ModelFamily::V3:
                switch (preset) {
                    case 0:
                        return "lowres, {bad}, error, fewer, extra, missing, worst quality, jpeg artifacts, "
                               "bad quality, watermark, unfinished, displeasing, chromatic aberration, signature, "
                               "extra digits, artistic error, username, scan, [abstract]";
                    case 1:
                        return "lowres, jpeg artifacts, worst quality, watermark, blurry, very displeasing";
                    case 2:
                        return "lowres, {bad}, error, fewer, extra, missing, worst quality, jpeg artifacts, "
                               "bad quality, watermark, unfinished, displeasing, chromatic aberration, signature, "
                               "extra digits, artistic error, username, scan, [abstract], bad anatomy, bad hands, "
                               "@_@, mismatched pupils, heart-shaped pupils, glowing eyes";
                    default:
                        return std::nullopt;
                }
            case ModelFamily::FURRY:
                switch (preset) {
                    case 0:
                        return "{{worst quality}}, [displeasing], {unusual pupils}, guide lines, {{unfinished}}, "
                               "{bad}, url, artist name, {{tall image}}, mosaic, {sketch page}, comic panel, "
                               "impact (font), [dated], {logo}, ych, {what}, {where is your god now}, "
                               "{distorted text}, repeated text, {floating head}, {1994}, {widescreen}, "
                               "absolutely everyone, sequence, {compression artifacts}, hard translated, {cropped}, "
                               "{commissioner name}, unknown text, high contrast";
                    case 1:
                        return "{worst quality}, guide lines, unfinished, bad, url, tall image, widescreen, "
                               "compression artifacts, unknown text";
                    default:
                        return std::nullopt;
                }
        }
        throw std::logic_error("undesired_content_preset: unhandled model family");
    }

} // namespace imgen_core::metadata
