#include "metadata/cost_estimator.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>

namespace imgen_core::metadata {

    namespace {

        int64_t preset_area(Resolution resolution) {
            const auto size = resolution_size(resolution);
            return static_cast<int64_t>(size.width) * size.height;
        }

        double smea_factor(const CostParams& params) {
            if (params.current_protocol) {
                return params.auto_smea ? 1.2 : 1.0;
            }
            if (params.sm_dyn) return 1.4;
            if (params.sm) return 1.2;
            return 1.0;
        }

    } // namespace

    int64_t calculate_cost(const CostParams& params) {
        const int64_t portrait_area = preset_area(Resolution::NORMAL_PORTRAIT);
        const int64_t square_area = preset_area(Resolution::NORMAL_SQUARE);

        int64_t resolution = std::max<int64_t>(static_cast<int64_t>(params.width) * params.height,
                                               COST_MIN_RESOLUTION);

        // Square normal resolutions are priced like portrait/landscape ones.
        if (resolution > portrait_area && resolution <= square_area) {
            resolution = portrait_area;
        }

        const double r = static_cast<double>(resolution);
        const double strength = params.action == Action::IMG2IMG ? params.strength : 1.0;

        const double per_sample = std::ceil(COST_PIXEL_COEFFICIENT * r
                                      + COST_PIXEL_STEP_COEFFICIENT * r * params.steps)
                            * smea_factor(params);
        const int64_t billed_per_sample = std::max(static_cast<int64_t>(std::ceil(per_sample * strength)),
                                                   MIN_COST_PER_SAMPLE);

        const bool opus_discount = params.is_opus
                                   && params.steps <= FREE_TIER_MAX_STEPS
                                   && resolution <= square_area;

        return billed_per_sample * (params.n_samples - (opus_discount ? 1 : 0));
    }

    int64_t calculate_cost(const GenerationRequest& request, bool is_opus) {
        if (!request.width || !request.height) {
            throw ValidationError("width", "Cost estimation requires a normalized request (width/height unset)");
        }

        CostParams params;
        params.steps = request.steps;
        params.n_samples = request.n_samples;
        params.action = request.action;
        params.strength = request.strength.value_or(1.0);
        params.sm = request.sm.value_or(false);
        params.sm_dyn = request.sm_dyn.value_or(false);
        params.auto_smea = request.auto_smea;
        params.width = *request.width;
        params.height = *request.height;
        params.current_protocol = is_current_protocol(request.model);
        params.is_opus = is_opus;
        return calculate_cost(params);
    }

} // namespace imgen_core::metadata
