#pragma once

#include "types/constants.hpp"
#include "types/generation_request.hpp"

#include <cstdint>

namespace imgen_core::metadata {

    /**
     * @brief Inputs that determine the billing cost of one generation call
     */
    struct CostParams {
        int steps = 28;
        int n_samples = 1;
        Action action = Action::GENERATE;
        double strength = 1.0;          // only applied to img2img
        bool sm = false;
        bool sm_dyn = false;
        bool auto_smea = false;
        int width = 1024;
        int height = 1024;
        bool current_protocol = true;   // selects autoSmea vs sm/sm_dyn pricing
        bool is_opus = false;           // privileged tier, one free sample
    };

    // Empirical per-pixel and per-pixel-step coefficients.
    constexpr double COST_PIXEL_COEFFICIENT = 2951823174884865e-21;
    constexpr double COST_PIXEL_STEP_COEFFICIENT = 5.753298233447344e-7;
    constexpr int64_t COST_MIN_RESOLUTION = 65536;
    constexpr int64_t MIN_COST_PER_SAMPLE = 2;
    constexpr int FREE_TIER_MAX_STEPS = 28;

    /**
     * @brief Computes the billing units for a generation call.
     * @param params Normalized cost inputs
     * @return Total units across all billed samples
     */
    [[nodiscard]] int64_t calculate_cost(const CostParams& params);

    /**
     * @brief Convenience overload reading the inputs from a normalized request.
     * @param request Request whose width and height are already set
     * @param is_opus Whether the account is on the privileged tier
     * @throws ValidationError if width or height is unset
     */
    [[nodiscard]] int64_t calculate_cost(const GenerationRequest& request, bool is_opus = false);

} // namespace imgen_core::metadata
