#include "errors.hpp"

#include <spdlog/fmt/fmt.h>

namespace imgen_core {

    SampleCountError::SampleCountError(int cap, int requested, int width, int height)
        : ValidationError(
              "n_samples",
              fmt::format("Max value of n_samples is {} under current resolution ({}x{}). Got {}.",
                          cap, width, height, requested)),
          cap_(cap),
          requested_(requested) {}

} // namespace imgen_core
