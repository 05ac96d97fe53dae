#pragma once

#include <cstddef>
#include <ctime>
#include <stdexcept>
#include <string>

namespace imgen_core::utils {

    /**
     * @brief Local wall-clock time as `YYYYmmdd_HHMMSS`, the prefix of every
     * advisory image filename.
     * @throws std::runtime_error if the local time cannot be determined
     */
    [[nodiscard]] inline std::string filename_timestamp() {
        const std::time_t now = std::time(nullptr);
        std::tm local{};
        if (now == static_cast<std::time_t>(-1) || localtime_r(&now, &local) == nullptr) {
            throw std::runtime_error("filename_timestamp: local time unavailable");
        }

        char buffer[16];
        const size_t written = std::strftime(buffer, sizeof(buffer), "%Y%m%d_%H%M%S", &local);
        return std::string(buffer, written);
    }

} // namespace imgen_core::utils
