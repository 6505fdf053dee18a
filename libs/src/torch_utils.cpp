//
// Created by the bayesnet authors on 10/17/26.
//

#include "utils/torch_utils.h"
#include "exception.h"
#include "spdlog/spdlog.h"
#include "fmt/format.h"

namespace bayesnet::ptu {
    torch::Device get_torch_device(const std::string &device_name) {
        if (device_name == "cpu") {
            spdlog::info("Running on CPU.");
            return {torch::kCPU};
        } else if (device_name == "gpu" || device_name == "cuda") {
            if (torch::cuda::is_available()) {
                spdlog::info("CUDA available! Running on GPU.");
                return {torch::kCUDA};
            } else {
                spdlog::info("CUDA is not available. Running on CPU.");
                return {torch::kCPU};
            }
        } else if (device_name.rfind("cuda:", 0) == 0) {
            int64_t index;
            try {
                index = std::stoll(device_name.substr(5));
            } catch (const std::logic_error &e) {
                throw ConfigurationError(fmt::format("Unknown device {}", device_name));
            }
            if (index < 0 || index >= static_cast<int64_t>(torch::cuda::device_count())) {
                throw ConfigurationError(fmt::format("CUDA device {} is not available", device_name));
            }
            spdlog::info("Running on {}.", device_name);
            return {torch::kCUDA, static_cast<c10::DeviceIndex>(index)};
        } else {
            throw ConfigurationError(fmt::format("Unknown device {}", device_name));
        }
    }
}
