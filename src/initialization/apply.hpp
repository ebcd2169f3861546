#ifndef STRATA_INITIALIZATION_APPLY_HPP
#define STRATA_INITIALIZATION_APPLY_HPP

#include <string>

#include <torch/torch.h>

#include "../common/config.hpp"
#include "../common/error.hpp"
#include "initialization.hpp"

namespace Strata::Initialization::Details {
    // Bias tensors are always zeroed; `bias` may be undefined.
    inline void apply_weight_initialization(torch::Tensor& kernel, torch::Tensor& bias, const Descriptor& descriptor) {
        torch::NoGradGuard no_grad;
        switch (descriptor.type) {
            case ::Strata::Initialization::Type::XavierNormal:
                torch::nn::init::xavier_normal_(kernel);
                break;
            case ::Strata::Initialization::Type::KaimingNormal:
                torch::nn::init::kaiming_normal_(kernel, /*a=*/0.0, torch::kFanIn, torch::kReLU);
                break;
            case ::Strata::Initialization::Type::KaimingUniform:
                torch::nn::init::kaiming_uniform_(kernel, /*a=*/0.0, torch::kFanIn, torch::kReLU);
                break;
            case ::Strata::Initialization::Type::Zeros:
                torch::nn::init::zeros_(kernel);
                break;
            case ::Strata::Initialization::Type::Ones:
                torch::nn::init::ones_(kernel);
                break;
            case ::Strata::Initialization::Type::XavierUniform:
            case ::Strata::Initialization::Type::Default:
            default:
                torch::nn::init::xavier_uniform_(kernel);
                break;
        }
        if (bias.defined()) {
            torch::nn::init::zeros_(bias);
        }
    }

    inline std::string to_string(::Strata::Initialization::Type type)
    {
        switch (type) {
            case ::Strata::Initialization::Type::Default: return "default";
            case ::Strata::Initialization::Type::XavierNormal: return "xavier_normal";
            case ::Strata::Initialization::Type::XavierUniform: return "xavier_uniform";
            case ::Strata::Initialization::Type::KaimingNormal: return "kaiming_normal";
            case ::Strata::Initialization::Type::KaimingUniform: return "kaiming_uniform";
            case ::Strata::Initialization::Type::Zeros: return "zeros";
            case ::Strata::Initialization::Type::Ones: return "ones";
        }
        throw ConfigurationError("Unsupported initialization during serialisation.");
    }

    inline ::Strata::Initialization::Descriptor from_string(const std::string& value)
    {
        const auto lowered = Config::to_lower(value);
        if (lowered == "default") return ::Strata::Initialization::Default;
        if (lowered == "xavier_normal") return ::Strata::Initialization::XavierNormal;
        if (lowered == "xavier_uniform") return ::Strata::Initialization::XavierUniform;
        if (lowered == "kaiming_normal") return ::Strata::Initialization::KaimingNormal;
        if (lowered == "kaiming_uniform") return ::Strata::Initialization::KaimingUniform;
        if (lowered == "zeros") return ::Strata::Initialization::Zeros;
        if (lowered == "ones") return ::Strata::Initialization::Ones;
        throw ConfigurationError("Unknown initialization '" + value + "'.");
    }
}

#endif // STRATA_INITIALIZATION_APPLY_HPP
