#ifndef STRATA_ACTIVATION_APPLY_HPP
#define STRATA_ACTIVATION_APPLY_HPP

#include <string>
#include <utility>

#include <torch/torch.h>

#include "../common/config.hpp"
#include "../common/error.hpp"
#include "activation.hpp"

namespace Strata::Activation::Details {
    inline torch::Tensor apply(::Strata::Activation::Type type, torch::Tensor input) {
        switch (type) {
            case ::Strata::Activation::Type::ReLU:
                return torch::relu(std::move(input));
            case ::Strata::Activation::Type::Sigmoid:
                return torch::sigmoid(std::move(input));
            case ::Strata::Activation::Type::Tanh:
                return torch::tanh(std::move(input));
            case ::Strata::Activation::Type::LeakyReLU:
                return torch::leaky_relu(std::move(input), 0.01);
            case ::Strata::Activation::Type::Softmax:
                return torch::softmax(std::move(input), -1);
            case ::Strata::Activation::Type::SiLU:
                return torch::silu(std::move(input));
            case ::Strata::Activation::Type::GeLU:
                return torch::gelu(std::move(input));
            case ::Strata::Activation::Type::Identity:
            default:
                return input;
        }
    }

    inline std::string to_string(::Strata::Activation::Type type)
    {
        switch (type) {
            case ::Strata::Activation::Type::Identity: return "identity";
            case ::Strata::Activation::Type::ReLU: return "relu";
            case ::Strata::Activation::Type::Sigmoid: return "sigmoid";
            case ::Strata::Activation::Type::Tanh: return "tanh";
            case ::Strata::Activation::Type::LeakyReLU: return "leaky_relu";
            case ::Strata::Activation::Type::Softmax: return "softmax";
            case ::Strata::Activation::Type::SiLU: return "silu";
            case ::Strata::Activation::Type::GeLU: return "gelu";
        }
        throw ConfigurationError("Unsupported activation during serialisation.");
    }

    inline ::Strata::Activation::Descriptor from_string(const std::string& value)
    {
        const auto lowered = Config::to_lower(value);
        if (lowered == "identity" || lowered == "linear") return ::Strata::Activation::Identity;
        if (lowered == "relu") return ::Strata::Activation::ReLU;
        if (lowered == "sigmoid") return ::Strata::Activation::Sigmoid;
        if (lowered == "tanh") return ::Strata::Activation::Tanh;
        if (lowered == "leaky_relu") return ::Strata::Activation::LeakyReLU;
        if (lowered == "softmax") return ::Strata::Activation::Softmax;
        if (lowered == "silu") return ::Strata::Activation::SiLU;
        if (lowered == "gelu") return ::Strata::Activation::GeLU;
        throw ConfigurationError("Unknown activation '" + value + "'.");
    }
}

#endif // STRATA_ACTIVATION_APPLY_HPP
