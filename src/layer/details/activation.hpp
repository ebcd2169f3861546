#ifndef STRATA_LAYER_ACTIVATION_HPP
#define STRATA_LAYER_ACTIVATION_HPP

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../../activation/apply.hpp"
#include "../base.hpp"

namespace Strata::Layer::Details {
    struct ActivationDescriptor {
        ::Strata::Activation::Descriptor activation{::Strata::Activation::ReLU};
        Options layer{};
    };

    class ActivationImpl : public Base {
    public:
        explicit ActivationImpl(ActivationDescriptor descriptor)
            : Base(descriptor.layer), descriptor_(std::move(descriptor)) {}

        [[nodiscard]] std::string class_name() const override { return "Activation"; }

        [[nodiscard]] std::vector<Shape> compute_output_shape(const std::vector<Shape>& input_shapes) const override
        {
            require_single_input(input_shapes, name());
            return input_shapes;
        }

        // Identity keeps the input dtype and ReLU keeps integers; every other activation
        // computes in floating point, so integral and boolean inputs produce float32.
        [[nodiscard]] std::vector<DType> compute_output_dtype(const std::vector<DType>& input_dtypes,
                                                              std::size_t output_count) const override
        {
            if (dtype() || input_dtypes.empty()) {
                return Base::compute_output_dtype(input_dtypes, output_count);
            }
            return std::vector<DType>(output_count, result_dtype(input_dtypes.front()));
        }

        std::vector<torch::Tensor> forward(const std::vector<torch::Tensor>& inputs, bool, const CallArguments&) override
        {
            require_input_count(inputs, 1, name());
            auto input = inputs.front();
            if (const auto current = dtype_of(input.scalar_type())) {
                const auto target = result_dtype(*current);
                if (target != *current) {
                    input = input.to(to_scalar_type(target));
                }
            }
            auto output = ::Strata::Activation::Details::apply(descriptor_.activation.type, std::move(input));
            if (dtype()) {
                output = output.to(to_scalar_type(*dtype()));
            }
            return {output};
        }

        [[nodiscard]] PropertyTree config() const override
        {
            auto tree = Base::config();
            tree.put("activation", ::Strata::Activation::Details::to_string(descriptor_.activation.type));
            return tree;
        }

    private:
        [[nodiscard]] DType result_dtype(DType input) const noexcept
        {
            using ::Strata::Activation::Type;
            if (is_floating(input) || descriptor_.activation.type == Type::Identity) {
                return input;
            }
            if (descriptor_.activation.type == Type::ReLU && is_integral(input)) {
                return input;
            }
            return DType::Float32;
        }

        ActivationDescriptor descriptor_{};
    };

    inline std::shared_ptr<Base> activation_from_config(const PropertyTree& tree)
    {
        ActivationDescriptor descriptor{};
        descriptor.activation = ::Strata::Activation::Details::from_string(
            Config::get_string(tree, "activation", "Activation config"));
        descriptor.layer = read_options(tree, "Activation config");
        return std::make_shared<ActivationImpl>(std::move(descriptor));
    }
}

#endif // STRATA_LAYER_ACTIVATION_HPP
