#ifndef STRATA_LAYER_LAMBDA_HPP
#define STRATA_LAYER_LAMBDA_HPP

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../base.hpp"

namespace Strata::Layer::Details {
    using LambdaForward = std::function<std::vector<torch::Tensor>(const std::vector<torch::Tensor>&, bool, const CallArguments&)>;
    using LambdaShape = std::function<std::vector<Shape>(const std::vector<Shape>&)>;

    struct LambdaDescriptor {
        LambdaForward forward{};
        LambdaShape output_shape{};     // empty: outputs mirror the input shapes
        Options layer{};
    };

    class LambdaImpl : public Base {
    public:
        explicit LambdaImpl(LambdaDescriptor descriptor)
            : Base(descriptor.layer), descriptor_(std::move(descriptor))
        {
            if (!descriptor_.forward) {
                throw ConfigurationError("Lambda layers require a forward function.");
            }
        }

        [[nodiscard]] std::string class_name() const override { return "Lambda"; }

        [[nodiscard]] bool serializable() const noexcept override { return false; }

        [[nodiscard]] std::vector<Shape> compute_output_shape(const std::vector<Shape>& input_shapes) const override
        {
            if (descriptor_.output_shape) {
                return descriptor_.output_shape(input_shapes);
            }
            return input_shapes;
        }

        std::vector<torch::Tensor> forward(const std::vector<torch::Tensor>& inputs, bool training,
                                           const CallArguments& arguments) override
        {
            return descriptor_.forward(inputs, training, arguments);
        }

    private:
        LambdaDescriptor descriptor_{};
    };
}

#endif // STRATA_LAYER_LAMBDA_HPP
