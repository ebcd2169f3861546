#ifndef STRATA_LAYER_DENSE_HPP
#define STRATA_LAYER_DENSE_HPP

#include <cstdint>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../../activation/apply.hpp"
#include "../../initialization/apply.hpp"
#include "../../initialization/initialization.hpp"
#include "../base.hpp"

namespace Strata::Layer::Details {
    struct DenseOptions {
        std::int64_t units{};
        bool bias{true};
    };

    struct DenseDescriptor {
        DenseOptions options{};
        ::Strata::Activation::Descriptor activation{::Strata::Activation::Identity};
        ::Strata::Initialization::Descriptor initialization{::Strata::Initialization::Default};
        Options layer{};
    };

    // y = activation(x @ kernel + bias), kernel is [in, units].
    class DenseImpl : public Base {
    public:
        explicit DenseImpl(DenseDescriptor descriptor)
            : Base(descriptor.layer), descriptor_(std::move(descriptor))
        {
            if (descriptor_.options.units <= 0) {
                throw ConfigurationError("Dense layers require a positive number of units.");
            }
        }

        [[nodiscard]] std::string class_name() const override { return "Dense"; }

        [[nodiscard]] std::vector<Shape> compute_output_shape(const std::vector<Shape>& input_shapes) const override
        {
            require_single_input(input_shapes, name());
            auto shape = input_shapes.front();
            if (shape.size() < 2 || !shape.back().has_value()) {
                std::ostringstream message;
                message << "Layer '" << name() << "' expects an input of rank >= 2 with a defined last dimension, received "
                        << to_string(shape) << '.';
                throw ConfigurationError(message.str());
            }
            shape.back() = descriptor_.options.units;
            return {shape};
        }

        [[nodiscard]] std::vector<DType> compute_output_dtype(const std::vector<DType>&, std::size_t output_count) const override
        {
            return std::vector<DType>(output_count, weight_dtype());
        }

        std::vector<torch::Tensor> forward(const std::vector<torch::Tensor>& inputs, bool, const CallArguments&) override
        {
            require_input_count(inputs, 1, name());
            auto output = torch::matmul(inputs.front().to(kernel_.scalar_type()), kernel_);
            if (bias_.defined()) {
                output = output + bias_;
            }
            return {::Strata::Activation::Details::apply(descriptor_.activation.type, std::move(output))};
        }

        [[nodiscard]] PropertyTree config() const override
        {
            auto tree = Base::config();
            tree.put("units", descriptor_.options.units);
            tree.put("bias", descriptor_.options.bias);
            tree.put("activation", ::Strata::Activation::Details::to_string(descriptor_.activation.type));
            tree.put("initialization", ::Strata::Initialization::Details::to_string(descriptor_.initialization.type));
            return tree;
        }

        [[nodiscard]] const DenseDescriptor& descriptor() const noexcept { return descriptor_; }

    protected:
        void build(const std::vector<Shape>& input_shapes) override
        {
            static_cast<void>(compute_output_shape(input_shapes));
            const auto in_features = *input_shapes.front().back();
            kernel_ = register_weight("kernel", {in_features, descriptor_.options.units});
            if (descriptor_.options.bias) {
                bias_ = register_weight("bias", {descriptor_.options.units});
            }
            ::Strata::Initialization::Details::apply_weight_initialization(kernel_, bias_, descriptor_.initialization);
        }

    private:
        DenseDescriptor descriptor_{};
        torch::Tensor kernel_{};
        torch::Tensor bias_{};
    };

    inline std::shared_ptr<Base> dense_from_config(const PropertyTree& tree)
    {
        DenseDescriptor descriptor{};
        descriptor.options.units = Config::get_numeric<std::int64_t>(tree, "units", "Dense config");
        descriptor.options.bias = tree.get<bool>("bias", true);
        descriptor.activation = ::Strata::Activation::Details::from_string(tree.get<std::string>("activation", "identity"));
        descriptor.initialization =
            ::Strata::Initialization::Details::from_string(tree.get<std::string>("initialization", "default"));
        descriptor.layer = read_options(tree, "Dense config");
        return std::make_shared<DenseImpl>(std::move(descriptor));
    }
}

#endif // STRATA_LAYER_DENSE_HPP
