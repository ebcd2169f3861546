#ifndef STRATA_LAYER_CONV_HPP
#define STRATA_LAYER_CONV_HPP

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
    struct Conv2dOptions {
        std::int64_t filters{};
        std::vector<std::int64_t> kernel_size{3, 3};
        std::vector<std::int64_t> stride{1, 1};
        std::vector<std::int64_t> padding{0, 0};
        std::vector<std::int64_t> dilation{1, 1};
        bool bias{true};
    };

    struct Conv2dDescriptor {
        Conv2dOptions options{};
        ::Strata::Activation::Descriptor activation{::Strata::Activation::Identity};
        ::Strata::Initialization::Descriptor initialization{::Strata::Initialization::Default};
        Options layer{};
    };

    // NCHW input; in_channels are inferred from the first call.
    class Conv2dImpl : public Base {
    public:
        explicit Conv2dImpl(Conv2dDescriptor descriptor)
            : Base(descriptor.layer), descriptor_(std::move(descriptor))
        {
            const auto& options = descriptor_.options;
            if (options.filters <= 0) {
                throw ConfigurationError("Conv2d layers require a positive number of filters.");
            }
            check_pair(options.kernel_size, "kernel_size", 1);
            check_pair(options.stride, "stride", 1);
            check_pair(options.padding, "padding", 0);
            check_pair(options.dilation, "dilation", 1);
        }

        [[nodiscard]] std::string class_name() const override { return "Conv2d"; }

        [[nodiscard]] std::vector<Shape> compute_output_shape(const std::vector<Shape>& input_shapes) const override
        {
            require_single_input(input_shapes, name());
            const auto& shape = input_shapes.front();
            if (shape.size() != 4 || !shape[1].has_value()) {
                std::ostringstream message;
                message << "Layer '" << name() << "' expects an NCHW input with a defined channel dimension, received "
                        << to_string(shape) << '.';
                throw ConfigurationError(message.str());
            }
            const auto& options = descriptor_.options;
            Shape output{shape[0], descriptor_.options.filters, std::nullopt, std::nullopt};
            for (std::size_t axis = 0; axis < 2; ++axis) {
                const auto& extent = shape[axis + 2];
                if (!extent.has_value()) {
                    continue;
                }
                const auto effective = options.dilation[axis] * (options.kernel_size[axis] - 1) + 1;
                const auto numerator = *extent + 2 * options.padding[axis] - effective;
                if (numerator < 0) {
                    std::ostringstream message;
                    message << "Layer '" << name() << "' kernel does not fit the spatial input " << to_string(shape) << '.';
                    throw ConfigurationError(message.str());
                }
                output[axis + 2] = numerator / options.stride[axis] + 1;
            }
            return {output};
        }

        [[nodiscard]] std::vector<DType> compute_output_dtype(const std::vector<DType>&, std::size_t output_count) const override
        {
            return std::vector<DType>(output_count, weight_dtype());
        }

        std::vector<torch::Tensor> forward(const std::vector<torch::Tensor>& inputs, bool, const CallArguments&) override
        {
            require_input_count(inputs, 1, name());
            const auto& options = descriptor_.options;
            auto output = torch::conv2d(inputs.front().to(kernel_.scalar_type()), kernel_, bias_,
                                        options.stride, options.padding, options.dilation);
            return {::Strata::Activation::Details::apply(descriptor_.activation.type, std::move(output))};
        }

        [[nodiscard]] PropertyTree config() const override
        {
            const auto& options = descriptor_.options;
            auto tree = Base::config();
            tree.put("filters", options.filters);
            tree.add_child("kernel_size", Config::write_array(options.kernel_size));
            tree.add_child("stride", Config::write_array(options.stride));
            tree.add_child("padding", Config::write_array(options.padding));
            tree.add_child("dilation", Config::write_array(options.dilation));
            tree.put("bias", options.bias);
            tree.put("activation", ::Strata::Activation::Details::to_string(descriptor_.activation.type));
            tree.put("initialization", ::Strata::Initialization::Details::to_string(descriptor_.initialization.type));
            return tree;
        }

        [[nodiscard]] const Conv2dDescriptor& descriptor() const noexcept { return descriptor_; }

    protected:
        void build(const std::vector<Shape>& input_shapes) override
        {
            static_cast<void>(compute_output_shape(input_shapes));
            const auto& options = descriptor_.options;
            const auto in_channels = *input_shapes.front()[1];
            kernel_ = register_weight("kernel", {options.filters, in_channels, options.kernel_size[0], options.kernel_size[1]});
            if (options.bias) {
                bias_ = register_weight("bias", {options.filters});
            }
            ::Strata::Initialization::Details::apply_weight_initialization(kernel_, bias_, descriptor_.initialization);
        }

    private:
        static void check_pair(const std::vector<std::int64_t>& values, const std::string& field, std::int64_t minimum)
        {
            if (values.size() != 2 || values[0] < minimum || values[1] < minimum) {
                throw ConfigurationError("Conv2d option '" + field + "' requires two values >= " + std::to_string(minimum) + ".");
            }
        }

        Conv2dDescriptor descriptor_{};
        torch::Tensor kernel_{};
        torch::Tensor bias_{};
    };

    inline std::shared_ptr<Base> conv2d_from_config(const PropertyTree& tree)
    {
        const std::string context = "Conv2d config";
        Conv2dDescriptor descriptor{};
        auto& options = descriptor.options;
        options.filters = Config::get_numeric<std::int64_t>(tree, "filters", context);
        options.kernel_size = Config::read_array<std::int64_t>(Config::get_child(tree, "kernel_size", context), context);
        options.stride = Config::read_array<std::int64_t>(Config::get_child(tree, "stride", context), context);
        options.padding = Config::read_array<std::int64_t>(Config::get_child(tree, "padding", context), context);
        options.dilation = Config::read_array<std::int64_t>(Config::get_child(tree, "dilation", context), context);
        options.bias = tree.get<bool>("bias", true);
        descriptor.activation = ::Strata::Activation::Details::from_string(tree.get<std::string>("activation", "identity"));
        descriptor.initialization =
            ::Strata::Initialization::Details::from_string(tree.get<std::string>("initialization", "default"));
        descriptor.layer = read_options(tree, context);
        return std::make_shared<Conv2dImpl>(std::move(descriptor));
    }
}

#endif // STRATA_LAYER_CONV_HPP
