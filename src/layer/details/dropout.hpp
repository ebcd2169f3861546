#ifndef STRATA_LAYER_DROPOUT_HPP
#define STRATA_LAYER_DROPOUT_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <ATen/CPUGeneratorImpl.h>
#include <torch/torch.h>

#include "../base.hpp"

namespace Strata::Layer::Details {
    struct DropoutOptions {
        double probability{0.5};
        std::optional<std::uint64_t> seed{};
    };

    struct DropoutDescriptor {
        DropoutOptions options{};
        Options layer{};
    };

    // Inverted dropout: kept activations are scaled by 1 / (1 - p) so inference is the identity.
    class DropoutImpl : public Base {
    public:
        explicit DropoutImpl(DropoutDescriptor descriptor)
            : Base(descriptor.layer), options_(descriptor.options)
        {
            if (options_.probability < 0.0 || options_.probability >= 1.0) {
                throw ConfigurationError("Dropout probability must be in the range [0, 1).");
            }
            if (options_.seed) {
                generator_ = at::make_generator<at::CPUGeneratorImpl>(*options_.seed);
            }
        }

        [[nodiscard]] std::string class_name() const override { return "Dropout"; }

        [[nodiscard]] std::vector<Shape> compute_output_shape(const std::vector<Shape>& input_shapes) const override
        {
            require_single_input(input_shapes, name());
            return input_shapes;
        }

        std::vector<torch::Tensor> forward(const std::vector<torch::Tensor>& inputs, bool training, const CallArguments&) override
        {
            require_input_count(inputs, 1, name());
            const auto& input = inputs.front();
            if (!training || options_.probability == 0.0) {
                return {input};
            }
            TORCH_CHECK(input.is_floating_point(), "Dropout expects floating point tensors.");
            const double keep = 1.0 - options_.probability;
            auto mask = torch::empty(input.sizes(), input.options().device(torch::kCPU))
                            .bernoulli_(keep, generator_)
                            .to(input.device());
            return {input * mask / keep};
        }

        [[nodiscard]] PropertyTree config() const override
        {
            auto tree = Base::config();
            tree.put("probability", options_.probability);
            if (options_.seed) {
                tree.put("seed", *options_.seed);
            }
            return tree;
        }

        [[nodiscard]] const DropoutOptions& options() const noexcept { return options_; }

    private:
        DropoutOptions options_{};
        std::optional<at::Generator> generator_{};
    };

    inline std::shared_ptr<Base> dropout_from_config(const PropertyTree& tree)
    {
        DropoutDescriptor descriptor{};
        descriptor.options.probability = Config::get_numeric<double>(tree, "probability", "Dropout config");
        if (const auto seed = tree.get_optional<std::uint64_t>("seed")) {
            descriptor.options.seed = *seed;
        }
        descriptor.layer = read_options(tree, "Dropout config");
        return std::make_shared<DropoutImpl>(std::move(descriptor));
    }
}

#endif // STRATA_LAYER_DROPOUT_HPP
