#ifndef STRATA_LAYER_FLATTEN_HPP
#define STRATA_LAYER_FLATTEN_HPP

#include <cstdint>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../base.hpp"

namespace Strata::Layer::Details {
    struct FlattenDescriptor {
        Options layer{};
    };

    // Keeps the leading (batch) dimension and folds the rest into one.
    class FlattenImpl : public Base {
    public:
        explicit FlattenImpl(FlattenDescriptor descriptor = {})
            : Base(std::move(descriptor.layer)) {}

        [[nodiscard]] std::string class_name() const override { return "Flatten"; }

        [[nodiscard]] std::vector<Shape> compute_output_shape(const std::vector<Shape>& input_shapes) const override
        {
            require_single_input(input_shapes, name());
            const auto& shape = input_shapes.front();
            if (shape.size() < 2 || !is_fully_defined(shape, 1)) {
                std::ostringstream message;
                message << "Layer '" << name() << "' expects an input of rank >= 2 whose non-batch dimensions are defined, received "
                        << to_string(shape) << '.';
                throw ConfigurationError(message.str());
            }
            std::int64_t features = 1;
            for (std::size_t i = 1; i < shape.size(); ++i) {
                features *= *shape[i];
            }
            return {Shape{shape.front(), features}};
        }

        std::vector<torch::Tensor> forward(const std::vector<torch::Tensor>& inputs, bool, const CallArguments&) override
        {
            require_input_count(inputs, 1, name());
            const auto& input = inputs.front();
            return {input.reshape({input.size(0), -1})};
        }
    };

    inline std::shared_ptr<Base> flatten_from_config(const PropertyTree& tree)
    {
        FlattenDescriptor descriptor{};
        descriptor.layer = read_options(tree, "Flatten config");
        return std::make_shared<FlattenImpl>(std::move(descriptor));
    }
}

#endif // STRATA_LAYER_FLATTEN_HPP
