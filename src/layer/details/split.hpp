#ifndef STRATA_LAYER_SPLIT_HPP
#define STRATA_LAYER_SPLIT_HPP

#include <cstdint>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../base.hpp"

namespace Strata::Layer::Details {
    struct SplitOptions {
        std::int64_t sections{2};
        std::int64_t axis{-1};
    };

    struct SplitDescriptor {
        SplitOptions options{};
        Options layer{};
    };

    // One output per section; the split axis must be defined and divisible.
    class SplitImpl : public Base {
    public:
        explicit SplitImpl(SplitDescriptor descriptor)
            : Base(descriptor.layer), options_(descriptor.options)
        {
            if (options_.sections < 1) {
                throw ConfigurationError("Split layers require at least one section.");
            }
        }

        [[nodiscard]] std::string class_name() const override { return "Split"; }

        [[nodiscard]] std::vector<Shape> compute_output_shape(const std::vector<Shape>& input_shapes) const override
        {
            require_single_input(input_shapes, name());
            const auto& shape = input_shapes.front();
            const auto axis = normalize_axis(options_.axis, shape.size());
            if (!axis || !shape[*axis].has_value() || *shape[*axis] % options_.sections != 0) {
                std::ostringstream message;
                message << "Layer '" << name() << "' cannot split " << to_string(shape) << " into "
                        << options_.sections << " sections along axis " << options_.axis << '.';
                throw ConfigurationError(message.str());
            }
            Shape section = shape;
            section[*axis] = *shape[*axis] / options_.sections;
            return std::vector<Shape>(static_cast<std::size_t>(options_.sections), section);
        }

        std::vector<torch::Tensor> forward(const std::vector<torch::Tensor>& inputs, bool, const CallArguments&) override
        {
            require_input_count(inputs, 1, name());
            const auto& input = inputs.front();
            const auto size = input.size(options_.axis) / options_.sections;
            return input.split(size, options_.axis);
        }

        [[nodiscard]] PropertyTree config() const override
        {
            auto tree = Base::config();
            tree.put("sections", options_.sections);
            tree.put("axis", options_.axis);
            return tree;
        }

    private:
        SplitOptions options_{};
    };

    inline std::shared_ptr<Base> split_from_config(const PropertyTree& tree)
    {
        SplitDescriptor descriptor{};
        descriptor.options.sections = Config::get_numeric<std::int64_t>(tree, "sections", "Split config");
        descriptor.options.axis = tree.get<std::int64_t>("axis", -1);
        descriptor.layer = read_options(tree, "Split config");
        return std::make_shared<SplitImpl>(std::move(descriptor));
    }
}

#endif // STRATA_LAYER_SPLIT_HPP
