#ifndef STRATA_LAYER_NESTED_HPP
#define STRATA_LAYER_NESTED_HPP

#include <cstddef>
#include <memory>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../graph/executor.hpp"
#include "../../graph/feed_dict.hpp"
#include "../../graph/graph.hpp"
#include "../../graph/scope.hpp"
#include "../base.hpp"
#include "../registry.hpp"

namespace Strata::Layer::Details {
    struct NestedDescriptor {
        std::shared_ptr<::Strata::Graph> graph{};
        std::shared_ptr<::Strata::Scope> owner{};   // set when the layer owns the inner scope
        Options layer{};
    };

    // A graph used as a layer. Shapes propagate through the inner nodes; forward
    // runs the inner graph with its own executor.
    class NestedImpl : public Base {
    public:
        explicit NestedImpl(NestedDescriptor descriptor)
            : Base(with_default_name(descriptor)), owner_(std::move(descriptor.owner)), graph_(std::move(descriptor.graph))
        {
            if (!graph_) {
                throw ConfigurationError("Nested layers require a graph.");
            }
        }

        [[nodiscard]] std::string class_name() const override { return "Nested"; }

        [[nodiscard]] const ::Strata::Graph& graph() const noexcept { return *graph_; }

        [[nodiscard]] std::vector<Shape> compute_output_shape(const std::vector<Shape>& input_shapes) const override
        {
            const auto& inputs = graph_->inputs();
            if (input_shapes.size() != inputs.size()) {
                std::ostringstream message;
                message << "Layer '" << name() << "' wraps a graph with " << inputs.size() << " input(s) but was called with "
                        << input_shapes.size() << '.';
                throw ConfigurationError(message.str());
            }

            auto& scope = graph_->scope();
            std::unordered_map<ValueId, Shape> shapes;
            for (std::size_t i = 0; i < inputs.size(); ++i) {
                if (!are_compatible(inputs[i].shape, input_shapes[i])) {
                    std::ostringstream message;
                    message << "Layer '" << name() << "' input " << i << " expects shape " << to_string(inputs[i].shape)
                            << ", received " << to_string(input_shapes[i]) << '.';
                    throw ConfigurationError(message.str());
                }
                shapes[inputs[i].id] = input_shapes[i];
            }

            for (const auto id : graph_->nodes()) {
                const auto& node = scope.node(id);
                std::vector<Shape> node_inputs;
                for (const auto input : node.inputs) {
                    const auto it = shapes.find(input);
                    node_inputs.push_back(it == shapes.end() ? scope.value(input).shape : it->second);
                }
                auto& layer = scope.layer(node.layer);
                layer.ensure_built(node_inputs);
                const auto node_outputs = layer.compute_output_shape(node_inputs);
                for (std::size_t slot = 0; slot < node_outputs.size() && slot < node.outputs.size(); ++slot) {
                    shapes[node.outputs[slot]] = node_outputs[slot];
                }
            }

            std::vector<Shape> outputs;
            for (const auto& output : graph_->outputs()) {
                const auto it = shapes.find(output.id);
                outputs.push_back(it == shapes.end() ? output.shape : it->second);
            }
            return outputs;
        }

        [[nodiscard]] std::vector<DType> compute_output_dtype(const std::vector<DType>&, std::size_t) const override
        {
            std::vector<DType> dtypes;
            for (const auto& output : graph_->outputs()) {
                dtypes.push_back(output.dtype);
            }
            return dtypes;
        }

        std::vector<torch::Tensor> forward(const std::vector<torch::Tensor>& inputs, bool training, const CallArguments&) override
        {
            require_input_count(inputs, graph_->inputs().size(), name());
            FeedDict feed(graph_->log());
            for (std::size_t i = 0; i < inputs.size(); ++i) {
                feed.add(graph_->inputs()[i], inputs[i]);
            }
            ::Strata::Executor executor(graph_->scope(), graph_->log());
            return executor.execute(graph_->outputs(), feed, training);
        }

        [[nodiscard]] PropertyTree config() const override
        {
            auto tree = Base::config();
            tree.add_child("graph", graph_->to_config());
            return tree;
        }

        // Inner weight names are prefixed with this layer's name.
        [[nodiscard]] std::vector<WeightDescriptor> weights() const override
        {
            auto descriptors = graph_->weights();
            for (auto& descriptor : descriptors) {
                descriptor.name = name() + "/" + descriptor.name;
            }
            return descriptors;
        }

        [[nodiscard]] std::vector<torch::Tensor> weight_values() const override { return graph_->weight_values(); }

        void set_weights(const std::vector<torch::Tensor>& values) override
        {
            check_weights(values);
            graph_->set_weights(values);
        }

    private:
        static Options with_default_name(const NestedDescriptor& descriptor)
        {
            auto options = descriptor.layer;
            if (options.name.empty() && descriptor.graph) {
                options.name = descriptor.graph->name();
            }
            return options;
        }

        std::shared_ptr<::Strata::Scope> owner_{};
        std::shared_ptr<::Strata::Graph> graph_{};
    };

    inline std::shared_ptr<Base> nested_from_config(const PropertyTree& tree, const Registry& registry)
    {
        NestedDescriptor descriptor{};
        descriptor.owner = std::make_shared<::Strata::Scope>();
        descriptor.graph = std::make_shared<::Strata::Graph>(
            ::Strata::Graph::from_config(*descriptor.owner, Config::get_child(tree, "graph", "Nested config"), registry));
        descriptor.layer = read_options(tree, "Nested config");
        return std::make_shared<NestedImpl>(std::move(descriptor));
    }
}

#endif // STRATA_LAYER_NESTED_HPP
