#ifndef STRATA_GRAPH_SCOPE_HPP
#define STRATA_GRAPH_SCOPE_HPP

#include <algorithm>
#include <cstddef>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "../common/config.hpp"
#include "../common/error.hpp"
#include "../layer/base.hpp"
#include "name_scope.hpp"
#include "symbolic.hpp"

namespace Strata {
    // Arena of one model construction.
    // -----------------------------------------------------------------------------
    //  - Owns the registered layers (addressed by LayerHandle), every Node created
    //    by `apply` (addressed by NodeId) and every SymbolicValue (by ValueId).
    //  - Keeps the consumer adjacency used to walk the graph forward.
    //  - Holds the naming context: layer and value names are unique per Scope.
    class Scope {
    public:
        Scope() = default;
        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

        SymbolicValue input(Shape shape, DType dtype = DType::Float32, std::string name = {})
        {
            for (const auto& dimension : shape) {
                if (dimension.has_value() && *dimension <= 0) {
                    throw ConfigurationError("Input shapes require positive dimensions, received " + to_string(shape) + ".");
                }
            }
            if (name.empty()) {
                name = value_names_.unique("input");
            } else if (!value_names_.reserve(name)) {
                throw ConfigurationError("Value name '" + name + "' is already used in this scope.");
            }

            SymbolicValue value{};
            value.id = Details::next_value_id();
            value.name = std::move(name);
            value.shape = std::move(shape);
            value.dtype = dtype;
            values_.emplace(value.id, value);
            return value;
        }

        /// Registers the layer (once) and returns its handle. Unnamed layers get
        /// "<lowercase class>_<k>".
        LayerHandle add(const std::shared_ptr<Layer::Base>& layer)
        {
            if (!layer) {
                throw ConfigurationError("Cannot register a null layer.");
            }
            if (const auto existing = handle_of(*layer)) {
                return *existing;
            }
            if (layer->name().empty()) {
                layer->assign_name(layer_names_.unique(Config::to_lower(layer->class_name())));
            } else if (!layer_names_.reserve(layer->name())) {
                throw ConfigurationError("Layer name '" + layer->name() + "' is already registered.");
            }

            const LayerHandle handle = layers_.size();
            layers_.push_back(layer);
            invocations_.push_back(0);
            handles_.emplace(layer.get(), handle);
            return handle;
        }

        std::vector<SymbolicValue> apply(LayerHandle handle,
                                         const std::vector<SymbolicValue>& inputs,
                                         CallArguments arguments = {})
        {
            auto& layer = this->layer(handle);
            if (inputs.empty()) {
                throw ConfigurationError("Layer '" + layer.name() + "' was applied to no inputs.");
            }
            if (const auto training = arguments.get_child_optional("training");
                training && !training->get_value_optional<bool>()) {
                throw ConfigurationError("Call argument 'training' of layer '" + layer.name() + "' must be a boolean, received '"
                                         + training->data() + "'.");
            }

            std::vector<Shape> shapes;
            std::vector<DType> dtypes;
            shapes.reserve(inputs.size());
            dtypes.reserve(inputs.size());
            for (const auto& input : inputs) {
                const auto& stored = value(input.id);
                shapes.push_back(stored.shape);
                dtypes.push_back(stored.dtype);
            }

            // Everything that can reject the call runs before the layer is built, so a
            // failed apply leaves no built layer without a node.
            auto output_shapes = layer.compute_output_shape(shapes);
            if (output_shapes.empty()) {
                throw ConfigurationError("Layer '" + layer.name() + "' declared no outputs.");
            }
            const auto output_dtypes = layer.compute_output_dtype(dtypes, output_shapes.size());
            if (output_dtypes.size() != output_shapes.size()) {
                throw ConfigurationError("Layer '" + layer.name() + "' declared mismatching output shapes and dtypes.");
            }
            layer.ensure_built(shapes);

            const std::size_t invocation = invocations_[handle];
            std::string base_name = layer.name();
            if (invocation > 0) {
                base_name += "#" + std::to_string(invocation);
            }
            // A name already taken (e.g. an input named like this layer) gets a "_<k>" suffix.
            std::vector<std::string> names;
            names.reserve(output_shapes.size());
            for (std::size_t slot = 0; slot < output_shapes.size(); ++slot) {
                auto name = output_shapes.size() == 1 ? base_name : base_name + ":" + std::to_string(slot);
                if (!value_names_.reserve(name)) {
                    name = value_names_.unique(name);
                }
                names.push_back(std::move(name));
            }

            Node node{};
            node.id = nodes_.size();
            node.layer = handle;
            node.arguments = std::move(arguments);
            node.invocation = invocation;

            std::vector<SymbolicValue> outputs;
            outputs.reserve(output_shapes.size());
            for (std::size_t slot = 0; slot < output_shapes.size(); ++slot) {
                SymbolicValue output{};
                output.id = Details::next_value_id();
                output.name = names[slot];
                output.shape = std::move(output_shapes[slot]);
                output.dtype = output_dtypes[slot];
                output.producer = node.id;
                output.output_index = slot;
                values_.emplace(output.id, output);
                node.outputs.push_back(output.id);
                outputs.push_back(std::move(output));
            }

            for (const auto& input : inputs) {
                node.inputs.push_back(input.id);
                auto& consumers = consumers_[input.id];
                if (std::find(consumers.begin(), consumers.end(), node.id) == consumers.end()) {
                    consumers.push_back(node.id);
                }
            }

            ++invocations_[handle];
            nodes_.push_back(std::move(node));
            return outputs;
        }

        std::vector<SymbolicValue> apply(const std::shared_ptr<Layer::Base>& layer,
                                         const std::vector<SymbolicValue>& inputs,
                                         CallArguments arguments = {})
        {
            return apply(add(layer), inputs, std::move(arguments));
        }

        // Single-output shorthand for apply.
        SymbolicValue call(const std::shared_ptr<Layer::Base>& layer,
                           const SymbolicValue& input,
                           CallArguments arguments = {})
        {
            const auto handle = add(layer);
            auto outputs = apply(handle, std::vector<SymbolicValue>{input}, std::move(arguments));
            if (outputs.size() != 1) {
                throw ConfigurationError("Layer '" + this->layer(handle).name() + "' produces "
                                         + std::to_string(outputs.size()) + " outputs; use apply.");
            }
            return outputs.front();
        }

        [[nodiscard]] const SymbolicValue& value(ValueId id) const
        {
            const auto it = values_.find(id);
            if (it == values_.end()) {
                throw ConfigurationError("Value #" + std::to_string(id) + " does not belong to this scope.");
            }
            return it->second;
        }

        [[nodiscard]] bool owns(const SymbolicValue& value) const { return values_.count(value.id) > 0; }

        [[nodiscard]] const Node& node(NodeId id) const
        {
            if (id >= nodes_.size()) {
                throw ConfigurationError("Node #" + std::to_string(id) + " does not belong to this scope.");
            }
            return nodes_[id];
        }

        [[nodiscard]] Layer::Base& layer(LayerHandle handle) const
        {
            return *layer_ptr(handle);
        }

        [[nodiscard]] const std::shared_ptr<Layer::Base>& layer_ptr(LayerHandle handle) const
        {
            if (handle >= layers_.size()) {
                throw ConfigurationError("Layer handle " + std::to_string(handle) + " does not belong to this scope.");
            }
            return layers_[handle];
        }

        [[nodiscard]] std::optional<LayerHandle> handle_of(const Layer::Base& layer) const
        {
            const auto it = handles_.find(&layer);
            if (it == handles_.end()) {
                return std::nullopt;
            }
            return it->second;
        }

        [[nodiscard]] std::optional<LayerHandle> find_layer(const std::string& name) const
        {
            for (LayerHandle handle = 0; handle < layers_.size(); ++handle) {
                if (layers_[handle]->name() == name) {
                    return handle;
                }
            }
            return std::nullopt;
        }

        [[nodiscard]] const std::vector<NodeId>& consumers(ValueId id) const
        {
            static const std::vector<NodeId> none{};
            const auto it = consumers_.find(id);
            return it == consumers_.end() ? none : it->second;
        }

        [[nodiscard]] std::size_t invocation_count(LayerHandle handle) const
        {
            static_cast<void>(layer_ptr(handle));
            return invocations_[handle];
        }

        [[nodiscard]] std::size_t layer_count() const noexcept { return layers_.size(); }
        [[nodiscard]] std::size_t node_count() const noexcept { return nodes_.size(); }
        [[nodiscard]] std::size_t value_count() const noexcept { return values_.size(); }

    private:
        std::vector<std::shared_ptr<Layer::Base>> layers_{};
        std::vector<std::size_t> invocations_{};
        std::unordered_map<const Layer::Base*, LayerHandle> handles_{};
        std::vector<Node> nodes_{};
        std::unordered_map<ValueId, SymbolicValue> values_{};
        std::unordered_map<ValueId, std::vector<NodeId>> consumers_{};
        NameScope layer_names_{};
        NameScope value_names_{};
    };
}

#endif // STRATA_GRAPH_SCOPE_HPP
