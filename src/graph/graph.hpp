#ifndef STRATA_GRAPH_GRAPH_HPP
#define STRATA_GRAPH_GRAPH_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <tuple>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../common/config.hpp"
#include "../common/error.hpp"
#include "../common/logging.hpp"
#include "../layer/base.hpp"
#include "../layer/registry.hpp"
#include "../utils/terminal.hpp"
#include "executor.hpp"
#include "feed_dict.hpp"
#include "scope.hpp"
#include "symbolic.hpp"

namespace Strata {
    struct GraphOptions {
        std::string name{"graph"};
        LogOptions log{};
    };

    // A frozen (inputs, outputs) pair over a Scope.
    // -----------------------------------------------------------------------------
    //  - Walks backward from the outputs once at construction and caches the
    //    reachable nodes in topological order, their depth and the layers they use.
    //  - Rejects outputs that depend on values that are neither produced nor declared
    //    as inputs; reports declared inputs nothing depends on.
    //  - Carries the config, weights and predict surfaces of the model.
    class Graph {
    public:
        Graph(Scope& scope, std::vector<SymbolicValue> inputs, std::vector<SymbolicValue> outputs, GraphOptions options = {})
            : scope_(&scope), inputs_(std::move(inputs)), outputs_(std::move(outputs)), options_(std::move(options))
        {
            if (outputs_.empty()) {
                throw GraphConstructionError("Graph '" + options_.name + "' requires at least one output.");
            }
            std::unordered_set<ValueId> declared;
            for (auto& input : inputs_) {
                if (!scope_->owns(input)) {
                    throw GraphConstructionError("Graph input '" + input.name + "' does not belong to this scope.");
                }
                input = scope_->value(input.id);
                if (input.producer) {
                    throw GraphConstructionError("Graph input '" + input.name + "' is produced by layer '"
                                                 + scope_->layer(scope_->node(*input.producer).layer).name()
                                                 + "'; inputs must not have a producer.");
                }
                if (!declared.insert(input.id).second) {
                    throw GraphConstructionError("Graph input '" + input.name + "' is declared more than once.");
                }
            }
            for (auto& output : outputs_) {
                if (!scope_->owns(output)) {
                    throw GraphConstructionError("Graph output '" + output.name + "' does not belong to this scope.");
                }
                output = scope_->value(output.id);
            }
            collect(declared);
        }

        [[nodiscard]] const std::string& name() const noexcept { return options_.name; }
        [[nodiscard]] Scope& scope() const noexcept { return *scope_; }
        [[nodiscard]] const std::vector<SymbolicValue>& inputs() const noexcept { return inputs_; }
        [[nodiscard]] const std::vector<SymbolicValue>& outputs() const noexcept { return outputs_; }
        [[nodiscard]] const std::vector<NodeId>& nodes() const noexcept { return nodes_; }
        [[nodiscard]] const std::vector<std::vector<NodeId>>& nodes_by_depth() const noexcept { return nodes_by_depth_; }
        [[nodiscard]] const std::vector<LayerHandle>& layers() const noexcept { return layers_; }
        [[nodiscard]] const std::vector<std::string>& warnings() const noexcept { return warnings_; }
        [[nodiscard]] const LogOptions& log() const noexcept { return options_.log; }

        [[nodiscard]] bool contains(NodeId node) const { return node_set_.count(node) > 0; }

        [[nodiscard]] std::size_t depth_of(NodeId node) const
        {
            const auto it = depth_.find(node);
            if (it == depth_.end()) {
                throw ConfigurationError("Node " + std::to_string(node) + " is not part of graph '" + name() + "'.");
            }
            return it->second;
        }

        [[nodiscard]] std::vector<Shape> input_shapes() const
        {
            std::vector<Shape> shapes;
            for (const auto& input : inputs_) {
                shapes.push_back(input.shape);
            }
            return shapes;
        }

        [[nodiscard]] std::vector<Shape> output_shapes() const
        {
            std::vector<Shape> shapes;
            for (const auto& output : outputs_) {
                shapes.push_back(output.shape);
            }
            return shapes;
        }

        /// Nodes of `layer` inside this graph, in topological order.
        [[nodiscard]] std::vector<NodeId> nodes_of(LayerHandle layer) const
        {
            std::vector<NodeId> result;
            for (const auto node : nodes_) {
                if (scope_->node(node).layer == layer) {
                    result.push_back(node);
                }
            }
            return result;
        }

        [[nodiscard]] std::vector<Layer::WeightDescriptor> weights() const
        {
            std::vector<Layer::WeightDescriptor> descriptors;
            for (const auto handle : layers_) {
                auto layer_weights = scope_->layer(handle).weights();
                descriptors.insert(descriptors.end(), layer_weights.begin(), layer_weights.end());
            }
            return descriptors;
        }

        [[nodiscard]] std::vector<torch::Tensor> weight_values() const
        {
            std::vector<torch::Tensor> values;
            for (const auto handle : layers_) {
                auto layer_values = scope_->layer(handle).weight_values();
                values.insert(values.end(), layer_values.begin(), layer_values.end());
            }
            return values;
        }

        void set_weights(const std::vector<torch::Tensor>& values)
        {
            std::size_t expected = 0;
            for (const auto handle : layers_) {
                expected += scope_->layer(handle).weights().size();
            }
            if (values.size() != expected) {
                std::ostringstream message;
                message << "Graph '" << name() << "' expects " << expected << " weight tensor(s) but received "
                        << values.size() << '.';
                throw ConfigurationError(message.str());
            }
            std::size_t offset = 0;
            for (const auto handle : layers_) {
                auto& layer = scope_->layer(handle);
                const auto count = layer.weights().size();
                const auto first = values.begin() + static_cast<std::ptrdiff_t>(offset);
                layer.set_weights(std::vector<torch::Tensor>(first, first + static_cast<std::ptrdiff_t>(count)));
                offset += count;
            }
        }

        /// Assigns weights by their "<layer>/<parameter>" names. Every weight of the
        /// graph must be provided; names the graph does not know are logged and skipped.
        void load_weights(const std::vector<std::pair<std::string, torch::Tensor>>& named)
        {
            std::unordered_map<std::string, torch::Tensor> lookup;
            for (const auto& [weight, value] : named) {
                if (!lookup.emplace(weight, value).second) {
                    throw ConfigurationError("Weight '" + weight + "' is provided more than once.");
                }
            }

            std::vector<std::pair<Layer::Base*, std::vector<torch::Tensor>>> assignments;
            std::unordered_set<std::string> used;
            for (const auto handle : layers_) {
                auto& layer = scope_->layer(handle);
                std::vector<torch::Tensor> values;
                for (const auto& descriptor : layer.weights()) {
                    const auto it = lookup.find(descriptor.name);
                    if (it == lookup.end()) {
                        throw ConfigurationError("Missing weight '" + descriptor.name + "' for graph '" + name() + "'.");
                    }
                    if (!it->second.defined() || shape_of(it->second) != descriptor.shape) {
                        throw ConfigurationError("Weight '" + descriptor.name + "' expects shape " + to_string(descriptor.shape)
                                                 + " but received "
                                                 + (it->second.defined() ? to_string(shape_of(it->second)) : std::string("an undefined tensor"))
                                                 + ".");
                    }
                    values.push_back(it->second);
                    used.insert(descriptor.name);
                }
                assignments.emplace_back(&layer, std::move(values));
            }
            for (const auto& [weight, value] : named) {
                if (used.count(weight) == 0) {
                    Log::warning(options_.log, "Weight '" + weight + "' does not match any weight of graph '" + name() + "'.");
                }
            }
            for (auto& [layer, values] : assignments) {
                layer->set_weights(values);
            }
        }

        [[nodiscard]] std::int64_t parameter_count() const
        {
            std::int64_t total = 0;
            for (const auto handle : layers_) {
                total += scope_->layer(handle).parameter_count();
            }
            return total;
        }

        /// Feeds `values` to the declared inputs in order and returns the declared outputs.
        std::vector<torch::Tensor> predict(const std::vector<torch::Tensor>& values, bool training = false) const
        {
            if (values.size() != inputs_.size()) {
                std::ostringstream message;
                message << "Graph '" << name() << "' expects " << inputs_.size() << " input tensor(s), received "
                        << values.size() << '.';
                throw ConfigurationError(message.str());
            }
            FeedDict feed(options_.log);
            for (std::size_t i = 0; i < values.size(); ++i) {
                feed.add(inputs_[i], values[i]);
            }
            Executor executor(*scope_, options_.log);
            return executor.execute(outputs_, feed, training);
        }

        [[nodiscard]] std::string summary() const
        {
            namespace Terminal = Utils::Terminal;
            Terminal::Table table({"Layer (type)", "Output shape", "Params", "Connected to"},
                                  options_.log.colorize ? Terminal::Colors::kCyan : Terminal::Colors::kNone);
            std::unordered_set<LayerHandle> counted;
            for (const auto id : nodes_) {
                const auto& node = scope_->node(id);
                const auto& layer = scope_->layer(node.layer);

                std::string shapes;
                for (const auto output : node.outputs) {
                    if (!shapes.empty()) {
                        shapes += " ";
                    }
                    shapes += to_string(scope_->value(output).shape);
                }
                std::string inbound;
                for (const auto input : node.inputs) {
                    if (!inbound.empty()) {
                        inbound += ", ";
                    }
                    inbound += scope_->value(input).name;
                }
                const auto params = counted.insert(node.layer).second ? layer.parameter_count() : 0;
                table.add_row({layer.name() + " (" + layer.class_name() + ")", shapes, std::to_string(params), inbound});
            }

            std::int64_t trainable = 0;
            std::int64_t frozen = 0;
            for (const auto handle : layers_) {
                const auto& layer = scope_->layer(handle);
                (layer.trainable() ? trainable : frozen) += layer.parameter_count();
            }

            std::ostringstream stream;
            stream << "Graph: " << name() << '\n';
            stream << table.render();
            stream << "Total params: " << trainable + frozen << '\n';
            stream << "Trainable params: " << trainable << '\n';
            stream << "Non-trainable params: " << frozen << '\n';
            return stream.str();
        }

        /// Layer configs plus, per node, references to the values it consumed. A value
        /// reference is either {input: name} or {layer, node, slot} where `node` counts
        /// the layer's nodes inside this graph.
        [[nodiscard]] PropertyTree to_config() const
        {
            PropertyTree tree;
            tree.put("name", name());

            PropertyTree input_layers;
            for (const auto& input : inputs_) {
                PropertyTree entry;
                entry.put("name", input.name);
                entry.put("dtype", to_string(input.dtype));
                entry.add_child("shape", Config::write_shape(input.shape));
                input_layers.push_back({"", entry});
            }
            tree.add_child("input_layers", input_layers);

            PropertyTree layers;
            for (const auto handle : layers_) {
                const auto& layer = scope_->layer(handle);
                if (!layer.serializable()) {
                    throw ConfigurationError("Layer '" + layer.name() + "' of class '" + layer.class_name()
                                             + "' cannot be serialised.");
                }
                PropertyTree entry;
                entry.put("class_name", layer.class_name());
                entry.add_child("config", layer.config());

                PropertyTree inbound_nodes;
                for (const auto id : nodes_of(handle)) {
                    const auto& node = scope_->node(id);
                    PropertyTree inbound;
                    PropertyTree references;
                    for (const auto input : node.inputs) {
                        references.push_back({"", reference_of(input)});
                    }
                    inbound.add_child("inputs", references);
                    inbound.add_child("arguments", node.arguments);
                    inbound_nodes.push_back({"", inbound});
                }
                entry.add_child("inbound_nodes", inbound_nodes);
                layers.push_back({"", entry});
            }
            tree.add_child("layers", layers);

            PropertyTree output_layers;
            for (const auto& output : outputs_) {
                output_layers.push_back({"", reference_of(output.id)});
            }
            tree.add_child("output_layers", output_layers);
            return tree;
        }

        /// Rebuilds a graph from `to_config` output inside `scope`. Nodes are replayed
        /// once every value they consume exists, so layer order in the config is free.
        static Graph from_config(Scope& scope, const PropertyTree& tree, const Layer::Registry& registry,
                                 LogOptions log = {})
        {
            const std::string context = "graph config";
            GraphOptions options{};
            options.name = tree.get<std::string>("name", "graph");
            options.log = log;

            std::vector<SymbolicValue> inputs;
            std::map<std::string, SymbolicValue> input_values;
            for (const auto& [key, entry] : Config::get_child(tree, "input_layers", context)) {
                const auto input_name = Config::get_string(entry, "name", context);
                auto value = scope.input(Config::read_shape(Config::get_child(entry, "shape", context), context),
                                         Config::read_dtype(entry, "dtype", context), input_name);
                input_values.emplace(input_name, value);
                inputs.push_back(std::move(value));
            }

            struct PendingNode {
                LayerHandle layer;
                std::string layer_name;
                std::size_t index;
                const PropertyTree* inbound;
            };
            std::vector<PendingNode> pending;
            for (const auto& [key, entry] : Config::get_child(tree, "layers", context)) {
                const auto class_name = Config::get_string(entry, "class_name", context);
                auto layer = registry.create(class_name, Config::get_child(entry, "config", context));
                const auto handle = scope.add(layer);
                std::size_t index = 0;
                if (const auto inbound_nodes = entry.get_child_optional("inbound_nodes")) {
                    for (const auto& [node_key, inbound] : *inbound_nodes) {
                        pending.push_back({handle, layer->name(), index++, &inbound});
                    }
                }
            }

            std::map<std::tuple<std::string, std::size_t, std::size_t>, SymbolicValue> produced;
            std::map<std::string, std::size_t> next_index;
            const auto resolve = [&](const PropertyTree& reference) -> std::optional<SymbolicValue> {
                if (const auto input_name = reference.get_optional<std::string>("input")) {
                    const auto it = input_values.find(*input_name);
                    if (it == input_values.end()) {
                        throw ConfigurationError("Graph config references unknown input '" + *input_name + "'.");
                    }
                    return it->second;
                }
                const auto key = std::make_tuple(Config::get_string(reference, "layer", context),
                                                 Config::get_numeric<std::size_t>(reference, "node", context),
                                                 reference.get<std::size_t>("slot", 0));
                const auto it = produced.find(key);
                if (it == produced.end()) {
                    return std::nullopt;
                }
                return it->second;
            };

            while (!pending.empty()) {
                bool progressed = false;
                for (auto it = pending.begin(); it != pending.end();) {
                    if (next_index[it->layer_name] != it->index) {
                        ++it;
                        continue;
                    }
                    std::vector<SymbolicValue> node_inputs;
                    bool ready = true;
                    for (const auto& [ref_key, reference] : Config::get_child(*it->inbound, "inputs", context)) {
                        auto value = resolve(reference);
                        if (!value) {
                            ready = false;
                            break;
                        }
                        node_inputs.push_back(std::move(*value));
                    }
                    if (!ready) {
                        ++it;
                        continue;
                    }
                    CallArguments arguments = it->inbound->get_child("arguments", CallArguments{});
                    const auto outputs = scope.apply(it->layer, node_inputs, std::move(arguments));
                    for (std::size_t slot = 0; slot < outputs.size(); ++slot) {
                        produced.emplace(std::make_tuple(it->layer_name, it->index, slot), outputs[slot]);
                    }
                    ++next_index[it->layer_name];
                    it = pending.erase(it);
                    progressed = true;
                }
                if (!progressed) {
                    throw ConfigurationError("Graph config '" + options.name + "' has nodes whose inputs can never be resolved, starting with layer '"
                                             + pending.front().layer_name + "'.");
                }
            }

            std::vector<SymbolicValue> outputs;
            for (const auto& [key, reference] : Config::get_child(tree, "output_layers", context)) {
                auto value = resolve(reference);
                if (!value) {
                    throw ConfigurationError("Graph config output references a node that was never built.");
                }
                outputs.push_back(std::move(*value));
            }
            return Graph(scope, std::move(inputs), std::move(outputs), std::move(options));
        }

    private:
        enum class VisitState {
            Unvisited,
            Active,
            Done
        };

        struct Frame {
            NodeId node;
            std::size_t next_input;
        };

        void collect(const std::unordered_set<ValueId>& declared)
        {
            std::unordered_set<ValueId> reached;
            std::unordered_map<NodeId, VisitState> state;
            std::vector<Frame> stack;

            // True when the value has a producer to descend into.
            const auto reach = [&](ValueId id) -> bool {
                const auto& value = scope_->value(id);
                if (value.producer) {
                    return true;
                }
                if (declared.count(id) == 0) {
                    throw DisconnectedInputError(value.name, "Graph '" + name() + "' is disconnected: value '" + value.name
                                                             + "' is neither produced by a layer nor declared as an input.");
                }
                reached.insert(id);
                return false;
            };
            const auto push = [&](NodeId node) {
                switch (state[node]) {
                    case VisitState::Active:
                        throw CycleDetectedError("Graph '" + name() + "' contains a cycle through layer '"
                                                 + scope_->layer(scope_->node(node).layer).name() + "'.");
                    case VisitState::Done:
                        return;
                    case VisitState::Unvisited:
                        state[node] = VisitState::Active;
                        stack.push_back({node, 0});
                        return;
                }
            };

            for (const auto& output : outputs_) {
                if (!reach(output.id)) {
                    continue;
                }
                push(*output.producer);
                while (!stack.empty()) {
                    auto& frame = stack.back();
                    const auto& node = scope_->node(frame.node);
                    if (frame.next_input == node.inputs.size()) {
                        state[frame.node] = VisitState::Done;
                        nodes_.push_back(frame.node);
                        stack.pop_back();
                        continue;
                    }
                    const auto input = node.inputs[frame.next_input++];
                    if (reach(input)) {
                        push(*scope_->value(input).producer);
                    }
                }
            }
            node_set_.insert(nodes_.begin(), nodes_.end());

            for (auto it = nodes_.rbegin(); it != nodes_.rend(); ++it) {
                std::size_t depth = 0;
                bool consumed = false;
                for (const auto output : scope_->node(*it).outputs) {
                    for (const auto consumer : scope_->consumers(output)) {
                        if (node_set_.count(consumer) == 0) {
                            continue;
                        }
                        depth = std::max(depth, depth_.at(consumer) + 1);
                        consumed = true;
                    }
                }
                depth_[*it] = consumed ? depth : 0;
            }
            for (const auto node : nodes_) {
                const auto depth = depth_.at(node);
                if (nodes_by_depth_.size() <= depth) {
                    nodes_by_depth_.resize(depth + 1);
                }
                nodes_by_depth_[depth].push_back(node);
            }

            std::unordered_set<LayerHandle> seen;
            for (const auto node : nodes_) {
                const auto handle = scope_->node(node).layer;
                if (seen.insert(handle).second) {
                    layers_.push_back(handle);
                }
            }

            for (const auto& input : inputs_) {
                if (reached.count(input.id) == 0) {
                    warnings_.push_back("Input '" + input.name + "' of graph '" + name() + "' is not connected to any output.");
                    Log::warning(options_.log, warnings_.back());
                }
            }
        }

        [[nodiscard]] PropertyTree reference_of(ValueId id) const
        {
            const auto& value = scope_->value(id);
            PropertyTree reference;
            if (!value.producer) {
                reference.put("input", value.name);
                return reference;
            }
            const auto& node = scope_->node(*value.producer);
            const auto siblings = nodes_of(node.layer);
            const auto position = std::find(siblings.begin(), siblings.end(), node.id) - siblings.begin();
            reference.put("layer", scope_->layer(node.layer).name());
            reference.put("node", static_cast<std::size_t>(position));
            reference.put("slot", value.output_index);
            return reference;
        }

        Scope* scope_;
        std::vector<SymbolicValue> inputs_{};
        std::vector<SymbolicValue> outputs_{};
        GraphOptions options_{};
        std::vector<NodeId> nodes_{};
        std::unordered_set<NodeId> node_set_{};
        std::unordered_map<NodeId, std::size_t> depth_{};
        std::vector<std::vector<NodeId>> nodes_by_depth_{};
        std::vector<LayerHandle> layers_{};
        std::vector<std::string> warnings_{};
    };
}

#endif // STRATA_GRAPH_GRAPH_HPP
