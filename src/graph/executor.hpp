#ifndef STRATA_GRAPH_EXECUTOR_HPP
#define STRATA_GRAPH_EXECUTOR_HPP

#include <algorithm>
#include <cstddef>
#include <exception>
#include <map>
#include <sstream>
#include <string>
#include <tuple>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../common/error.hpp"
#include "../common/logging.hpp"
#include "feed_dict.hpp"
#include "scope.hpp"
#include "symbolic.hpp"

namespace Strata {
    struct ExecutionTrace {
        std::vector<NodeId> evaluated{};    // plan order, one entry per forward call
        std::vector<ValueId> released{};
        std::size_t peak_live{0};           // largest number of tensors held at once
        bool plan_reused{false};
    };

    // Evaluates fetches against a feed.
    // -----------------------------------------------------------------------------
    //  - Plans by depth-first post-order over producer nodes, stopping at fed values,
    //    so only the nodes the fetches actually need run, each exactly once.
    //  - Intermediate tensors are dropped as soon as their last consumer ran, unless
    //    they are fetched, externally fed, or the call is in training mode.
    //  - Plans and recipient counts are cached per (fetch ids, fed ids); values never
    //    change producer, so a cached plan stays valid while the scope grows.
    class Executor {
    public:
        explicit Executor(Scope& scope, LogOptions log = {}) : scope_(&scope), log_(log) {}

        std::vector<torch::Tensor> execute(const std::vector<SymbolicValue>& fetches,
                                           const FeedDict& feed,
                                           bool training = false)
        {
            trace_ = {};
            const auto& cached = this->cached_plan(fetches, feed);
            const auto& plan = cached.order;
            Log::debug(log_, "Executing " + std::to_string(plan.size()) + " node(s) for "
                             + std::to_string(fetches.size()) + " fetch(es).");

            std::unordered_set<ValueId> fetched;
            for (const auto& fetch : fetches) {
                fetched.insert(fetch.id);
            }

            auto recipients = cached.recipients;

            FeedDict working(feed);
            trace_.peak_live = working.size();
            const auto releasable = [&](ValueId value) {
                return !training && fetched.count(value) == 0 && !feed.has_id(value);
            };
            const auto release = [&](ValueId value) {
                if (working.release(value)) {
                    trace_.released.push_back(value);
                    Log::debug(log_, "Released '" + scope_->value(value).name + "'.");
                }
            };

            for (const auto id : plan) {
                const auto& node = scope_->node(id);
                auto& layer = scope_->layer(node.layer);

                std::vector<torch::Tensor> inputs;
                inputs.reserve(node.inputs.size());
                for (const auto input : node.inputs) {
                    inputs.push_back(working.get(input));
                }
                const bool node_training = node.arguments.get<bool>("training", training);

                std::vector<torch::Tensor> outputs;
                try {
                    outputs = layer.forward(inputs, node_training, node.arguments);
                } catch (const std::exception& error) {
                    std::throw_with_nested(ExecutionError(layer.name(), id, "Layer '" + layer.name() + "' failed at node "
                                                                            + std::to_string(id) + ": " + error.what()));
                }
                trace_.evaluated.push_back(id);

                if (outputs.size() != node.outputs.size()) {
                    std::ostringstream message;
                    message << "Layer '" << layer.name() << "' returned " << outputs.size() << " tensor(s) at node " << id
                            << ", expected " << node.outputs.size() << '.';
                    throw ExecutionError(layer.name(), id, message.str());
                }
                for (std::size_t slot = 0; slot < outputs.size(); ++slot) {
                    const auto& value = scope_->value(node.outputs[slot]);
                    if (!outputs[slot].defined()) {
                        throw ExecutionError(layer.name(), id, "Layer '" + layer.name() + "' returned an undefined tensor for '"
                                                               + value.name + "'.");
                    }
                    if (working.has_id(value.id)) {
                        continue;
                    }
                    try {
                        working.add(value, std::move(outputs[slot]));
                    } catch (const FeedError& error) {
                        std::throw_with_nested(ExecutionError(layer.name(), id, "Layer '" + layer.name()
                                                                                + "' produced an invalid value for '"
                                                                                + value.name + "': " + error.what()));
                    }
                }
                trace_.peak_live = std::max(trace_.peak_live, working.size());

                for (const auto input : distinct(node.inputs)) {
                    auto& count = recipients[input];
                    if (count > 0 && --count == 0 && releasable(input)) {
                        release(input);
                    }
                }
                // Outputs nobody in the plan reads.
                for (const auto output : node.outputs) {
                    if (recipients[output] == 0 && releasable(output)) {
                        release(output);
                    }
                }
            }

            std::vector<torch::Tensor> results;
            results.reserve(fetches.size());
            for (const auto& fetch : fetches) {
                results.push_back(working.get(fetch));
            }
            return results;
        }

        [[nodiscard]] const ExecutionTrace& last_trace() const noexcept { return trace_; }
        [[nodiscard]] Scope& scope() const noexcept { return *scope_; }
        [[nodiscard]] std::size_t cached_plan_count() const noexcept { return plans_.size(); }
        void clear_plan_cache() noexcept { plans_.clear(); }

    private:
        enum class VisitState {
            Unvisited,
            Active,
            Visited
        };

        struct Frame {
            NodeId node;
            std::size_t next_input;
        };

        struct PlanKey {
            std::vector<ValueId> fetches;
            std::vector<ValueId> feeds;     // sorted

            bool operator<(const PlanKey& other) const
            {
                return std::tie(fetches, feeds) < std::tie(other.fetches, other.feeds);
            }
        };

        struct Plan {
            std::vector<NodeId> order;
            std::unordered_map<ValueId, std::size_t> recipients;    // distinct consuming nodes in `order`
        };

        const Plan& cached_plan(const std::vector<SymbolicValue>& fetches, const FeedDict& feed)
        {
            PlanKey key{};
            key.fetches.reserve(fetches.size());
            for (const auto& fetch : fetches) {
                key.fetches.push_back(fetch.id);
            }
            key.feeds = feed.ids();
            std::sort(key.feeds.begin(), key.feeds.end());

            if (const auto it = plans_.find(key); it != plans_.end()) {
                trace_.plan_reused = true;
                return it->second;
            }

            Plan built{};
            built.order = plan(fetches, feed);
            for (const auto id : built.order) {
                for (const auto input : distinct(scope_->node(id).inputs)) {
                    ++built.recipients[input];
                }
            }
            return plans_.emplace(std::move(key), std::move(built)).first->second;
        }

        /// Nodes to run, producers before consumers. Missing graph inputs are reported
        /// here, before any layer runs.
        std::vector<NodeId> plan(const std::vector<SymbolicValue>& fetches, const FeedDict& feed) const
        {
            std::vector<NodeId> order;
            std::unordered_map<NodeId, VisitState> state;
            std::vector<Frame> stack;

            const auto require = [&](ValueId id) -> bool {
                if (feed.has_id(id)) {
                    return false;
                }
                const auto& value = scope_->value(id);
                if (!value.producer) {
                    throw MissingFeedError(value.name, "Missing a feed value for graph input '" + value.name + "'.");
                }
                return true;
            };

            for (const auto& fetch : fetches) {
                if (!require(fetch.id)) {
                    continue;
                }
                const auto root = *scope_->value(fetch.id).producer;
                if (state[root] != VisitState::Unvisited) {
                    continue;
                }
                state[root] = VisitState::Active;
                stack.push_back({root, 0});

                while (!stack.empty()) {
                    auto& frame = stack.back();
                    const auto& node = scope_->node(frame.node);
                    if (frame.next_input == node.inputs.size()) {
                        state[frame.node] = VisitState::Visited;
                        order.push_back(frame.node);
                        stack.pop_back();
                        continue;
                    }
                    const auto input = node.inputs[frame.next_input++];
                    if (!require(input)) {
                        continue;
                    }
                    const auto producer = *scope_->value(input).producer;
                    switch (state[producer]) {
                        case VisitState::Active:
                            throw CycleDetectedError("Cycle detected through layer '"
                                                     + scope_->layer(scope_->node(producer).layer).name() + "'.");
                        case VisitState::Visited:
                            break;
                        case VisitState::Unvisited:
                            state[producer] = VisitState::Active;
                            stack.push_back({producer, 0});
                            break;
                    }
                }
            }
            return order;
        }

        static std::vector<ValueId> distinct(const std::vector<ValueId>& ids)
        {
            std::vector<ValueId> result;
            result.reserve(ids.size());
            for (const auto id : ids) {
                if (std::find(result.begin(), result.end(), id) == result.end()) {
                    result.push_back(id);
                }
            }
            return result;
        }

        Scope* scope_;
        LogOptions log_{};
        ExecutionTrace trace_{};
        std::map<PlanKey, Plan> plans_{};
    };
}

#endif // STRATA_GRAPH_EXECUTOR_HPP
