#ifndef STRATA_GRAPH_SYMBOLIC_HPP
#define STRATA_GRAPH_SYMBOLIC_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../common/config.hpp"
#include "../common/dtype.hpp"
#include "../common/shape.hpp"

namespace Strata {
    using ValueId = std::uint64_t;
    using NodeId = std::size_t;
    using LayerHandle = std::size_t;

    namespace Details {
        // Value ids are never reused, even across scopes.
        inline ValueId next_value_id() noexcept
        {
            static std::atomic<ValueId> counter{0};
            return ++counter;
        }
    }

    struct SymbolicValue {
        ValueId id{0};
        std::string name{};
        Shape shape{};
        DType dtype{DType::Float32};
        std::optional<NodeId> producer{};       // empty for graph inputs
        std::size_t output_index{0};

        [[nodiscard]] bool is_input() const noexcept { return !producer.has_value(); }
        [[nodiscard]] std::size_t rank() const noexcept { return shape.size(); }
    };

    // One invocation of a layer.
    struct Node {
        NodeId id{0};
        LayerHandle layer{0};
        std::vector<ValueId> inputs{};
        std::vector<ValueId> outputs{};
        CallArguments arguments{};
        std::size_t invocation{0};
    };
}

#endif // STRATA_GRAPH_SYMBOLIC_HPP
