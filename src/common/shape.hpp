#ifndef STRATA_COMMON_SHAPE_HPP
#define STRATA_COMMON_SHAPE_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <torch/torch.h>

namespace Strata {
    // An empty dimension is undetermined (typically the batch size).
    using Dimension = std::optional<std::int64_t>;
    using Shape = std::vector<Dimension>;

    [[nodiscard]] inline std::string to_string(const Shape& shape)
    {
        std::ostringstream stream;
        stream << '(';
        for (std::size_t i = 0; i < shape.size(); ++i) {
            if (i > 0) {
                stream << ", ";
            }
            if (shape[i].has_value()) {
                stream << *shape[i];
            } else {
                stream << '?';
            }
        }
        stream << ')';
        return stream.str();
    }

    [[nodiscard]] inline Shape shape_of(const torch::Tensor& tensor)
    {
        Shape shape;
        shape.reserve(static_cast<std::size_t>(tensor.dim()));
        for (const auto size : tensor.sizes()) {
            shape.emplace_back(size);
        }
        return shape;
    }

    [[nodiscard]] inline bool is_fully_defined(const Shape& shape, std::size_t from = 0)
    {
        for (std::size_t i = from; i < shape.size(); ++i) {
            if (!shape[i].has_value()) {
                return false;
            }
        }
        return true;
    }

    /// Same rank and no pair of defined dimensions that disagree.
    [[nodiscard]] inline bool are_compatible(const Shape& lhs, const Shape& rhs)
    {
        if (lhs.size() != rhs.size()) {
            return false;
        }
        for (std::size_t i = 0; i < lhs.size(); ++i) {
            if (lhs[i].has_value() && rhs[i].has_value() && *lhs[i] != *rhs[i]) {
                return false;
            }
        }
        return true;
    }

    [[nodiscard]] inline std::optional<std::size_t> normalize_axis(std::int64_t axis, std::size_t rank) noexcept
    {
        const auto signed_rank = static_cast<std::int64_t>(rank);
        if (axis < 0) {
            axis += signed_rank;
        }
        if (axis < 0 || axis >= signed_rank) {
            return std::nullopt;
        }
        return static_cast<std::size_t>(axis);
    }
}

#endif // STRATA_COMMON_SHAPE_HPP
