#ifndef STRATA_COMMON_DTYPE_HPP
#define STRATA_COMMON_DTYPE_HPP

#include <algorithm>
#include <cctype>
#include <optional>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

namespace Strata {
    enum class DType {
        Float32,
        Float64,
        Int32,
        Int64,
        Bool,
    };

    [[nodiscard]] inline std::string to_string(DType dtype)
    {
        switch (dtype) {
            case DType::Float32: return "float32";
            case DType::Float64: return "float64";
            case DType::Int32: return "int32";
            case DType::Int64: return "int64";
            case DType::Bool: return "bool";
        }
        throw std::invalid_argument("Unsupported dtype during conversion to string.");
    }

    [[nodiscard]] inline DType dtype_from_string(std::string value)
    {
        std::transform(value.begin(), value.end(), value.begin(), [](unsigned char character) {
            return static_cast<char>(std::tolower(character));
        });
        if (value == "float32" || value == "float") return DType::Float32;
        if (value == "float64" || value == "double") return DType::Float64;
        if (value == "int32" || value == "int") return DType::Int32;
        if (value == "int64" || value == "long") return DType::Int64;
        if (value == "bool") return DType::Bool;
        throw std::invalid_argument("Unknown dtype '" + value + "'.");
    }

    [[nodiscard]] inline torch::ScalarType to_scalar_type(DType dtype)
    {
        switch (dtype) {
            case DType::Float32: return torch::kFloat32;
            case DType::Float64: return torch::kFloat64;
            case DType::Int32: return torch::kInt32;
            case DType::Int64: return torch::kInt64;
            case DType::Bool: return torch::kBool;
        }
        throw std::invalid_argument("Unsupported dtype during conversion to a torch scalar type.");
    }

    // Scalar types outside the modelled set map to nullopt.
    [[nodiscard]] inline std::optional<DType> dtype_of(torch::ScalarType type) noexcept
    {
        switch (type) {
            case torch::kFloat32: return DType::Float32;
            case torch::kFloat64: return DType::Float64;
            case torch::kInt32: return DType::Int32;
            case torch::kInt64: return DType::Int64;
            case torch::kBool: return DType::Bool;
            default: return std::nullopt;
        }
    }

    [[nodiscard]] constexpr bool is_floating(DType dtype) noexcept
    {
        return dtype == DType::Float32 || dtype == DType::Float64;
    }

    [[nodiscard]] constexpr bool is_integral(DType dtype) noexcept
    {
        return dtype == DType::Int32 || dtype == DType::Int64;
    }

    /// True when every value of `from` is representable in `to`, up to the
    /// rounding of large integers into floating point.
    [[nodiscard]] constexpr bool can_safely_cast(DType from, DType to) noexcept
    {
        if (from == to || from == DType::Bool) {
            return true;
        }
        if (is_integral(from)) {
            return is_floating(to) || (from == DType::Int32 && to == DType::Int64);
        }
        return from == DType::Float32 && to == DType::Float64;
    }
}

#endif // STRATA_COMMON_DTYPE_HPP
