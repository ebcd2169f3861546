#ifndef STRATA_LAYER_MERGE_HPP
#define STRATA_LAYER_MERGE_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../base.hpp"

namespace Strata::Layer::Details {
    enum class MergeMode {
        Add,
        Multiply,
        Average,
        Maximum,
        Minimum
    };

    inline std::string merge_mode_name(MergeMode mode)
    {
        switch (mode) {
            case MergeMode::Add: return "add";
            case MergeMode::Multiply: return "multiply";
            case MergeMode::Average: return "average";
            case MergeMode::Maximum: return "maximum";
            case MergeMode::Minimum: return "minimum";
        }
        throw ConfigurationError("Unsupported merge mode during serialisation.");
    }

    inline MergeMode merge_mode_from_string(const std::string& value)
    {
        const auto lowered = Config::to_lower(value);
        if (lowered == "add") return MergeMode::Add;
        if (lowered == "multiply") return MergeMode::Multiply;
        if (lowered == "average") return MergeMode::Average;
        if (lowered == "maximum") return MergeMode::Maximum;
        if (lowered == "minimum") return MergeMode::Minimum;
        throw ConfigurationError("Unknown merge mode '" + value + "'.");
    }

    // Result dtype of combining every input through torch type promotion.
    inline DType promoted_dtype(const std::vector<DType>& input_dtypes)
    {
        if (input_dtypes.empty()) {
            return DType::Float32;
        }
        auto scalar = to_scalar_type(input_dtypes.front());
        for (std::size_t i = 1; i < input_dtypes.size(); ++i) {
            scalar = torch::promote_types(scalar, to_scalar_type(input_dtypes[i]));
        }
        return dtype_of(scalar).value_or(DType::Float32);
    }

    inline void require_several_inputs(std::size_t count, const std::string& layer)
    {
        if (count < 2) {
            std::ostringstream message;
            message << "Layer '" << layer << "' expects at least 2 inputs, received " << count << '.';
            throw ConfigurationError(message.str());
        }
    }

    struct MergeDescriptor {
        MergeMode mode{MergeMode::Add};
        Options layer{};
    };

    // Element-wise reduction of equally ranked inputs; size-1 dimensions broadcast.
    class MergeImpl : public Base {
    public:
        explicit MergeImpl(MergeDescriptor descriptor)
            : Base(descriptor.layer), mode_(descriptor.mode) {}

        [[nodiscard]] std::string class_name() const override { return "Merge"; }

        [[nodiscard]] MergeMode mode() const noexcept { return mode_; }

        [[nodiscard]] std::vector<Shape> compute_output_shape(const std::vector<Shape>& input_shapes) const override
        {
            require_several_inputs(input_shapes.size(), name());
            const auto rank = input_shapes.front().size();
            for (const auto& shape : input_shapes) {
                if (shape.size() != rank) {
                    std::ostringstream message;
                    message << "Layer '" << name() << "' expects inputs of equal rank, received "
                            << to_string(input_shapes.front()) << " and " << to_string(shape) << '.';
                    throw ConfigurationError(message.str());
                }
            }

            Shape output(rank);
            for (std::size_t axis = 0; axis < rank; ++axis) {
                std::optional<std::int64_t> extent{};
                bool undetermined = false;
                bool saw_one = false;
                for (const auto& shape : input_shapes) {
                    const auto& dimension = shape[axis];
                    if (!dimension.has_value()) {
                        undetermined = true;
                    } else if (*dimension == 1) {
                        saw_one = true;
                    } else if (!extent.has_value()) {
                        extent = dimension;
                    } else if (*extent != *dimension) {
                        std::ostringstream message;
                        message << "Layer '" << name() << "' cannot broadcast dimension " << axis << " of shapes";
                        for (const auto& each : input_shapes) {
                            message << ' ' << to_string(each);
                        }
                        message << '.';
                        throw ConfigurationError(message.str());
                    }
                }
                if (extent.has_value()) {
                    output[axis] = extent;
                } else if (!undetermined && saw_one) {
                    output[axis] = 1;
                }
            }
            return {output};
        }

        [[nodiscard]] std::vector<DType> compute_output_dtype(const std::vector<DType>& input_dtypes,
                                                              std::size_t output_count) const override
        {
            if (dtype()) {
                return Base::compute_output_dtype(input_dtypes, output_count);
            }
            auto promoted = promoted_dtype(input_dtypes);
            // Averaging divides, so integral and boolean inputs average in float32.
            if (mode_ == MergeMode::Average && !is_floating(promoted)) {
                promoted = DType::Float32;
            }
            return std::vector<DType>(output_count, promoted);
        }

        std::vector<torch::Tensor> forward(const std::vector<torch::Tensor>& inputs, bool, const CallArguments&) override
        {
            require_several_inputs(inputs.size(), name());
            auto output = inputs.front();
            if (mode_ == MergeMode::Average && !output.is_floating_point()) {
                output = output.to(torch::kFloat32);
            }
            for (std::size_t i = 1; i < inputs.size(); ++i) {
                switch (mode_) {
                    case MergeMode::Add:
                    case MergeMode::Average:
                        output = output + inputs[i];
                        break;
                    case MergeMode::Multiply:
                        output = output * inputs[i];
                        break;
                    case MergeMode::Maximum:
                        output = torch::maximum(output, inputs[i]);
                        break;
                    case MergeMode::Minimum:
                        output = torch::minimum(output, inputs[i]);
                        break;
                }
            }
            if (mode_ == MergeMode::Average) {
                output = output / static_cast<double>(inputs.size());
            }
            if (dtype()) {
                output = output.to(to_scalar_type(*dtype()));
            }
            return {output};
        }

        [[nodiscard]] PropertyTree config() const override
        {
            auto tree = Base::config();
            tree.put("mode", merge_mode_name(mode_));
            return tree;
        }

    private:
        MergeMode mode_{MergeMode::Add};
    };

    struct ConcatenateOptions {
        std::int64_t axis{-1};
    };

    struct ConcatenateDescriptor {
        ConcatenateOptions options{};
        Options layer{};
    };

    class ConcatenateImpl : public Base {
    public:
        explicit ConcatenateImpl(ConcatenateDescriptor descriptor)
            : Base(descriptor.layer), options_(descriptor.options) {}

        [[nodiscard]] std::string class_name() const override { return "Concatenate"; }

        [[nodiscard]] std::vector<Shape> compute_output_shape(const std::vector<Shape>& input_shapes) const override
        {
            require_several_inputs(input_shapes.size(), name());
            const auto rank = input_shapes.front().size();
            const auto axis = normalize_axis(options_.axis, rank);
            if (!axis) {
                std::ostringstream message;
                message << "Layer '" << name() << "' axis " << options_.axis << " is out of range for rank " << rank << '.';
                throw ConfigurationError(message.str());
            }

            Shape output = input_shapes.front();
            for (std::size_t i = 1; i < input_shapes.size(); ++i) {
                const auto& shape = input_shapes[i];
                if (shape.size() != rank) {
                    std::ostringstream message;
                    message << "Layer '" << name() << "' expects inputs of equal rank, received "
                            << to_string(input_shapes.front()) << " and " << to_string(shape) << '.';
                    throw ConfigurationError(message.str());
                }
                for (std::size_t dim = 0; dim < rank; ++dim) {
                    if (dim == *axis) {
                        if (output[dim].has_value() && shape[dim].has_value()) {
                            output[dim] = *output[dim] + *shape[dim];
                        } else {
                            output[dim] = std::nullopt;
                        }
                        continue;
                    }
                    if (output[dim].has_value() && shape[dim].has_value() && *output[dim] != *shape[dim]) {
                        std::ostringstream message;
                        message << "Layer '" << name() << "' requires matching shapes except on the concatenation axis, received "
                                << to_string(input_shapes.front()) << " and " << to_string(shape) << '.';
                        throw ConfigurationError(message.str());
                    }
                    if (!output[dim].has_value()) {
                        output[dim] = shape[dim];
                    }
                }
            }
            return {output};
        }

        [[nodiscard]] std::vector<DType> compute_output_dtype(const std::vector<DType>& input_dtypes,
                                                              std::size_t output_count) const override
        {
            if (dtype()) {
                return Base::compute_output_dtype(input_dtypes, output_count);
            }
            return std::vector<DType>(output_count, promoted_dtype(input_dtypes));
        }

        std::vector<torch::Tensor> forward(const std::vector<torch::Tensor>& inputs, bool, const CallArguments&) override
        {
            require_several_inputs(inputs.size(), name());
            auto output = torch::cat(inputs, options_.axis);
            if (dtype()) {
                output = output.to(to_scalar_type(*dtype()));
            }
            return {output};
        }

        [[nodiscard]] PropertyTree config() const override
        {
            auto tree = Base::config();
            tree.put("axis", options_.axis);
            return tree;
        }

    private:
        ConcatenateOptions options_{};
    };

    inline std::shared_ptr<Base> merge_from_config(const PropertyTree& tree)
    {
        MergeDescriptor descriptor{};
        descriptor.mode = merge_mode_from_string(Config::get_string(tree, "mode", "Merge config"));
        descriptor.layer = read_options(tree, "Merge config");
        return std::make_shared<MergeImpl>(std::move(descriptor));
    }

    inline std::shared_ptr<Base> concatenate_from_config(const PropertyTree& tree)
    {
        ConcatenateDescriptor descriptor{};
        descriptor.options.axis = tree.get<std::int64_t>("axis", -1);
        descriptor.layer = read_options(tree, "Concatenate config");
        return std::make_shared<ConcatenateImpl>(std::move(descriptor));
    }
}

#endif // STRATA_LAYER_MERGE_HPP
