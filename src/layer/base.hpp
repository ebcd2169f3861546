#ifndef STRATA_LAYER_BASE_HPP
#define STRATA_LAYER_BASE_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../common/config.hpp"
#include "../common/dtype.hpp"
#include "../common/error.hpp"
#include "../common/shape.hpp"

namespace Strata {
    class Scope;
}

namespace Strata::Layer {
    struct Options {
        std::string name{};                 // empty: the owning Scope assigns "<class>_<k>"
        std::optional<DType> dtype{};       // empty: outputs follow the first input
        bool trainable{true};
    };

    struct WeightDescriptor {
        std::string name{};                 // "<layer>/<parameter>"
        Shape shape{};
        DType dtype{DType::Float32};
    };

    // Shared by every Node invoking it. Parameters are held by a plain torch::nn::Module
    // so they live in the same registry torch optimisers walk.
    class Base {
    public:
        explicit Base(Options options)
            : options_(std::move(options)), module_(std::make_shared<torch::nn::Module>("Layer")) {}

        virtual ~Base() = default;

        Base(const Base&) = delete;
        Base& operator=(const Base&) = delete;

        [[nodiscard]] virtual std::string class_name() const = 0;

        [[nodiscard]] const std::string& name() const noexcept { return options_.name; }
        [[nodiscard]] bool built() const noexcept { return built_; }
        [[nodiscard]] const std::optional<DType>& dtype() const noexcept { return options_.dtype; }
        [[nodiscard]] bool trainable() const noexcept { return options_.trainable; }
        [[nodiscard]] const std::vector<Shape>& build_shapes() const noexcept { return build_shapes_; }

        // Lambda layers carry code and cannot be written into a graph config.
        [[nodiscard]] virtual bool serializable() const noexcept { return true; }

        /// First call builds the parameters; later calls only verify the shapes agree
        /// with the first ones (input count, rank and every defined dimension).
        void ensure_built(const std::vector<Shape>& input_shapes)
        {
            if (!built_) {
                build(input_shapes);
                build_shapes_ = input_shapes;
                built_ = true;
                return;
            }
            if (input_shapes.size() != build_shapes_.size()) {
                std::ostringstream message;
                message << "Layer '" << name() << "' was built for " << build_shapes_.size()
                        << " input(s) but was called with " << input_shapes.size() << '.';
                throw ConfigurationError(message.str());
            }
            for (std::size_t i = 0; i < input_shapes.size(); ++i) {
                if (!are_compatible(build_shapes_[i], input_shapes[i])) {
                    std::ostringstream message;
                    message << "Layer '" << name() << "' was built for input " << i << " of shape "
                            << to_string(build_shapes_[i]) << " but was called with shape "
                            << to_string(input_shapes[i]) << '.';
                    throw ConfigurationError(message.str());
                }
            }
        }

        [[nodiscard]] virtual std::vector<Shape> compute_output_shape(const std::vector<Shape>& input_shapes) const = 0;

        [[nodiscard]] virtual std::vector<DType> compute_output_dtype(const std::vector<DType>& input_dtypes,
                                                                      std::size_t output_count) const
        {
            DType dtype = DType::Float32;
            if (options_.dtype) {
                dtype = *options_.dtype;
            } else if (!input_dtypes.empty()) {
                dtype = input_dtypes.front();
            }
            return std::vector<DType>(output_count, dtype);
        }

        virtual std::vector<torch::Tensor> forward(const std::vector<torch::Tensor>& inputs,
                                                   bool training,
                                                   const CallArguments& arguments) = 0;

        [[nodiscard]] virtual PropertyTree config() const
        {
            PropertyTree tree;
            tree.put("name", options_.name);
            tree.put("trainable", options_.trainable);
            if (options_.dtype) {
                tree.put("dtype", to_string(*options_.dtype));
            }
            return tree;
        }

        [[nodiscard]] virtual std::vector<WeightDescriptor> weights() const
        {
            std::vector<WeightDescriptor> descriptors;
            for (const auto& parameter : module_->named_parameters(/*recurse=*/false)) {
                WeightDescriptor descriptor{};
                descriptor.name = name() + "/" + parameter.key();
                descriptor.shape = shape_of(parameter.value());
                descriptor.dtype = dtype_of(parameter.value().scalar_type()).value_or(DType::Float32);
                descriptors.push_back(std::move(descriptor));
            }
            return descriptors;
        }

        [[nodiscard]] virtual std::vector<torch::Tensor> weight_values() const
        {
            std::vector<torch::Tensor> values;
            for (const auto& parameter : module_->named_parameters(/*recurse=*/false)) {
                values.push_back(parameter.value());
            }
            return values;
        }

        virtual void set_weights(const std::vector<torch::Tensor>& values)
        {
            auto parameters = weight_values();
            check_weights(values);
            torch::NoGradGuard no_grad;
            for (std::size_t i = 0; i < parameters.size(); ++i) {
                parameters[i].copy_(values[i]);
            }
        }

        [[nodiscard]] std::int64_t parameter_count() const
        {
            std::int64_t total = 0;
            for (const auto& value : weight_values()) {
                total += value.numel();
            }
            return total;
        }

    protected:
        virtual void build(const std::vector<Shape>& input_shapes) { (void)input_shapes; }

        torch::Tensor& register_weight(const std::string& parameter, const std::vector<std::int64_t>& sizes)
        {
            const auto dtype = to_scalar_type(options_.dtype.value_or(DType::Float32));
            return module_->register_parameter(parameter, torch::empty(sizes, torch::TensorOptions().dtype(dtype)),
                                               options_.trainable);
        }

        [[nodiscard]] DType weight_dtype() const noexcept { return options_.dtype.value_or(DType::Float32); }

        void check_weights(const std::vector<torch::Tensor>& values) const
        {
            const auto expected = weights();
            if (values.size() != expected.size()) {
                std::ostringstream message;
                message << "Layer '" << name() << "' expects " << expected.size()
                        << " weight tensor(s) but received " << values.size() << '.';
                throw ConfigurationError(message.str());
            }
            for (std::size_t i = 0; i < values.size(); ++i) {
                if (!values[i].defined() || shape_of(values[i]) != expected[i].shape) {
                    std::ostringstream message;
                    message << "Weight '" << expected[i].name << "' expects shape " << to_string(expected[i].shape)
                            << " but received " << (values[i].defined() ? to_string(shape_of(values[i])) : "an undefined tensor")
                            << '.';
                    throw ConfigurationError(message.str());
                }
            }
        }

        static void require_single_input(const std::vector<Shape>& input_shapes, const std::string& layer)
        {
            if (input_shapes.size() != 1) {
                std::ostringstream message;
                message << "Layer '" << layer << "' expects exactly one input, received " << input_shapes.size() << '.';
                throw ConfigurationError(message.str());
            }
        }

    private:
        friend class ::Strata::Scope;

        void assign_name(std::string name) { options_.name = std::move(name); }

        Options options_{};
        bool built_{false};
        std::vector<Shape> build_shapes_{};
        std::shared_ptr<torch::nn::Module> module_{};
    };

    namespace Details {
        inline Options read_options(const PropertyTree& tree, const std::string& context)
        {
            Options options{};
            options.name = tree.get<std::string>("name", "");
            options.trainable = tree.get<bool>("trainable", true);
            if (tree.get_optional<std::string>("dtype")) {
                options.dtype = Config::read_dtype(tree, "dtype", context);
            }
            return options;
        }

        inline void require_input_count(const std::vector<torch::Tensor>& inputs, std::size_t count, const std::string& layer)
        {
            if (inputs.size() != count) {
                std::ostringstream message;
                message << "Layer '" << layer << "' expects " << count << " input tensor(s), received " << inputs.size() << '.';
                throw std::invalid_argument(message.str());
            }
        }
    }
}

#endif // STRATA_LAYER_BASE_HPP
