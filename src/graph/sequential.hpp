#ifndef STRATA_GRAPH_SEQUENTIAL_HPP
#define STRATA_GRAPH_SEQUENTIAL_HPP

#include <initializer_list>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "../common/error.hpp"
#include "../common/logging.hpp"
#include "../layer/base.hpp"
#include "graph.hpp"
#include "scope.hpp"
#include "symbolic.hpp"

namespace Strata {
    // Linear stack: each added layer consumes the previous output.
    class Sequential {
    public:
        Sequential(Scope& scope, Shape input_shape, DType dtype = DType::Float32, std::string name = "sequential",
                   LogOptions log = {})
            : scope_(&scope), name_(std::move(name)), log_(log)
        {
            input_ = scope_->input(std::move(input_shape), dtype, name_ + "_input");
            output_ = input_;
        }

        Sequential(Scope& scope, Shape input_shape, std::initializer_list<std::shared_ptr<Layer::Base>> layers,
                   DType dtype = DType::Float32, std::string name = "sequential")
            : Sequential(scope, std::move(input_shape), dtype, std::move(name))
        {
            for (const auto& layer : layers) {
                add(layer);
            }
        }

        Sequential& add(const std::shared_ptr<Layer::Base>& layer)
        {
            if (!layer) {
                throw ConfigurationError("Sequential '" + name_ + "' cannot add a null layer.");
            }
            if (const auto handle = scope_->handle_of(*layer); handle && scope_->invocation_count(*handle) > 0) {
                throw ConfigurationError("Layer '" + layer->name() + "' is already connected; Sequential '" + name_
                                         + "' only accepts fresh layers.");
            }
            scope_->add(layer);
            const std::vector<Shape> shapes{output_.shape};
            layer->ensure_built(shapes);
            if (layer->compute_output_shape(shapes).size() != 1) {
                throw ConfigurationError("Sequential '" + name_ + "' only accepts single-output layers; '"
                                         + layer->class_name() + "' has several outputs.");
            }
            output_ = scope_->call(layer, output_);
            layers_.push_back(layer);
            return *this;
        }

        [[nodiscard]] const SymbolicValue& input() const noexcept { return input_; }
        [[nodiscard]] const SymbolicValue& output() const noexcept { return output_; }
        [[nodiscard]] const std::vector<std::shared_ptr<Layer::Base>>& layers() const noexcept { return layers_; }
        [[nodiscard]] std::size_t size() const noexcept { return layers_.size(); }

        [[nodiscard]] Graph graph() const
        {
            if (layers_.empty()) {
                throw GraphConstructionError("Sequential '" + name_ + "' has no layers.");
            }
            GraphOptions options{};
            options.name = name_;
            options.log = log_;
            return Graph(*scope_, {input_}, {output_}, std::move(options));
        }

    private:
        Scope* scope_;
        std::string name_{};
        LogOptions log_{};
        SymbolicValue input_{};
        SymbolicValue output_{};
        std::vector<std::shared_ptr<Layer::Base>> layers_{};
    };
}

#endif // STRATA_GRAPH_SEQUENTIAL_HPP
