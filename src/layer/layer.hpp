#ifndef STRATA_LAYER_HPP
#define STRATA_LAYER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <memory>
#include <utility>

#include "base.hpp"
#include "details/activation.hpp"
#include "details/conv.hpp"
#include "details/dense.hpp"
#include "details/dropout.hpp"
#include "details/flatten.hpp"
#include "details/lambda.hpp"
#include "details/merge.hpp"
#include "details/nested.hpp"
#include "details/split.hpp"

#include "registry.hpp"

namespace Strata::Layer {
    using DenseOptions = Details::DenseOptions;
    using DenseDescriptor = Details::DenseDescriptor;

    using Conv2dOptions = Details::Conv2dOptions;
    using Conv2dDescriptor = Details::Conv2dDescriptor;

    using DropoutOptions = Details::DropoutOptions;

    using MergeMode = Details::MergeMode;
    using ConcatenateOptions = Details::ConcatenateOptions;
    using SplitOptions = Details::SplitOptions;

    using LambdaForward = Details::LambdaForward;
    using LambdaShape = Details::LambdaShape;

    [[nodiscard]] inline auto Dense(const DenseOptions& options,
                                    ::Strata::Activation::Descriptor activation = ::Strata::Activation::Identity,
                                    ::Strata::Initialization::Descriptor initialization = ::Strata::Initialization::Default,
                                    Options layer = {}) -> std::shared_ptr<Details::DenseImpl> {
        return std::make_shared<Details::DenseImpl>(DenseDescriptor{options, activation, initialization, std::move(layer)});
    }

    [[nodiscard]] inline auto Conv2d(const Conv2dOptions& options,
                                     ::Strata::Activation::Descriptor activation = ::Strata::Activation::Identity,
                                     ::Strata::Initialization::Descriptor initialization = ::Strata::Initialization::Default,
                                     Options layer = {}) -> std::shared_ptr<Details::Conv2dImpl> {
        return std::make_shared<Details::Conv2dImpl>(Conv2dDescriptor{options, activation, initialization, std::move(layer)});
    }

    [[nodiscard]] inline auto Activation(::Strata::Activation::Descriptor activation, Options layer = {})
        -> std::shared_ptr<Details::ActivationImpl> {
        return std::make_shared<Details::ActivationImpl>(Details::ActivationDescriptor{activation, std::move(layer)});
    }

    [[nodiscard]] inline auto Dropout(const DropoutOptions& options = {}, Options layer = {})
        -> std::shared_ptr<Details::DropoutImpl> {
        return std::make_shared<Details::DropoutImpl>(Details::DropoutDescriptor{options, std::move(layer)});
    }

    [[nodiscard]] inline auto Flatten(Options layer = {}) -> std::shared_ptr<Details::FlattenImpl> {
        return std::make_shared<Details::FlattenImpl>(Details::FlattenDescriptor{std::move(layer)});
    }

    [[nodiscard]] inline auto Merge(MergeMode mode, Options layer = {}) -> std::shared_ptr<Details::MergeImpl> {
        return std::make_shared<Details::MergeImpl>(Details::MergeDescriptor{mode, std::move(layer)});
    }

    [[nodiscard]] inline auto Add(Options layer = {}) -> std::shared_ptr<Details::MergeImpl> {
        return Merge(MergeMode::Add, std::move(layer));
    }

    [[nodiscard]] inline auto Concatenate(const ConcatenateOptions& options = {}, Options layer = {})
        -> std::shared_ptr<Details::ConcatenateImpl> {
        return std::make_shared<Details::ConcatenateImpl>(Details::ConcatenateDescriptor{options, std::move(layer)});
    }

    [[nodiscard]] inline auto Split(const SplitOptions& options, Options layer = {}) -> std::shared_ptr<Details::SplitImpl> {
        return std::make_shared<Details::SplitImpl>(Details::SplitDescriptor{options, std::move(layer)});
    }

    [[nodiscard]] inline auto Lambda(LambdaForward forward, LambdaShape output_shape = {}, Options layer = {})
        -> std::shared_ptr<Details::LambdaImpl> {
        return std::make_shared<Details::LambdaImpl>(
            Details::LambdaDescriptor{std::move(forward), std::move(output_shape), std::move(layer)});
    }

    [[nodiscard]] inline auto Nested(std::shared_ptr<::Strata::Graph> graph, Options layer = {})
        -> std::shared_ptr<Details::NestedImpl> {
        return std::make_shared<Details::NestedImpl>(Details::NestedDescriptor{std::move(graph), nullptr, std::move(layer)});
    }

    inline void register_builtin_layers(Registry& registry)
    {
        const auto simple = [](auto factory) {
            return [factory](const PropertyTree& tree, const Registry&) { return factory(tree); };
        };
        registry.add("Dense", simple(Details::dense_from_config))
                .add("Conv2d", simple(Details::conv2d_from_config))
                .add("Activation", simple(Details::activation_from_config))
                .add("Dropout", simple(Details::dropout_from_config))
                .add("Flatten", simple(Details::flatten_from_config))
                .add("Merge", simple(Details::merge_from_config))
                .add("Concatenate", simple(Details::concatenate_from_config))
                .add("Split", simple(Details::split_from_config))
                .add("Nested", Details::nested_from_config);
    }

    [[nodiscard]] inline const Registry& builtin_registry()
    {
        static const Registry registry = [] {
            Registry built;
            register_builtin_layers(built);
            return built;
        }();
        return registry;
    }
}

#endif // STRATA_LAYER_HPP
