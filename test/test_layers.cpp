#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <vector>

#include "test_helpers.hpp"

using namespace Strata;

namespace {
    // Runs one layer on concrete tensors through a throwaway scope.
    std::vector<torch::Tensor> run(const std::shared_ptr<Layer::Base>& layer,
                                   const std::vector<torch::Tensor>& values,
                                   bool training = false)
    {
        Scope scope;
        std::vector<SymbolicValue> inputs;
        FeedDict feed(Testing::silent());
        for (const auto& value : values) {
            Shape shape = shape_of(value);
            shape.front() = std::nullopt;
            inputs.push_back(scope.input(shape, *dtype_of(value.scalar_type())));
            feed.add(inputs.back(), value);
        }
        const auto outputs = scope.apply(layer, inputs);
        Executor executor(scope, Testing::silent());
        return executor.execute(outputs, feed, training);
    }
}

TEST(DenseLayerTest, ComputesAffineMapWithActivation) {
    auto dense = Layer::Dense({.units = 3}, Strata::Activation::ReLU, Strata::Initialization::Ones);
    const auto output = run(dense, {torch::tensor({{1.0f, 1.0f, 1.0f, 1.0f}, {-1.0f, -1.0f, -1.0f, -1.0f}})}).front();
    EXPECT_TRUE(torch::allclose(output, torch::tensor({{4.0f, 4.0f, 4.0f}, {0.0f, 0.0f, 0.0f}})));
    EXPECT_EQ(dense->parameter_count(), 4 * 3 + 3);
}

TEST(DenseLayerTest, RequiresADefinedFeatureDimension) {
    Scope scope;
    EXPECT_THROW(scope.call(Layer::Dense({.units = 2}), scope.input({4})), ConfigurationError);
    EXPECT_THROW(scope.call(Layer::Dense({.units = 2}), scope.input({2, std::nullopt})), ConfigurationError);
    EXPECT_THROW(static_cast<void>(Layer::Dense({.units = 0})), ConfigurationError);
}

TEST(DenseLayerTest, WithoutBiasHasOnlyAKernel) {
    Scope scope;
    auto dense = Layer::Dense({.units = 2, .bias = false});
    static_cast<void>(scope.call(dense, scope.input({std::nullopt, 5})));
    const auto weights = dense->weights();
    ASSERT_EQ(weights.size(), 1u);
    EXPECT_EQ(weights.front().name, "dense_1/kernel");
}

TEST(DenseLayerTest, FrozenLayersDoNotRequireGradients) {
    Scope scope;
    auto dense = Layer::Dense({.units = 2}, Strata::Activation::Identity, Strata::Initialization::Default,
                              {.trainable = false});
    static_cast<void>(scope.call(dense, scope.input({std::nullopt, 5})));
    for (const auto& value : dense->weight_values()) {
        EXPECT_FALSE(value.requires_grad());
    }
}

TEST(Conv2dLayerTest, OutputShapeFollowsStridePaddingAndDilation) {
    Scope scope;
    const auto x = scope.input({std::nullopt, 3, 8, 8});
    EXPECT_EQ(scope.call(Layer::Conv2d({.filters = 4}), x).shape, (Shape{std::nullopt, 4, 6, 6}));
    EXPECT_EQ(scope.call(Layer::Conv2d({.filters = 2, .stride = {2, 2}, .padding = {1, 1}}), x).shape,
              (Shape{std::nullopt, 2, 4, 4}));
    EXPECT_EQ(scope.call(Layer::Conv2d({.filters = 2, .dilation = {2, 2}}), x).shape, (Shape{std::nullopt, 2, 4, 4}));

    const auto open = scope.input({std::nullopt, 3, std::nullopt, 8});
    EXPECT_EQ(scope.call(Layer::Conv2d({.filters = 1}), open).shape, (Shape{std::nullopt, 1, std::nullopt, 6}));
}

TEST(Conv2dLayerTest, ForwardMatchesDeclaredShape) {
    auto conv = Layer::Conv2d({.filters = 5, .padding = {1, 1}});
    const auto output = run(conv, {torch::randn({2, 3, 7, 7})}).front();
    EXPECT_EQ(output.sizes().vec(), (std::vector<std::int64_t>{2, 5, 7, 7}));
    EXPECT_EQ(conv->weights().front().shape, (Shape{5, 3, 3, 3}));
}

TEST(Conv2dLayerTest, RejectsInputsWithoutChannels) {
    Scope scope;
    EXPECT_THROW(scope.call(Layer::Conv2d({.filters = 1}), scope.input({std::nullopt, 8, 8})), ConfigurationError);
    EXPECT_THROW(static_cast<void>(Layer::Conv2d({.filters = 1, .kernel_size = {3}})), ConfigurationError);
}

TEST(FlattenLayerTest, FoldsEverythingButTheBatch) {
    Scope scope;
    EXPECT_EQ(scope.call(Layer::Flatten(), scope.input({std::nullopt, 2, 3, 4})).shape, (Shape{std::nullopt, 24}));
    EXPECT_THROW(scope.call(Layer::Flatten(), scope.input({std::nullopt, std::nullopt, 3})), ConfigurationError);
    const auto output = run(Layer::Flatten(), {torch::ones({2, 2, 3})}).front();
    EXPECT_EQ(output.sizes().vec(), (std::vector<std::int64_t>{2, 6}));
}

TEST(MergeLayerTest, BroadcastsSizeOneDimensions) {
    Scope scope;
    const auto a = scope.input({std::nullopt, 1, 4});
    const auto b = scope.input({std::nullopt, 3, 4});
    EXPECT_EQ(scope.apply(Layer::Add(), {a, b}).front().shape, (Shape{std::nullopt, 3, 4}));

    const auto c = scope.input({std::nullopt, 2, 4});
    EXPECT_THROW(scope.apply(Layer::Add(), {b, c}), ConfigurationError);
    EXPECT_THROW(scope.apply(Layer::Add(), {a}), ConfigurationError);
}

TEST(MergeLayerTest, ModesReduceElementWise) {
    const auto a = torch::tensor({{1.0f, 5.0f}});
    const auto b = torch::tensor({{3.0f, 2.0f}});
    EXPECT_TRUE(torch::allclose(run(Layer::Merge(Layer::MergeMode::Add), {a, b}).front(), torch::tensor({{4.0f, 7.0f}})));
    EXPECT_TRUE(torch::allclose(run(Layer::Merge(Layer::MergeMode::Multiply), {a, b}).front(), torch::tensor({{3.0f, 10.0f}})));
    EXPECT_TRUE(torch::allclose(run(Layer::Merge(Layer::MergeMode::Average), {a, b}).front(), torch::tensor({{2.0f, 3.5f}})));
    EXPECT_TRUE(torch::allclose(run(Layer::Merge(Layer::MergeMode::Maximum), {a, b}).front(), torch::tensor({{3.0f, 5.0f}})));
    EXPECT_TRUE(torch::allclose(run(Layer::Merge(Layer::MergeMode::Minimum), {a, b}).front(), torch::tensor({{1.0f, 2.0f}})));
}

TEST(MergeLayerTest, MixedDtypesPromote) {
    Scope scope;
    const auto ints = scope.input({std::nullopt, 2}, DType::Int32);
    const auto floats = scope.input({std::nullopt, 2}, DType::Float32);
    EXPECT_EQ(scope.apply(Layer::Add(), {ints, floats}).front().dtype, DType::Float32);
    EXPECT_EQ(scope.apply(Layer::Concatenate(), {ints, ints}).front().dtype, DType::Int32);
}

TEST(ConcatenateLayerTest, SumsTheAxisAndChecksTheRest) {
    Scope scope;
    const auto a = scope.input({std::nullopt, 2});
    const auto b = scope.input({std::nullopt, 3});
    EXPECT_EQ(scope.apply(Layer::Concatenate(), {a, b}).front().shape, (Shape{std::nullopt, 5}));
    EXPECT_EQ(scope.apply(Layer::Concatenate({.axis = 0}), {a, a}).front().shape, (Shape{std::nullopt, 2}));
    EXPECT_THROW(scope.apply(Layer::Concatenate({.axis = 0}), {a, b}), ConfigurationError);
    EXPECT_THROW(scope.apply(Layer::Concatenate({.axis = 2}), {a, b}), ConfigurationError);

    const auto output = run(Layer::Concatenate(), {torch::ones({1, 2}), torch::zeros({1, 1})}).front();
    EXPECT_TRUE(torch::equal(output, torch::tensor({{1.0f, 1.0f, 0.0f}})));
}

TEST(SplitLayerTest, RequiresADivisibleDefinedAxis) {
    Scope scope;
    EXPECT_THROW(scope.apply(Layer::Split({.sections = 3}), {scope.input({std::nullopt, 4})}), ConfigurationError);
    EXPECT_THROW(scope.apply(Layer::Split({.sections = 2, .axis = 0}), {scope.input({std::nullopt, 4})}), ConfigurationError);
    EXPECT_EQ(scope.apply(Layer::Split({.sections = 3, .axis = 1}), {scope.input({std::nullopt, 6, 2})}).size(), 3u);
}

TEST(DropoutLayerTest, IsIdentityOutsideTraining) {
    const auto input = torch::randn({4, 8});
    EXPECT_TRUE(torch::equal(run(Layer::Dropout({.probability = 0.5}), {input}).front(), input));
}

TEST(DropoutLayerTest, SeededMasksAreDeterministicAndScaled) {
    const auto input = torch::ones({16, 16});
    const auto first = run(Layer::Dropout({.probability = 0.5, .seed = 42}), {input}, true).front();
    const auto second = run(Layer::Dropout({.probability = 0.5, .seed = 42}), {input}, true).front();
    EXPECT_TRUE(torch::equal(first, second));

    const auto kept = first.ne(0);
    EXPECT_TRUE(torch::allclose(first.masked_select(kept), torch::full({kept.sum().item<std::int64_t>()}, 2.0f)));
    EXPECT_GT(kept.sum().item<std::int64_t>(), 0);
    EXPECT_LT(kept.sum().item<std::int64_t>(), 256);
    EXPECT_THROW(static_cast<void>(Layer::Dropout({.probability = 1.0})), ConfigurationError);
}

TEST(ActivationLayerTest, AppliesTheActivation) {
    const auto output = run(Layer::Activation(Strata::Activation::ReLU), {torch::tensor({{-1.0f, 2.0f}})}).front();
    EXPECT_TRUE(torch::equal(output, torch::tensor({{0.0f, 2.0f}})));
    EXPECT_THROW(Strata::Activation::Details::from_string("swoosh"), ConfigurationError);
    EXPECT_THROW(Strata::Initialization::Details::from_string("random"), ConfigurationError);
}

TEST(ActivationLayerTest, DeclaredDtypeMatchesTheComputedOne) {
    Scope scope;
    const auto ints = scope.input({std::nullopt, 2}, DType::Int32);
    const auto flags = scope.input({std::nullopt, 2}, DType::Bool);
    EXPECT_EQ(scope.call(Layer::Activation(Strata::Activation::Tanh), ints).dtype, DType::Float32);
    EXPECT_EQ(scope.call(Layer::Activation(Strata::Activation::ReLU), ints).dtype, DType::Int32);
    EXPECT_EQ(scope.call(Layer::Activation(Strata::Activation::Identity), ints).dtype, DType::Int32);
    EXPECT_EQ(scope.call(Layer::Activation(Strata::Activation::ReLU), flags).dtype, DType::Float32);
    EXPECT_EQ(scope.call(Layer::Activation(Strata::Activation::Sigmoid, {.dtype = DType::Float64}), ints).dtype,
              DType::Float64);

    const auto sigmoid = run(Layer::Activation(Strata::Activation::Sigmoid), {torch::tensor({{0, 1}}, torch::kInt32)}).front();
    EXPECT_EQ(sigmoid.scalar_type(), torch::kFloat32);
    EXPECT_TRUE(torch::allclose(sigmoid, torch::sigmoid(torch::tensor({{0.0f, 1.0f}}))));

    const auto relu = run(Layer::Activation(Strata::Activation::ReLU), {torch::tensor({{-3, 4}}, torch::kInt32)}).front();
    EXPECT_EQ(relu.scalar_type(), torch::kInt32);
    EXPECT_TRUE(torch::equal(relu, torch::tensor({{0, 4}}, torch::kInt32)));

    const auto widened = run(Layer::Activation(Strata::Activation::Tanh, {.dtype = DType::Float64}),
                             {torch::tensor({{0.5f}})}).front();
    EXPECT_EQ(widened.scalar_type(), torch::kFloat64);
}

TEST(MergeLayerTest, AveragingIntegersYieldsFloat) {
    Scope scope;
    const auto a = scope.input({std::nullopt, 2}, DType::Int32);
    const auto b = scope.input({std::nullopt, 2}, DType::Int32);
    EXPECT_EQ(scope.apply(Layer::Merge(Layer::MergeMode::Average), {a, b}).front().dtype, DType::Float32);
    EXPECT_EQ(scope.apply(Layer::Merge(Layer::MergeMode::Add), {a, b}).front().dtype, DType::Int32);

    const auto output = run(Layer::Merge(Layer::MergeMode::Average),
                            {torch::tensor({{1, 4}}, torch::kInt32), torch::tensor({{2, 7}}, torch::kInt32)}).front();
    EXPECT_EQ(output.scalar_type(), torch::kFloat32);
    EXPECT_TRUE(torch::allclose(output, torch::tensor({{1.5f, 5.5f}})));
}

TEST(LayerRegistryTest, CreatesBuiltinsAndRejectsUnknownClasses) {
    const auto& registry = Layer::builtin_registry();
    EXPECT_TRUE(registry.contains("Dense"));
    EXPECT_TRUE(registry.contains("Nested"));
    EXPECT_FALSE(registry.contains("Lambda"));
    EXPECT_THROW(static_cast<void>(registry.create("Mystery", PropertyTree{})), ConfigurationError);

    auto dense = Layer::Dense({.units = 6}, Strata::Activation::Sigmoid, Strata::Initialization::XavierNormal, {.name = "head"});
    const auto copy = registry.create("Dense", dense->config());
    EXPECT_EQ(copy->name(), "head");
    EXPECT_EQ(copy->config().get<std::int64_t>("units"), 6);
    EXPECT_EQ(copy->config().get<std::string>("activation"), "sigmoid");
    EXPECT_EQ(copy->config().get<std::string>("initialization"), "xavier_normal");
}

TEST(LayerRegistryTest, CustomFactoriesCanBeAdded) {
    Layer::Registry registry;
    Layer::register_builtin_layers(registry);
    EXPECT_THROW(registry.add("Dense", [](const PropertyTree&, const Layer::Registry&) { return std::shared_ptr<Layer::Base>{}; }),
                 ConfigurationError);
    registry.add("Identity", [](const PropertyTree& tree, const Layer::Registry&) -> std::shared_ptr<Layer::Base> {
        return Layer::Activation(Strata::Activation::Identity, {.name = tree.get<std::string>("name", "")});
    });
    EXPECT_EQ(registry.create("Identity", PropertyTree{})->class_name(), "Activation");
}
