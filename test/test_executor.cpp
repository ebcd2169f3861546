#include <gtest/gtest.h>

#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "test_helpers.hpp"

using namespace Strata;

class ExecutorTest : public ::testing::Test {
protected:
    Scope scope;
    LogOptions log = Testing::silent();

    FeedDict feed_of(const SymbolicValue& key, const torch::Tensor& value) const
    {
        FeedDict feed(log);
        feed.add(key, value);
        return feed;
    }

    // Position of each evaluated node in the trace.
    static std::unordered_map<NodeId, std::size_t> positions(const ExecutionTrace& trace)
    {
        std::unordered_map<NodeId, std::size_t> result;
        for (std::size_t i = 0; i < trace.evaluated.size(); ++i) {
            result[trace.evaluated[i]] = i;
        }
        return result;
    }
};

TEST_F(ExecutorTest, IdentityChainRoundTrip) {
    auto calls_a = std::make_shared<int>(0);
    auto calls_b = std::make_shared<int>(0);
    const auto x = scope.input({std::nullopt, 2}, DType::Float32, "x");
    const auto a = scope.call(Testing::counting_identity(calls_a, "A"), x);
    const auto b = scope.call(Testing::counting_identity(calls_b, "B"), a);

    Executor executor(scope, log);
    const auto value = torch::tensor({{1.0f, 2.0f}, {3.0f, 4.0f}});
    for (int round = 1; round <= 2; ++round) {
        const auto results = executor.execute({b, b}, feed_of(x, value));
        ASSERT_EQ(results.size(), 2u);
        EXPECT_TRUE(torch::equal(results[0], value));
        EXPECT_TRUE(torch::equal(results[1], value));
        EXPECT_EQ(*calls_a, round);
        EXPECT_EQ(*calls_b, round);
    }
}

TEST_F(ExecutorTest, DiamondEvaluatesEveryNodeOnce) {
    auto calls = std::make_shared<int>(0);
    const auto x = scope.input({std::nullopt, 3}, DType::Float32, "x");
    const auto left = scope.call(Testing::counting_identity(calls, "left"), x);
    const auto right = scope.call(Testing::counting_identity(calls, "right"), x);
    const auto joined = scope.apply(Testing::counting_sum(calls, "join"), {left, right}).front();

    Executor executor(scope, log);
    const auto results = executor.execute({joined}, feed_of(x, torch::ones({2, 3})));
    EXPECT_EQ(*calls, 3);
    EXPECT_TRUE(torch::equal(results.front(), torch::full({2, 3}, 2.0f)));

    const auto& trace = executor.last_trace();
    ASSERT_EQ(trace.evaluated.size(), 3u);
    EXPECT_EQ(trace.evaluated.back(), *joined.producer);
}

TEST_F(ExecutorTest, ProducersRunBeforeConsumers) {
    auto calls = std::make_shared<int>(0);
    const auto x = scope.input({std::nullopt, 3}, DType::Float32, "x");
    const auto a = scope.call(Testing::counting_identity(calls), x);
    const auto b = scope.call(Testing::counting_identity(calls), a);
    const auto c = scope.call(Testing::counting_identity(calls), a);
    const auto d = scope.apply(Testing::counting_sum(calls), {c, b, a}).front();

    Executor executor(scope, log);
    static_cast<void>(executor.execute({d, b}, feed_of(x, torch::ones({1, 3}))));
    const auto order = positions(executor.last_trace());
    ASSERT_EQ(order.size(), 4u);
    for (const auto& [node_id, position] : order) {
        for (const auto input : scope.node(node_id).inputs) {
            const auto& value = scope.value(input);
            if (value.producer) {
                EXPECT_LT(order.at(*value.producer), position);
            }
        }
    }
}

TEST_F(ExecutorTest, FeedingAnIntermediateShortCircuitsUpstream) {
    auto upstream = std::make_shared<int>(0);
    auto downstream = std::make_shared<int>(0);
    const auto x = scope.input({std::nullopt, 2}, DType::Float32, "x");
    const auto a = scope.call(Testing::counting_identity(upstream, "A"), x);
    const auto b = scope.call(Testing::counting_identity(downstream, "B"), a);

    Executor executor(scope, log);
    const auto results = executor.execute({b}, feed_of(a, torch::full({1, 2}, 7.0f)));
    EXPECT_EQ(*upstream, 0);
    EXPECT_EQ(*downstream, 1);
    EXPECT_TRUE(torch::equal(results.front(), torch::full({1, 2}, 7.0f)));
}

TEST_F(ExecutorTest, FetchingAFedValueRunsNothing) {
    auto calls = std::make_shared<int>(0);
    const auto x = scope.input({std::nullopt, 2}, DType::Float32, "x");
    static_cast<void>(scope.call(Testing::counting_identity(calls), x));

    Executor executor(scope, log);
    const auto results = executor.execute({x}, feed_of(x, torch::ones({1, 2})));
    EXPECT_EQ(*calls, 0);
    EXPECT_TRUE(executor.last_trace().evaluated.empty());
    EXPECT_TRUE(torch::equal(results.front(), torch::ones({1, 2})));
}

TEST_F(ExecutorTest, MissingFeedIsReportedBeforeAnyLayerRuns) {
    auto calls = std::make_shared<int>(0);
    const auto x = scope.input({std::nullopt, 2}, DType::Float32, "x");
    const auto y = scope.input({std::nullopt, 2}, DType::Float32, "y");
    const auto a = scope.call(Testing::counting_identity(calls), x);
    const auto b = scope.call(Testing::counting_identity(calls), y);
    const auto sum = scope.apply(Testing::counting_sum(calls), {a, b}).front();

    Executor executor(scope, log);
    try {
        static_cast<void>(executor.execute({sum}, feed_of(x, torch::ones({1, 2}))));
        FAIL() << "expected MissingFeedError";
    } catch (const MissingFeedError& error) {
        EXPECT_EQ(error.value_name(), "y");
        EXPECT_NE(std::string(error.what()).find("y"), std::string::npos);
    }
    EXPECT_EQ(*calls, 0);
}

TEST_F(ExecutorTest, IntermediatesAreReleasedAfterTheirLastConsumer) {
    auto calls = std::make_shared<int>(0);
    const auto x = scope.input({std::nullopt, 2}, DType::Float32, "x");
    const auto a = scope.call(Testing::counting_identity(calls), x);
    const auto b = scope.call(Testing::counting_identity(calls), a);
    const auto c = scope.call(Testing::counting_identity(calls), b);

    Executor executor(scope, log);
    static_cast<void>(executor.execute({c}, feed_of(x, torch::ones({1, 2}))));
    const auto& trace = executor.last_trace();
    EXPECT_EQ(trace.released, (std::vector<ValueId>{a.id, b.id}));
    EXPECT_EQ(trace.peak_live, 3u);
    EXPECT_FALSE(Testing::contains(trace.released, x.id));
    EXPECT_FALSE(Testing::contains(trace.released, c.id));
}

TEST_F(ExecutorTest, FetchedIntermediatesAreKept) {
    auto calls = std::make_shared<int>(0);
    const auto x = scope.input({std::nullopt, 2}, DType::Float32, "x");
    const auto a = scope.call(Testing::counting_identity(calls), x);
    const auto b = scope.call(Testing::counting_identity(calls), a);

    Executor executor(scope, log);
    const auto results = executor.execute({a, b}, feed_of(x, torch::ones({1, 2})));
    EXPECT_TRUE(executor.last_trace().released.empty());
    EXPECT_EQ(results.size(), 2u);
}

TEST_F(ExecutorTest, TrainingKeepsEveryValue) {
    auto calls = std::make_shared<int>(0);
    const auto x = scope.input({std::nullopt, 2}, DType::Float32, "x");
    const auto a = scope.call(Testing::counting_identity(calls), x);
    const auto b = scope.call(Testing::counting_identity(calls), a);

    Executor executor(scope, log);
    static_cast<void>(executor.execute({b}, feed_of(x, torch::ones({1, 2})), /*training=*/true));
    EXPECT_TRUE(executor.last_trace().released.empty());
    EXPECT_EQ(executor.last_trace().peak_live, 3u);
}

TEST_F(ExecutorTest, UnusedOutputSlotsAreReleased) {
    const auto x = scope.input({std::nullopt, 4}, DType::Float32, "x");
    const auto parts = scope.apply(Layer::Split({.sections = 2}), {x});

    Executor executor(scope, log);
    const auto results = executor.execute({parts[0]}, feed_of(x, torch::arange(4, torch::kFloat32).reshape({1, 4})));
    EXPECT_TRUE(torch::equal(results.front(), torch::tensor({{0.0f, 1.0f}})));
    EXPECT_EQ(executor.last_trace().released, (std::vector<ValueId>{parts[1].id}));
}

TEST_F(ExecutorTest, MultiOutputLayersFeedSeveralConsumers) {
    const auto x = scope.input({std::nullopt, 4}, DType::Float32, "x");
    const auto parts = scope.apply(Layer::Split({.sections = 2}), {x});
    const auto swapped = scope.apply(Layer::Concatenate(), {parts[1], parts[0]}).front();

    Executor executor(scope, log);
    const auto results = executor.execute({swapped, parts[0]},
                                          feed_of(x, torch::arange(4, torch::kFloat32).reshape({1, 4})));
    EXPECT_TRUE(torch::equal(results[0], torch::tensor({{2.0f, 3.0f, 0.0f, 1.0f}})));
    EXPECT_TRUE(torch::equal(results[1], torch::tensor({{0.0f, 1.0f}})));
}

TEST_F(ExecutorTest, SharedLayerRunsOncePerNode) {
    auto dense = Layer::Dense({.units = 2}, Strata::Activation::Identity, Strata::Initialization::Ones);
    const auto x1 = scope.input({std::nullopt, 3}, DType::Float32, "x1");
    const auto x2 = scope.input({std::nullopt, 3}, DType::Float32, "x2");
    const auto y1 = scope.call(dense, x1);
    const auto y2 = scope.call(dense, x2);

    FeedDict feed(log);
    feed.add(x1, torch::ones({1, 3}));
    feed.add(x2, torch::full({1, 3}, 2.0f));
    Executor executor(scope, log);
    const auto results = executor.execute({y1, y2}, feed);
    EXPECT_EQ(executor.last_trace().evaluated.size(), 2u);
    EXPECT_TRUE(torch::allclose(results[0], torch::full({1, 2}, 3.0f)));
    EXPECT_TRUE(torch::allclose(results[1], torch::full({1, 2}, 6.0f)));
}

TEST_F(ExecutorTest, NodeTrainingArgumentOverridesTheCall) {
    std::vector<bool> seen;
    auto recorder = Layer::Lambda([&seen](const std::vector<torch::Tensor>& inputs, bool training, const CallArguments&) {
        seen.push_back(training);
        return std::vector<torch::Tensor>{inputs.front()};
    });
    const auto x = scope.input({std::nullopt, 2}, DType::Float32, "x");
    CallArguments arguments;
    arguments.put("training", true);
    const auto forced = scope.call(recorder, x, arguments);
    const auto plain = scope.call(recorder, x);

    Executor executor(scope, log);
    static_cast<void>(executor.execute({forced, plain}, feed_of(x, torch::ones({1, 2}))));
    EXPECT_EQ(seen, (std::vector<bool>{true, false}));
}

TEST_F(ExecutorTest, LayerFailuresAreWrappedWithTheCauseNested) {
    auto failing = Layer::Lambda(
        [](const std::vector<torch::Tensor>&, bool, const CallArguments&) -> std::vector<torch::Tensor> {
            throw std::runtime_error("boom");
        },
        {}, {.name = "bad"});
    const auto x = scope.input({std::nullopt, 2}, DType::Float32, "x");
    const auto y = scope.call(failing, x);

    Executor executor(scope, log);
    try {
        static_cast<void>(executor.execute({y}, feed_of(x, torch::ones({1, 2}))));
        FAIL() << "expected ExecutionError";
    } catch (const ExecutionError& error) {
        EXPECT_EQ(error.layer_name(), "bad");
        EXPECT_EQ(error.node(), *y.producer);
        try {
            std::rethrow_if_nested(error);
            FAIL() << "expected a nested exception";
        } catch (const std::runtime_error& cause) {
            EXPECT_STREQ(cause.what(), "boom");
        }
    }
}

TEST_F(ExecutorTest, WrongOutputCountIsAnExecutionError) {
    auto greedy = Layer::Lambda([](const std::vector<torch::Tensor>& inputs, bool, const CallArguments&) {
        return std::vector<torch::Tensor>{inputs.front(), inputs.front()};
    });
    const auto x = scope.input({std::nullopt, 2}, DType::Float32, "x");
    const auto y = scope.call(greedy, x);

    Executor executor(scope, log);
    EXPECT_THROW(static_cast<void>(executor.execute({y}, feed_of(x, torch::ones({1, 2})))), ExecutionError);
}

TEST_F(ExecutorTest, UndefinedOutputIsAnExecutionError) {
    auto hollow = Layer::Lambda([](const std::vector<torch::Tensor>&, bool, const CallArguments&) {
        return std::vector<torch::Tensor>{torch::Tensor{}};
    });
    const auto x = scope.input({std::nullopt, 2}, DType::Float32, "x");
    const auto y = scope.call(hollow, x);

    Executor executor(scope, log);
    EXPECT_THROW(static_cast<void>(executor.execute({y}, feed_of(x, torch::ones({1, 2})))), ExecutionError);
}

TEST_F(ExecutorTest, PlansAreCachedPerFetchAndFeedSet) {
    auto calls = std::make_shared<int>(0);
    const auto x = scope.input({std::nullopt, 2}, DType::Float32, "x");
    const auto a = scope.call(Testing::counting_identity(calls, "A"), x);
    const auto b = scope.call(Testing::counting_identity(calls, "B"), a);

    Executor executor(scope, log);
    static_cast<void>(executor.execute({b}, feed_of(x, torch::ones({1, 2}))));
    EXPECT_FALSE(executor.last_trace().plan_reused);
    EXPECT_EQ(executor.cached_plan_count(), 1u);

    static_cast<void>(executor.execute({b}, feed_of(x, torch::zeros({3, 2}))));
    EXPECT_TRUE(executor.last_trace().plan_reused);
    EXPECT_EQ(executor.last_trace().evaluated.size(), 2u);
    EXPECT_EQ(executor.last_trace().released, (std::vector<ValueId>{a.id}));
    EXPECT_EQ(*calls, 4);

    static_cast<void>(executor.execute({b}, feed_of(a, torch::ones({1, 2}))));
    EXPECT_FALSE(executor.last_trace().plan_reused);
    EXPECT_EQ(executor.last_trace().evaluated.size(), 1u);
    EXPECT_EQ(executor.cached_plan_count(), 2u);

    // Nodes added after a plan was cached do not disturb it.
    const auto c = scope.call(Testing::counting_identity(calls, "C"), b);
    const auto results = executor.execute({b, c}, feed_of(x, torch::ones({1, 2})));
    EXPECT_EQ(results.size(), 2u);
    EXPECT_EQ(executor.last_trace().evaluated.size(), 3u);
    EXPECT_EQ(executor.cached_plan_count(), 3u);

    executor.clear_plan_cache();
    EXPECT_EQ(executor.cached_plan_count(), 0u);
}

TEST_F(ExecutorTest, IntegralInputsThroughFloatingLayersExecute) {
    const auto x = scope.input({std::nullopt, 2}, DType::Int32, "x");
    const auto y = scope.input({std::nullopt, 2}, DType::Int32, "y");
    const auto squashed = scope.call(Layer::Activation(Strata::Activation::Sigmoid), x);
    const auto averaged = scope.apply(Layer::Merge(Layer::MergeMode::Average), {x, y}).front();
    EXPECT_EQ(squashed.dtype, DType::Float32);
    EXPECT_EQ(averaged.dtype, DType::Float32);

    FeedDict feed(log);
    feed.add(x, torch::tensor({{0, 2}}, torch::kInt32));
    feed.add(y, torch::tensor({{1, 5}}, torch::kInt32));
    Executor executor(scope, log);
    const auto results = executor.execute({squashed, averaged}, feed);
    EXPECT_EQ(results[0].scalar_type(), torch::kFloat32);
    EXPECT_TRUE(torch::allclose(results[0], torch::sigmoid(torch::tensor({{0.0f, 2.0f}}))));
    EXPECT_EQ(results[1].scalar_type(), torch::kFloat32);
    EXPECT_TRUE(torch::allclose(results[1], torch::tensor({{0.5f, 3.5f}})));
}
