#ifndef STRATA_COMMON_ERROR_HPP
#define STRATA_COMMON_ERROR_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace Strata {
    // Bad layer arguments, incompatible rebuilds, unknown layer classes.
    class ConfigurationError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    class GraphConstructionError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    class DisconnectedInputError : public GraphConstructionError {
    public:
        DisconnectedInputError(std::string value_name, const std::string& message)
            : GraphConstructionError(message), value_name_(std::move(value_name)) {}

        [[nodiscard]] const std::string& value_name() const noexcept { return value_name_; }

    private:
        std::string value_name_{};
    };

    class CycleDetectedError : public GraphConstructionError {
    public:
        using GraphConstructionError::GraphConstructionError;
    };

    /// Base of every failure attributable to one named symbolic value.
    class FeedError : public std::runtime_error {
    public:
        FeedError(std::string value_name, const std::string& message)
            : std::runtime_error(message), value_name_(std::move(value_name)) {}

        [[nodiscard]] const std::string& value_name() const noexcept { return value_name_; }

    private:
        std::string value_name_{};
    };

    class DuplicateKeyError : public FeedError {
    public:
        using FeedError::FeedError;
    };

    class ShapeMismatchError : public FeedError {
    public:
        using FeedError::FeedError;
    };

    class DtypeMismatchError : public FeedError {
    public:
        using FeedError::FeedError;
    };

    class MissingKeyError : public FeedError {
    public:
        using FeedError::FeedError;
    };

    class MissingFeedError : public FeedError {
    public:
        using FeedError::FeedError;
    };

    // Thrown with the layer's own exception nested inside it.
    class ExecutionError : public std::runtime_error {
    public:
        ExecutionError(std::string layer_name, std::size_t node, const std::string& message)
            : std::runtime_error(message), layer_name_(std::move(layer_name)), node_(node) {}

        [[nodiscard]] const std::string& layer_name() const noexcept { return layer_name_; }
        [[nodiscard]] std::size_t node() const noexcept { return node_; }

    private:
        std::string layer_name_{};
        std::size_t node_{0};
    };

    using LayerInvocationError = ExecutionError;
}

#endif // STRATA_COMMON_ERROR_HPP
