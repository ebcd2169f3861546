#ifndef STRATA_GRAPH_FEED_DICT_HPP
#define STRATA_GRAPH_FEED_DICT_HPP

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <map>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../common/dtype.hpp"
#include "../common/error.hpp"
#include "../common/logging.hpp"
#include "../common/shape.hpp"
#include "symbolic.hpp"

namespace Strata {
    // Concrete tensors keyed by SymbolicValue id. Copies share tensor storage.
    class FeedDict {
    public:
        explicit FeedDict(LogOptions log = {}) : log_(log) {}

        FeedDict(std::initializer_list<std::pair<SymbolicValue, torch::Tensor>> entries, LogOptions log = {})
            : log_(log)
        {
            for (const auto& [key, value] : entries) {
                add(key, value);
            }
        }

        /// Stores `value` under `key` after checking shape compatibility. A dtype that
        /// differs from the key's is cast when the conversion is safe and reported.
        FeedDict& add(const SymbolicValue& key, torch::Tensor value)
        {
            if (entries_.count(key.id) > 0) {
                throw DuplicateKeyError(key.name, "Duplicate key: feed already holds a value for '" + key.name + "'.");
            }
            if (!value.defined()) {
                throw ShapeMismatchError(key.name, "Feed value for '" + key.name + "' is an undefined tensor.");
            }

            const auto shape = shape_of(value);
            if (shape.size() != key.shape.size()) {
                std::ostringstream message;
                message << "The rank of feed (" << shape.size() << ") does not match the rank of the key '"
                        << key.name << "' (" << key.shape.size() << ").";
                throw ShapeMismatchError(key.name, message.str());
            }
            for (std::size_t i = 0; i < shape.size(); ++i) {
                if (key.shape[i].has_value() && *key.shape[i] != *shape[i]) {
                    std::ostringstream message;
                    message << "The " << i << "-th dimension of the feed (" << *shape[i]
                            << ") is incompatible with that of the key '" << key.name << "' (" << *key.shape[i] << ").";
                    throw ShapeMismatchError(key.name, message.str());
                }
            }

            const auto actual = dtype_of(value.scalar_type());
            if (!actual) {
                std::ostringstream message;
                message << "Feed value for '" << key.name << "' has unsupported scalar type " << value.scalar_type() << '.';
                throw DtypeMismatchError(key.name, message.str());
            }
            if (*actual != key.dtype) {
                if (!can_safely_cast(*actual, key.dtype)) {
                    throw DtypeMismatchError(key.name, "The dtype of the feed (" + to_string(*actual)
                                                       + ") is incompatible with that of the key '" + key.name
                                                       + "' (" + to_string(key.dtype) + ").");
                }
                Log::warning(log_, "Casting feed value for '" + key.name + "' from " + to_string(*actual) + " to "
                                   + to_string(key.dtype) + ".");
                value = value.to(to_scalar_type(key.dtype));
            }

            const auto sequence = next_sequence_++;
            entries_.emplace(key.id, Entry{std::move(value), key.name, sequence});
            order_.emplace(sequence, key.id);
            return *this;
        }

        [[nodiscard]] torch::Tensor get(const SymbolicValue& key) const
        {
            const auto it = entries_.find(key.id);
            if (it == entries_.end()) {
                throw MissingKeyError(key.name, "Feed holds no value for '" + key.name + "'.");
            }
            return it->second.value;
        }

        [[nodiscard]] torch::Tensor get(ValueId id) const
        {
            const auto it = entries_.find(id);
            if (it == entries_.end()) {
                throw MissingKeyError("#" + std::to_string(id), "Feed holds no value for id " + std::to_string(id) + ".");
            }
            return it->second.value;
        }

        [[nodiscard]] torch::Tensor get_by_name(const std::string& name) const
        {
            for (const auto& [sequence, id] : order_) {
                const auto& entry = entries_.at(id);
                if (entry.name == name) {
                    return entry.value;
                }
            }
            throw MissingKeyError(name, "Feed holds no value named '" + name + "'.");
        }

        [[nodiscard]] bool has_key(const SymbolicValue& key) const { return has_id(key.id); }
        [[nodiscard]] bool has_id(ValueId id) const { return entries_.count(id) > 0; }

        [[nodiscard]] bool has_name(const std::string& name) const
        {
            return std::any_of(entries_.begin(), entries_.end(),
                               [&name](const auto& item) { return item.second.name == name; });
        }

        [[nodiscard]] std::vector<std::string> names() const
        {
            std::vector<std::string> result;
            result.reserve(order_.size());
            for (const auto& [sequence, id] : order_) {
                result.push_back(entries_.at(id).name);
            }
            return result;
        }

        // Insertion order.
        [[nodiscard]] std::vector<ValueId> ids() const
        {
            std::vector<ValueId> result;
            result.reserve(order_.size());
            for (const auto& [sequence, id] : order_) {
                result.push_back(id);
            }
            return result;
        }

        [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
        [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
        [[nodiscard]] const LogOptions& log() const noexcept { return log_; }

        // Returns false when nothing was stored under `id`.
        bool release(ValueId id)
        {
            const auto it = entries_.find(id);
            if (it == entries_.end()) {
                return false;
            }
            order_.erase(it->second.sequence);
            entries_.erase(it);
            return true;
        }

    private:
        struct Entry {
            torch::Tensor value;
            std::string name;
            std::size_t sequence;
        };

        std::unordered_map<ValueId, Entry> entries_{};
        std::map<std::size_t, ValueId> order_{};
        std::size_t next_sequence_{0};
        LogOptions log_{};
    };
}

#endif // STRATA_GRAPH_FEED_DICT_HPP
