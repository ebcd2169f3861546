#ifndef STRATA_GRAPH_NAME_SCOPE_HPP
#define STRATA_GRAPH_NAME_SCOPE_HPP

#include <cstddef>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace Strata {
    class NameScope {
    public:
        [[nodiscard]] bool contains(const std::string& name) const { return taken_.count(name) > 0; }

        // False when the name is already in use.
        bool reserve(const std::string& name) { return taken_.insert(name).second; }

        /// Returns the first free "<prefix>_<k>" with k counting from 1 per prefix.
        std::string unique(const std::string& prefix)
        {
            auto& counter = counters_[prefix];
            std::string candidate;
            do {
                candidate = prefix + "_" + std::to_string(++counter);
            } while (contains(candidate));
            taken_.insert(candidate);
            return candidate;
        }

        [[nodiscard]] std::size_t size() const noexcept { return taken_.size(); }

    private:
        std::unordered_set<std::string> taken_{};
        std::unordered_map<std::string, std::size_t> counters_{};
    };
}

#endif // STRATA_GRAPH_NAME_SCOPE_HPP
