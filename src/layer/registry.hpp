#ifndef STRATA_LAYER_REGISTRY_HPP
#define STRATA_LAYER_REGISTRY_HPP

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "../common/config.hpp"
#include "../common/error.hpp"
#include "base.hpp"

namespace Strata::Layer {
    // Maps class names to factories rebuilding a layer from its config.
    class Registry {
    public:
        using Factory = std::function<std::shared_ptr<Base>(const PropertyTree&, const Registry&)>;

        Registry& add(const std::string& class_name, Factory factory)
        {
            if (!factory) {
                throw ConfigurationError("Layer class '" + class_name + "' was registered without a factory.");
            }
            if (!factories_.emplace(class_name, std::move(factory)).second) {
                throw ConfigurationError("Layer class '" + class_name + "' is already registered.");
            }
            return *this;
        }

        [[nodiscard]] bool contains(const std::string& class_name) const
        {
            return factories_.find(class_name) != factories_.end();
        }

        [[nodiscard]] std::vector<std::string> class_names() const
        {
            std::vector<std::string> names;
            names.reserve(factories_.size());
            for (const auto& [name, factory] : factories_) {
                names.push_back(name);
            }
            return names;
        }

        [[nodiscard]] std::shared_ptr<Base> create(const std::string& class_name, const PropertyTree& config) const
        {
            const auto it = factories_.find(class_name);
            if (it == factories_.end()) {
                throw ConfigurationError("Unknown layer class '" + class_name + "'.");
            }
            auto layer = it->second(config, *this);
            if (!layer) {
                throw ConfigurationError("Factory for layer class '" + class_name + "' returned no layer.");
            }
            return layer;
        }

    private:
        std::map<std::string, Factory> factories_{};
    };
}

#endif // STRATA_LAYER_REGISTRY_HPP
