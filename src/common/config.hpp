#ifndef STRATA_COMMON_CONFIG_HPP
#define STRATA_COMMON_CONFIG_HPP

#include <cctype>
#include <cstdint>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/property_tree/ptree.hpp>

#include "dtype.hpp"
#include "error.hpp"
#include "shape.hpp"

namespace Strata {
    using PropertyTree = boost::property_tree::ptree;
    // Non-tensor keyword arguments recorded on a node.
    using CallArguments = PropertyTree;

    namespace Config {
        inline std::string to_lower(std::string value)
        {
            for (auto& character : value) {
                character = static_cast<char>(std::tolower(static_cast<unsigned char>(character)));
            }
            return value;
        }

        namespace Details {
            template <class T>
            constexpr const char* field_kind()
            {
                if constexpr (std::is_same_v<T, bool>) {
                    return "boolean";
                } else if constexpr (std::is_arithmetic_v<T>) {
                    return "numeric";
                } else {
                    return "string";
                }
            }

            // Arrays are children with empty keys.
            inline void append_element(PropertyTree& array, PropertyTree element)
            {
                array.push_back({std::string{}, std::move(element)});
            }
        }

        // Typed field lookup; a missing or unparsable field names the config it came from.
        template <class T>
        T require(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            if (const auto value = tree.get_optional<T>(key)) {
                return *value;
            }
            throw ConfigurationError(std::string("Missing ") + Details::field_kind<T>() + " field '" + key + "' in " + context);
        }

        template <class Numeric>
        Numeric get_numeric(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            static_assert(std::is_arithmetic_v<Numeric>, "get_numeric expects an arithmetic type.");
            return require<Numeric>(tree, key, context);
        }

        inline std::string get_string(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            return require<std::string>(tree, key, context);
        }

        inline const PropertyTree& get_child(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            const auto child = tree.get_child_optional(key);
            if (!child) {
                std::ostringstream message;
                message << "Missing section '" << key << "' in " << context;
                throw ConfigurationError(message.str());
            }
            return *child;
        }

        template <class T>
        std::vector<T> read_array(const PropertyTree& tree, const std::string& context)
        {
            std::vector<T> values;
            for (const auto& [key, child] : tree) {
                const auto value = child.get_value_optional<T>();
                if (!key.empty() || !value) {
                    throw ConfigurationError("Invalid array element in " + context);
                }
                values.push_back(*value);
            }
            return values;
        }

        template <class T>
        PropertyTree write_array(const std::vector<T>& values)
        {
            PropertyTree array;
            for (const auto& value : values) {
                Details::append_element(array, PropertyTree(std::to_string(value)));
            }
            return array;
        }

        // Undetermined dimensions are written as "null".
        inline PropertyTree write_shape(const Shape& shape)
        {
            PropertyTree array;
            for (const auto& dimension : shape) {
                Details::append_element(array, PropertyTree(dimension ? std::to_string(*dimension) : std::string("null")));
            }
            return array;
        }

        inline Shape read_shape(const PropertyTree& tree, const std::string& context)
        {
            Shape shape;
            shape.reserve(tree.size());
            for (const auto& child : tree) {
                const auto text = child.second.get_value<std::string>();
                if (text == "null") {
                    shape.emplace_back(std::nullopt);
                    continue;
                }
                const auto value = child.second.get_value_optional<std::int64_t>();
                if (!value || *value <= 0) {
                    throw ConfigurationError("Invalid dimension '" + text + "' in " + context);
                }
                shape.emplace_back(*value);
            }
            return shape;
        }

        inline DType read_dtype(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            const auto text = get_string(tree, key, context);
            try {
                return dtype_from_string(text);
            } catch (const std::invalid_argument& error) {
                throw ConfigurationError(std::string(error.what()) + " (in " + context + ")");
            }
        }
    }
}

#endif // STRATA_COMMON_CONFIG_HPP
