#pragma once

#include <glaze/glaze.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace vaultclient {

/**
 * @brief Thin wrapper around glz::json_t used for Vault request and response bodies
 *
 * Stores json_t by value. Const operator[] returns copies so missing keys
 * read as null instead of inserting. Request bodies are built with set()
 * and push_back(), then serialised with dump().
 */
class JsonValue {
public:
    using array_t = glz::json_t::array_t;
    using object_t = glz::json_t::object_t;

    struct parse_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // ===== Constructors =====

    JsonValue() = default;
    JsonValue(glz::json_t v) : data_(std::move(v)) {}
    JsonValue(std::nullptr_t) {}
    JsonValue(bool v) { data_ = v; }
    JsonValue(int v) { data_ = static_cast<double>(v); }
    JsonValue(long long v) { data_ = static_cast<double>(v); }
    JsonValue(double v) { data_ = v; }
    JsonValue(const char* v) { data_ = std::string(v); }
    JsonValue(const std::string& v) { data_ = v; }
    JsonValue(std::string&& v) { data_ = std::move(v); }

    // ===== Type Checks =====

    [[nodiscard]] bool is_null() const { return data_.is_null(); }
    [[nodiscard]] bool is_object() const { return data_.is_object(); }
    [[nodiscard]] bool is_array() const { return data_.is_array(); }
    [[nodiscard]] bool is_string() const { return data_.is_string(); }
    [[nodiscard]] bool is_number() const { return data_.is_number(); }
    [[nodiscard]] bool is_boolean() const { return data_.is_boolean(); }

    // ===== Const Element Access (returns copy) =====

    [[nodiscard]] JsonValue operator[](std::string_view key) const {
        if (!data_.is_object()) return {};
        const auto& obj = data_.get_object();
        auto it = obj.find(std::string(key));
        if (it != obj.end()) return JsonValue(it->second);
        return {};
    }

    template <typename T>
    [[nodiscard]] T get() const {
        if constexpr (std::is_same_v<T, std::string>) {
            return data_.get<std::string>();
        } else if constexpr (std::is_same_v<T, bool>) {
            return data_.get<bool>();
        } else if constexpr (std::is_same_v<T, double>) {
            return data_.get<double>();
        } else if constexpr (std::is_integral_v<T>) {
            if (const auto n = as_integer<T>()) return *n;
            throw parse_error("JSON number is not representable as an integer");
        } else {
            static_assert(!sizeof(T), "Unsupported type for JsonValue::get<T>()");
        }
    }

    // Typed lookup with a default when the key is missing or has another type
    template <typename T>
    [[nodiscard]] T value(std::string_view key, T default_value) const {
        const JsonValue node = (*this)[key];
        if constexpr (std::is_same_v<T, std::string>) {
            return node.is_string() ? node.get<std::string>() : default_value;
        } else if constexpr (std::is_same_v<T, bool>) {
            return node.is_boolean() ? node.get<bool>() : default_value;
        } else if constexpr (std::is_integral_v<T>) {
            return node.as_integer<T>().value_or(default_value);
        } else {
            return node.is_number() ? node.get<T>() : default_value;
        }
    }

    /**
     * @brief Integral view of a number
     *
     * json_t stores all numbers as double. Returns nullopt for non-numbers,
     * non-finite values, fractions, and values outside T's range.
     */
    template <typename T>
    [[nodiscard]] std::optional<T> as_integer() const {
        static_assert(std::is_integral_v<T> && !std::is_same_v<T, bool>);
        if (!data_.is_number()) return std::nullopt;
        const double d = data_.get<double>();
        if (!std::isfinite(d) || d != std::trunc(d)) return std::nullopt;

        // [lower, upper) is exact in double for every integral width
        constexpr int digits = std::numeric_limits<T>::digits;
        const double upper = std::ldexp(1.0, digits);
        const double lower = std::is_signed_v<T> ? -upper : 0.0;
        if (d < lower || d >= upper) return std::nullopt;
        return static_cast<T>(d);
    }

    // String elements of an array member; non-strings are skipped
    [[nodiscard]] std::vector<std::string> string_array(std::string_view key) const {
        std::vector<std::string> result;
        const JsonValue node = (*this)[key];
        if (!node.is_array()) return result;
        for (const auto& elem : node.data_.get_array()) {
            if (elem.is_string()) {
                result.emplace_back(elem.get<std::string>());
            }
        }
        return result;
    }

    // ===== Mutation (request building) =====

    JsonValue& set(std::string_view key, JsonValue val) {
        if (!data_.is_object()) data_ = object_t{};
        data_.get_object()[std::string(key)] = std::move(val.data_);
        return *this;
    }

    JsonValue& push_back(JsonValue val) {
        if (!data_.is_array()) data_ = array_t{};
        data_.get_array().emplace_back(std::move(val.data_));
        return *this;
    }

    // ===== Items Range (for structured bindings over objects) =====

    class items_range {
        const object_t* obj_;

    public:
        explicit items_range(const object_t* obj) : obj_(obj) {}

        class iterator {
            object_t::const_iterator it_;

        public:
            explicit iterator(object_t::const_iterator it) : it_(it) {}

            [[nodiscard]] std::pair<std::string, JsonValue> operator*() const {
                return {it_->first, JsonValue(it_->second)};
            }

            iterator& operator++() { ++it_; return *this; }
            [[nodiscard]] bool operator!=(const iterator& o) const { return it_ != o.it_; }
        };

        [[nodiscard]] iterator begin() const { return iterator(obj_->begin()); }
        [[nodiscard]] iterator end() const { return iterator(obj_->end()); }
    };

    [[nodiscard]] items_range items() const {
        static const object_t empty_obj;
        if (data_.is_object()) {
            return items_range(&data_.get_object());
        }
        return items_range(&empty_obj);
    }

    // ===== Static Factories =====

    [[nodiscard]] static JsonValue object() {
        glz::json_t j;
        j = object_t{};
        return JsonValue(std::move(j));
    }

    [[nodiscard]] static JsonValue array() {
        glz::json_t j;
        j = array_t{};
        return JsonValue(std::move(j));
    }

    [[nodiscard]] static JsonValue parse(const std::string& json_str) {
        glz::json_t result;
        auto ec = glz::read_json(result, json_str);
        if (ec) {
            throw parse_error("JSON parse error");
        }
        return JsonValue(std::move(result));
    }

    // ===== Serialisation =====

    [[nodiscard]] std::string dump() const {
        std::string buffer;
        auto ec = glz::write_json(data_, buffer);
        if (ec) {
            throw parse_error("JSON write error");
        }
        return buffer;
    }

private:
    glz::json_t data_{};
};

} // namespace vaultclient
