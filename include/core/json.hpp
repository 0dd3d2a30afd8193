#pragma once

#include <glaze/glaze.hpp>

#include <cmath>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace polystore {

/**
 * @brief Thin wrapper around glz::json_t used as the engine's value model
 *
 * Records, predicate values, write payloads, change-notification payloads and
 * HTTP bodies are all JsonValue. Object keys are ordered (std::map), so
 * dump() output is deterministic for equal values; the cache relies on that
 * when it serializes descriptors into keys.
 *
 * Const operator[] returns copies. Mutation goes through set()/push_back().
 */
class JsonValue {
public:
    using array_t = glz::json_t::array_t;
    using object_t = glz::json_t::object_t;
    using null_t = glz::json_t::null_t;

    struct parse_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // ===== Constructors =====

    JsonValue() = default;
    JsonValue(glz::json_t v) : data_(std::move(v)) {}
    JsonValue(std::nullptr_t) {}
    JsonValue(bool v) { data_ = v; }
    JsonValue(int v) { data_ = static_cast<double>(v); }
    JsonValue(unsigned int v) { data_ = static_cast<double>(v); }
    JsonValue(long v) { data_ = static_cast<double>(v); }
    JsonValue(unsigned long v) { data_ = static_cast<double>(v); }
    JsonValue(long long v) { data_ = static_cast<double>(v); }
    JsonValue(double v) { data_ = v; }
    JsonValue(const char* v) { data_ = std::string(v); }
    JsonValue(const std::string& v) { data_ = v; }
    JsonValue(std::string&& v) { data_ = std::move(v); }
    JsonValue(std::string_view v) { data_ = std::string(v); }

    // ===== Type Checks =====

    [[nodiscard]] bool is_null() const { return data_.is_null(); }
    [[nodiscard]] bool is_object() const { return data_.is_object(); }
    [[nodiscard]] bool is_array() const { return data_.is_array(); }
    [[nodiscard]] bool is_string() const { return data_.is_string(); }
    [[nodiscard]] bool is_number() const { return data_.is_number(); }
    [[nodiscard]] bool is_boolean() const { return data_.is_boolean(); }

    /// Largest magnitude a double holds without skipping integers (2^53)
    static constexpr double kMaxExactInteger = 9007199254740992.0;

    /**
     * @brief Integral value if this is a whole number a double represents
     * exactly; nullopt for fractions, non-numbers and anything past 2^53.
     */
    [[nodiscard]] std::optional<int64_t> as_integer() const {
        if (!data_.is_number()) return std::nullopt;
        const double d = data_.get<double>();
        if (!std::isfinite(d) || d != std::floor(d)) return std::nullopt;
        if (std::fabs(d) > kMaxExactInteger) return std::nullopt;
        return static_cast<int64_t>(d);
    }

    [[nodiscard]] bool is_number_integer() const { return as_integer().has_value(); }

    // ===== Container Properties =====

    [[nodiscard]] bool empty() const {
        if (data_.is_object()) return data_.get_object().empty();
        if (data_.is_array()) return data_.get_array().empty();
        return data_.is_null();
    }

    [[nodiscard]] size_t size() const {
        if (data_.is_object()) return data_.get_object().size();
        if (data_.is_array()) return data_.get_array().size();
        return data_.is_null() ? 0 : 1;
    }

    [[nodiscard]] bool contains(std::string_view key) const {
        if (!data_.is_object()) return false;
        const auto& obj = data_.get_object();
        return obj.find(std::string(key)) != obj.end();
    }

    // ===== Const Element Access (returns copy) =====

    [[nodiscard]] JsonValue operator[](std::string_view key) const {
        if (!data_.is_object()) return {};
        const auto& obj = data_.get_object();
        auto it = obj.find(std::string(key));
        if (it != obj.end()) return JsonValue(it->second);
        return {};
    }

    [[nodiscard]] JsonValue operator[](size_t idx) const {
        if (!data_.is_array()) return {};
        const auto& arr = data_.get_array();
        if (idx < arr.size()) return JsonValue(arr[idx]);
        return {};
    }

    // ===== Value Extraction =====

    template <typename T>
    [[nodiscard]] T get() const {
        if constexpr (std::is_same_v<T, std::string>) {
            return data_.get<std::string>();
        } else if constexpr (std::is_same_v<T, bool>) {
            return data_.get<bool>();
        } else if constexpr (std::is_same_v<T, double>) {
            return data_.get<double>();
        } else if constexpr (std::is_integral_v<T>) {
            // json_t stores all numbers as double; cast to target integral type
            return static_cast<T>(data_.get<double>());
        } else {
            static_assert(!sizeof(T), "Unsupported type for JsonValue::get<T>()");
        }
    }

    template <typename T>
    [[nodiscard]] T value(std::string_view key, T default_value) const {
        if (!data_.is_object()) return default_value;
        const auto& obj = data_.get_object();
        auto it = obj.find(std::string(key));
        if (it == obj.end()) return default_value;
        const JsonValue v(it->second);
        if constexpr (std::is_same_v<T, std::string>) {
            if (!v.is_string()) return default_value;
        } else if constexpr (std::is_same_v<T, bool>) {
            if (!v.is_boolean()) return default_value;
        } else {
            if (!v.is_number()) return default_value;
        }
        return v.get<T>();
    }

    /**
     * @brief Scalar rendered as plain text: strings unquoted, integers without
     * a fractional part, everything else as JSON.
     */
    [[nodiscard]] std::string to_text() const {
        if (is_string()) return data_.get<std::string>();
        if (is_boolean()) return data_.get<bool>() ? "true" : "false";
        if (const auto i = as_integer()) return std::to_string(*i);
        return dump();
    }

    // ===== Mutation =====

    JsonValue& set(std::string_view key, JsonValue val) {
        if (!data_.is_object()) data_ = object_t{};
        data_.get_object()[std::string(key)] = std::move(val.data_);
        return *this;
    }

    bool erase(std::string_view key) {
        if (!data_.is_object()) return false;
        return data_.get_object().erase(std::string(key)) > 0;
    }

    JsonValue& push_back(JsonValue val) {
        if (!data_.is_array()) data_ = array_t{};
        data_.get_array().emplace_back(std::move(val.data_));
        return *this;
    }

    /// Shallow merge of another object's keys into this one (other wins)
    JsonValue& merge(const JsonValue& other) {
        for (const auto& [key, val] : other.items()) {
            set(key, val);
        }
        return *this;
    }

    // ===== Iteration =====

    [[nodiscard]] std::vector<JsonValue> elements() const {
        std::vector<JsonValue> out;
        if (!data_.is_array()) return out;
        const auto& arr = data_.get_array();
        out.reserve(arr.size());
        for (const auto& elem : arr) out.emplace_back(elem);
        return out;
    }

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

    [[nodiscard]] std::vector<std::string> keys() const {
        std::vector<std::string> out;
        if (!data_.is_object()) return out;
        for (const auto& [key, val] : data_.get_object()) out.push_back(key);
        return out;
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

    // Helper: create {"key": value} object
    [[nodiscard]] static JsonValue wrap(std::string_view key, JsonValue val) {
        JsonValue j = object();
        j.set(key, std::move(val));
        return j;
    }

    // ===== Serialization =====

    [[nodiscard]] std::string dump() const {
        std::string out;
        if (glz::write_json(data_, out)) {
            throw std::runtime_error("JSON serialization error");
        }
        return out;
    }

    [[nodiscard]] bool operator==(const JsonValue& other) const {
        return dump() == other.dump();
    }

    // ===== Raw Access =====

    [[nodiscard]] glz::json_t& raw() { return data_; }
    [[nodiscard]] const glz::json_t& raw() const { return data_; }

private:
    glz::json_t data_{};
};

} // namespace polystore
