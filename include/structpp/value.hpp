#pragma once

#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include "common.hpp"
#include "settings.hpp"
#include "utility.hpp"


namespace structpp {

    class struct_definition;
    class value;


    // A set of concrete field values bound to a struct_definition.
    // Always holds exactly one valid value per field of the definition: every modification is validated by the
    // field's formatter before it is applied.
    // Member functions are defined in instance.hpp.
    class struct_instance {
    public:
        // Constructs with every field set to its formatter's default value.
        explicit struct_instance(std::shared_ptr<struct_definition const> definition);

        [[nodiscard]]
        struct_definition const& definition() const noexcept {
            return *_definition;
        }

        [[nodiscard]]
        std::shared_ptr<struct_definition const> const& definition_ptr() const noexcept {
            return _definition;
        }

        // Gets a field value by name. Throws std::out_of_range if there is no such field.
        [[nodiscard]]
        value const& get(std::string_view name) const;

        // Gets a field value by declaration index. Throws std::out_of_range if index is out of bounds.
        [[nodiscard]]
        value const& get(std::size_t index) const;

        // Assigns a field value by name.
        // Throws value_constraint_error, leaving the instance unchanged, if the value is invalid for the field.
        void set(std::string_view name, value new_value);

        // Returns a copy of this instance with one field replaced. Validation is as for set().
        [[nodiscard]]
        struct_instance with(std::string_view name, value new_value) const;

        // Number of bytes serialise() produces for the current values.
        [[nodiscard]]
        std::size_t length() const;

        // Serialises all fields in declaration order.
        [[nodiscard]]
        bytes serialise(settings const& overrides = {}) const;

        // Serialises all fields into buffer, starting at offset, with an already resolved byte order.
        // buffer must have at least length() bytes from offset.
        void serialise(mutable_bytes_span buffer, std::size_t offset, endian order, settings const& overrides) const;

        // Deserialises a new instance from the start of buffer.
        [[nodiscard]]
        static struct_instance deserialise(std::shared_ptr<struct_definition const> definition,
            const_bytes_span buffer, settings const& overrides = {});

        // Deserialises a new instance from buffer, starting at offset, with an already resolved byte order.
        // Returns the instance and the number of bytes consumed.
        [[nodiscard]]
        static std::pair<struct_instance, std::size_t> deserialise(
            std::shared_ptr<struct_definition const> definition, const_bytes_span buffer, std::size_t offset,
            endian order, settings const& overrides);

        friend bool operator==(struct_instance const& lhs, struct_instance const& rhs);

    private:
        std::shared_ptr<struct_definition const> _definition;
        std::vector<value> _values;         // Indexed by field declaration index.

        struct_instance(std::shared_ptr<struct_definition const> definition, std::vector<value> values) noexcept;
    };


    enum class value_kind : unsigned char {
        integer,
        floating,
        list,
        structure
    };


    [[nodiscard]]
    constexpr std::string_view to_string(value_kind const kind) noexcept {
        switch (kind) {
        case value_kind::integer:
            return "integer";
        case value_kind::floating:
            return "floating point";
        case value_kind::list:
            return "list";
        case value_kind::structure:
            return "struct";
        }
        return "unknown";
    }


    // Dynamically typed value of a struct field.
    // Integers are normalised, so that equal numbers compare equal regardless of the C++ type they were created from.
    class value {
    public:
        using list = std::vector<value>;

        // Integer zero.
        value() noexcept :
            _data{std::uint64_t{0}}
        {}

        template<std::integral I> requires (!std::same_as<I, bool>)
        value(I const number) noexcept :
            _data{_normalise(number)}
        {}

        template<std::floating_point F>
        value(F const number) noexcept :
            _data{static_cast<double>(number)}
        {}

        value(list elements) :
            _data{std::move(elements)}
        {}

        value(struct_instance instance) :
            _data{std::move(instance)}
        {}

        [[nodiscard]]
        value_kind kind() const noexcept {
            switch (_data.index()) {
            case 0:
            case 1:
                return value_kind::integer;
            case 2:
                return value_kind::floating;
            case 3:
                return value_kind::list;
            default:
                return value_kind::structure;
            }
        }

        [[nodiscard]]
        bool is_integer() const noexcept {
            return kind() == value_kind::integer;
        }

        [[nodiscard]]
        bool is_negative() const noexcept {
            return std::holds_alternative<std::int64_t>(_data);
        }

        // Gets the integer value as type I.
        // Throws value_constraint_error if this isn't an integer, or the integer is not representable by I.
        template<std::integral I>
        [[nodiscard]]
        I as() const {
            if (auto const unsigned_value = std::get_if<std::uint64_t>(&_data)) {
                if (std::in_range<I>(*unsigned_value)) {
                    return static_cast<I>(*unsigned_value);
                }
            }
            else if (auto const signed_value = std::get_if<std::int64_t>(&_data)) {
                if (std::in_range<I>(*signed_value)) {
                    return static_cast<I>(*signed_value);
                }
            }
            else {
                throw _kind_error(value_kind::integer);
            }
            throw value_constraint_error{
                fmt::format("Integer {} is out of range for the requested type", to_string(*this))};
        }

        // Gets the floating point value. Throws value_constraint_error if this isn't a floating point value.
        [[nodiscard]]
        double as_floating() const {
            if (auto const number = std::get_if<double>(&_data)) {
                return *number;
            }
            throw _kind_error(value_kind::floating);
        }

        // Gets the elements. Throws value_constraint_error if this isn't a list.
        [[nodiscard]]
        list const& as_list() const {
            if (auto const elements = std::get_if<list>(&_data)) {
                return *elements;
            }
            throw _kind_error(value_kind::list);
        }

        // Gets the elements. Throws value_constraint_error if this isn't a list.
        [[nodiscard]]
        list& as_list() {
            if (auto const elements = std::get_if<list>(&_data)) {
                return *elements;
            }
            throw _kind_error(value_kind::list);
        }

        // Gets the nested struct. Throws value_constraint_error if this isn't a struct.
        [[nodiscard]]
        struct_instance const& as_struct() const {
            if (auto const instance = std::get_if<struct_instance>(&_data)) {
                return *instance;
            }
            throw _kind_error(value_kind::structure);
        }

        // Gets the nested struct. Throws value_constraint_error if this isn't a struct.
        [[nodiscard]]
        struct_instance& as_struct() {
            if (auto const instance = std::get_if<struct_instance>(&_data)) {
                return *instance;
            }
            throw _kind_error(value_kind::structure);
        }

        // Structural equality. Lists and structs compare element by element, in order.
        // Floating point values compare by bit pattern: NaN equals itself, 0.0 and -0.0 differ.
        [[nodiscard]]
        friend bool operator==(value const& lhs, value const& rhs) {
            auto const lhs_number = std::get_if<double>(&lhs._data);
            auto const rhs_number = std::get_if<double>(&rhs._data);
            if (lhs_number && rhs_number) {
                return std::bit_cast<std::uint64_t>(*lhs_number) == std::bit_cast<std::uint64_t>(*rhs_number);
            }
            return lhs._data == rhs._data;
        }

        // Human readable representation, e.g. "[1, 2, 3]" or "{a: 1, b: -2}".
        friend std::string to_string(value const& v);

    private:
        using _storage = std::variant<std::uint64_t, std::int64_t, double, list, struct_instance>;

        // Non-negative integers are always stored as std::uint64_t, negative integers as std::int64_t.
        _storage _data;

        template<std::integral I>
        [[nodiscard]]
        static _storage _normalise(I const number) noexcept {
            if constexpr (std::signed_integral<I>) {
                if (number < 0) {
                    return static_cast<std::int64_t>(number);
                }
            }
            return static_cast<std::uint64_t>(number);
        }

        [[nodiscard]]
        value_constraint_error _kind_error(value_kind const expected) const {
            return value_constraint_error{
                fmt::format("Expected a value of kind {} but got {}", to_string(expected), to_string(kind()))};
        }
    };

}


template<>
struct fmt::formatter<structpp::value> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(structpp::value const& v, FormatContext& context) const {
        return fmt::formatter<std::string_view>::format(to_string(v), context);
    }
};
