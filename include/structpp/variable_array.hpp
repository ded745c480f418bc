#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "common.hpp"
#include "formatter.hpp"
#include "scalar.hpp"
#include "value.hpp"


namespace structpp {

    /*
        Variable array:
            Represented as the result of contiguously serialising each element, with no element count. The number of
            elements is therefore only known from the number of bytes available, so a variable array must be the last
            field of its struct, and consumes all remaining bytes when deserialised.
    */

    class variable_array_formatter final : public formatter {
    public:
        // Elements must be fixed-length and non-empty, and min_count must be <= max_count.
        // If default_value isn't given, the default is min_count elements with the element formatter's default.
        variable_array_formatter(std::size_t const min_count, std::size_t const max_count, formatter_ptr element,
                std::optional<value> default_value = std::nullopt) :
            _min_count{min_count}, _max_count{max_count}, _element{std::move(element)}, _default{}
        {
            if (_min_count > _max_count) {
                throw definition_error{
                    fmt::format("Variable array minimum count {} exceeds maximum count {}", _min_count, _max_count)};
            }
            if (!_element) {
                throw definition_error{"Variable array requires an element formatter"};
            }
            if (_element->variable_length()) {
                throw definition_error{
                    fmt::format("Variable array element {} must not be variable-length", _element->name())};
            }
            if (_element->length() == 0) {
                throw definition_error{fmt::format("Variable array element {} has zero length", _element->name())};
            }
            if (default_value) {
                _default = std::move(*default_value);
            }
            else {
                _default = value::list(_min_count, _element->default_value());
            }
            validate(_default);
        }

        [[nodiscard]]
        std::size_t min_count() const noexcept {
            return _min_count;
        }

        [[nodiscard]]
        std::size_t max_count() const noexcept {
            return _max_count;
        }

        [[nodiscard]]
        formatter_ptr const& element() const noexcept {
            return _element;
        }

        [[nodiscard]]
        std::string name() const override {
            return fmt::format("{}[{}..{}]", _element->name(), _min_count, _max_count);
        }

        [[nodiscard]]
        value const& default_value() const noexcept override {
            return _default;
        }

        void validate(value const& v) const override {
            if (v.kind() != value_kind::list) {
                throw value_constraint_error{
                    fmt::format("{} field requires a list, got a {}", name(), to_string(v.kind()))};
            }
            auto const& elements = v.as_list();
            _check_count(elements.size());
            for (std::size_t i = 0; i < elements.size(); ++i) {
                try {
                    _element->validate(elements[i]);
                }
                catch (value_constraint_error const& e) {
                    throw value_constraint_error{fmt::format("Element {} of {}: {}", i, name(), e.what())};
                }
            }
        }

        [[nodiscard]]
        bool variable_length() const noexcept override {
            return true;
        }

        [[nodiscard]]
        std::size_t min_length() const override {
            return _element->length() * _min_count;
        }

    protected:
        // Elements are fixed-length, so this is element length * element count.
        [[nodiscard]]
        std::size_t _length(value const& v) const override {
            return _element->length() * v.as_list().size();
        }

        void _serialise(value const& v, mutable_bytes_span const buffer, std::size_t offset,
                field_context const& context) const override {
            auto const element_length = _element->length();
            for (auto const& element : v.as_list()) {
                _element->serialise(element, buffer, offset, context);
                offset += element_length;
            }
        }

        // Consumes everything from offset to the end of buffer.
        [[nodiscard]]
        decode_result _deserialise(const_bytes_span const buffer, std::size_t const offset,
                field_context const& context) const override {
            detail::check_buffer_size(buffer, offset, 0, name());
            auto const remaining = buffer.size() - offset;
            auto const element_length = _element->length();
            if (remaining % element_length != 0) {
                throw insufficient_data_error{
                    fmt::format("{} bytes remaining for {} is not a multiple of the element length {}", remaining,
                        name(), element_length)};
            }
            auto const count = remaining / element_length;
            _check_count(count);

            value::list elements;
            elements.reserve(count);
            auto position = offset;
            for (std::size_t i = 0; i < count; ++i) {
                auto [element, consumed] = _element->deserialise(buffer, position, context);
                elements.push_back(std::move(element));
                position += consumed;
            }
            return {value{std::move(elements)}, remaining};
        }

    private:
        std::size_t _min_count;
        std::size_t _max_count;
        formatter_ptr _element;
        value _default;

        void _check_count(std::size_t const count) const {
            if (count < _min_count || count > _max_count) {
                throw value_constraint_error{
                    fmt::format("{} field requires between {} and {} elements, got {}", name(), _min_count,
                        _max_count, count)};
            }
        }
    };


    // Variable array of bytes by default.
    [[nodiscard]]
    inline formatter_ptr variable_array(std::size_t const min_count, std::size_t const max_count,
            formatter_ptr element = uint8(), std::optional<value> default_value = std::nullopt) {
        return std::make_shared<variable_array_formatter const>(min_count, max_count, std::move(element),
            std::move(default_value));
    }

}
