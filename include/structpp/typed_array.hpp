#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "common.hpp"
#include "formatter.hpp"
#include "nested.hpp"
#include "struct.hpp"
#include "value.hpp"


namespace structpp {

    /*
        Typed array:
            Represented as the result of contiguously serialising each element, in index order, with no separators
            and no element count.
    */

    class typed_array_formatter final : public formatter {
    public:
        // element must not be variable-length. If default_value isn't given, every element has the element
        // formatter's default.
        typed_array_formatter(std::size_t const count, formatter_ptr element,
                std::optional<value> default_value = std::nullopt) :
            _count{count}, _element{std::move(element)}, _default{}
        {
            if (!_element) {
                throw definition_error{"Typed array requires an element formatter"};
            }
            if (_element->variable_length()) {
                throw definition_error{
                    fmt::format("Typed array element {} must not be variable-length", _element->name())};
            }
            if (default_value) {
                _default = std::move(*default_value);
            }
            else {
                _default = value::list(_count, _element->default_value());
            }
            validate(_default);
        }

        [[nodiscard]]
        std::size_t count() const noexcept {
            return _count;
        }

        [[nodiscard]]
        formatter_ptr const& element() const noexcept {
            return _element;
        }

        [[nodiscard]]
        std::string name() const override {
            return fmt::format("{}[{}]", _element->name(), _count);
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
            if (elements.size() != _count) {
                throw value_constraint_error{
                    fmt::format("{} field requires exactly {} elements, got {}", name(), _count, elements.size())};
            }
            for (std::size_t i = 0; i < elements.size(); ++i) {
                try {
                    _element->validate(elements[i]);
                }
                catch (value_constraint_error const& e) {
                    throw value_constraint_error{fmt::format("Element {} of {}: {}", i, name(), e.what())};
                }
            }
        }

    protected:
        [[nodiscard]]
        std::size_t _length(value const& v) const override {
            std::size_t length = 0;
            for (auto const& element : v.as_list()) {
                length += _element->length(element);
            }
            return length;
        }

        void _serialise(value const& v, mutable_bytes_span const buffer, std::size_t offset,
                field_context const& context) const override {
            for (auto const& element : v.as_list()) {
                _element->serialise(element, buffer, offset, context);
                offset += _element->length(element);
            }
        }

        [[nodiscard]]
        decode_result _deserialise(const_bytes_span const buffer, std::size_t const offset,
                field_context const& context) const override {
            value::list elements;
            elements.reserve(_count);
            auto position = offset;
            for (std::size_t i = 0; i < _count; ++i) {
                auto [element, consumed] = _element->deserialise(buffer, position, context);
                elements.push_back(std::move(element));
                position += consumed;
            }
            return {value{std::move(elements)}, position - offset};
        }

    private:
        std::size_t _count;
        formatter_ptr _element;
        value _default;
    };


    [[nodiscard]]
    inline formatter_ptr typed_array(std::size_t const count, formatter_ptr element,
            std::optional<value> default_value = std::nullopt) {
        return std::make_shared<typed_array_formatter const>(count, std::move(element), std::move(default_value));
    }

    // Array of nested structs.
    [[nodiscard]]
    inline formatter_ptr typed_array(std::size_t const count, struct_definition_ptr element,
            std::optional<value> default_value = std::nullopt) {
        return typed_array(count, nested(std::move(element)), std::move(default_value));
    }

}
