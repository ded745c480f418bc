#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "common.hpp"
#include "formatter.hpp"
#include "instance.hpp"
#include "settings.hpp"
#include "struct.hpp"
#include "value.hpp"


namespace structpp {

    /*
        Nested struct:
            Represented as the serialisation of the inner struct instance, inline.
            The inner struct inherits the enclosing byte order, unless it declares its own. Per-call overrides still
            take precedence over the inner struct's settings.
    */

    class nested_struct_formatter final : public formatter {
    public:
        // If default_value isn't given, the default is an instance with all fields at their defaults.
        explicit nested_struct_formatter(struct_definition_ptr definition,
                std::optional<value> default_value = std::nullopt) :
            _definition{std::move(definition)}, _default{}
        {
            if (!_definition) {
                throw definition_error{"Nested struct requires a definition"};
            }
            if (default_value) {
                _default = std::move(*default_value);
            }
            else {
                _default = struct_instance{_definition};
            }
            validate(_default);
        }

        [[nodiscard]]
        struct_definition_ptr const& definition() const noexcept {
            return _definition;
        }

        [[nodiscard]]
        std::string name() const override {
            return _definition->name();
        }

        [[nodiscard]]
        value const& default_value() const noexcept override {
            return _default;
        }

        // Values must be instances of exactly this definition. Their fields are valid by construction.
        void validate(value const& v) const override {
            if (v.kind() != value_kind::structure) {
                throw value_constraint_error{
                    fmt::format("{} field requires a struct, got a {}", name(), to_string(v.kind()))};
            }
            auto const& instance = v.as_struct();
            if (instance.definition_ptr() != _definition) {
                throw value_constraint_error{fmt::format("{} field requires a {} instance, got a {} instance", name(),
                    _definition->name(), instance.definition().name())};
            }
        }

        [[nodiscard]]
        bool variable_length() const noexcept override {
            return _definition->variable_length();
        }

        [[nodiscard]]
        std::size_t min_length() const override {
            return _definition->min_length();
        }

    protected:
        [[nodiscard]]
        std::size_t _length(value const& v) const override {
            return v.as_struct().length();
        }

        void _serialise(value const& v, mutable_bytes_span const buffer, std::size_t const offset,
                field_context const& context) const override {
            v.as_struct().serialise(buffer, offset, _inner_order(context), context.overrides);
        }

        [[nodiscard]]
        decode_result _deserialise(const_bytes_span const buffer, std::size_t const offset,
                field_context const& context) const override {
            auto [instance, consumed] = struct_instance::deserialise(_definition, buffer, offset,
                _inner_order(context), context.overrides);
            return {value{std::move(instance)}, consumed};
        }

    private:
        struct_definition_ptr _definition;
        value _default;

        [[nodiscard]]
        endian _inner_order(field_context const& context) const {
            auto const inner = resolve(context.overrides, _definition->struct_settings(), settings{context.order});
            return concrete(inner.byte_order.value_or(context.order));
        }
    };


    [[nodiscard]]
    inline formatter_ptr nested(struct_definition_ptr definition, std::optional<value> default_value = std::nullopt) {
        return std::make_shared<nested_struct_formatter const>(std::move(definition), std::move(default_value));
    }

}
