#pragma once

#include <cassert>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include "common.hpp"
#include "formatter.hpp"
#include "log.hpp"
#include "settings.hpp"
#include "struct.hpp"
#include "utility.hpp"
#include "value.hpp"


namespace structpp {

    namespace detail {

        // The concrete byte order for a struct, given the per-call overrides and the active settings_context.
        [[nodiscard]]
        inline endian effective_byte_order(struct_definition const& definition, settings const& overrides) {
            auto const effective = resolve(overrides, definition.struct_settings(), settings_context::current());
            // The root settings frame always sets a byte order.
            assert(effective.byte_order);
            return concrete(*effective.byte_order);
        }

    }


    inline struct_instance::struct_instance(std::shared_ptr<struct_definition const> definition) :
        _definition{std::move(definition)}, _values{}
    {
        assert(_definition);
        _values.reserve(_definition->size());
        for (auto const& f : _definition->fields()) {
            _values.push_back(f.format->default_value());
        }
    }

    inline struct_instance::struct_instance(std::shared_ptr<struct_definition const> definition,
            std::vector<value> values) noexcept :
        _definition{std::move(definition)}, _values(std::move(values))
    {}


    inline value const& struct_instance::get(std::string_view const name) const {
        return _values[_definition->index_of(name)];
    }

    inline value const& struct_instance::get(std::size_t const index) const {
        return _values[_definition->at(index).index];
    }


    inline void struct_instance::set(std::string_view const name, value new_value) {
        auto const& f = _definition->at(_definition->index_of(name));
        try {
            f.format->validate(new_value);
        }
        catch (value_constraint_error const& e) {
            throw value_constraint_error{
                fmt::format("Invalid value for field \"{}\" of struct \"{}\": {}", f.name, _definition->name(),
                    e.what())};
        }
        _values[f.index] = std::move(new_value);
    }

    inline struct_instance struct_instance::with(std::string_view const name, value new_value) const {
        auto copy = *this;
        copy.set(name, std::move(new_value));
        return copy;
    }


    inline std::size_t struct_instance::length() const {
        std::size_t length = 0;
        for (auto const& f : _definition->fields()) {
            length += f.format->length(_values[f.index]);
        }
        return length;
    }


    inline bytes struct_instance::serialise(settings const& overrides) const {
        auto const order = detail::effective_byte_order(*_definition, overrides);
        bytes buffer(length());
        serialise(buffer, 0, order, overrides);
        logger().trace("Serialised struct \"{}\" to {} bytes, {} endian", _definition->name(), buffer.size(),
            to_string(order));
        return buffer;
    }

    inline void struct_instance::serialise(mutable_bytes_span const buffer, std::size_t offset, endian const order,
            settings const& overrides) const {
        field_context const context{order, overrides};
        for (auto const& f : _definition->fields()) {
            auto const& field_value = _values[f.index];
            f.format->serialise(field_value, buffer, offset, context);
            offset += f.format->length(field_value);
        }
    }


    inline struct_instance struct_instance::deserialise(std::shared_ptr<struct_definition const> definition,
            const_bytes_span const buffer, settings const& overrides) {
        assert(definition);
        auto const order = detail::effective_byte_order(*definition, overrides);
        auto [instance, consumed] = deserialise(std::move(definition), buffer, 0, order, overrides);
        // Bytes after a fixed-length struct are not an error.
        if (consumed < buffer.size()) {
            logger().debug("Ignored {} trailing bytes after struct \"{}\"", buffer.size() - consumed,
                instance.definition().name());
        }
        logger().trace("Deserialised struct \"{}\" from {} bytes, {} endian", instance.definition().name(), consumed,
            to_string(order));
        return std::move(instance);
    }

    inline std::pair<struct_instance, std::size_t> struct_instance::deserialise(
            std::shared_ptr<struct_definition const> definition, const_bytes_span const buffer,
            std::size_t const offset, endian const order, settings const& overrides) {
        field_context const context{order, overrides};
        std::vector<value> values;
        values.reserve(definition->size());
        auto position = offset;
        for (auto const& f : definition->fields()) {
            auto [field_value, consumed] = f.format->deserialise(buffer, position, context);
            values.push_back(std::move(field_value));
            position += consumed;
        }
        return {struct_instance{std::move(definition), std::move(values)}, position - offset};
    }


    [[nodiscard]]
    inline bool operator==(struct_instance const& lhs, struct_instance const& rhs) {
        return lhs._definition == rhs._definition && lhs._values == rhs._values;
    }


    // Human readable representation, e.g. "simple{b: 222, a: 51966, x: 173}".
    [[nodiscard]]
    inline std::string to_string(struct_instance const& instance) {
        auto const& definition = instance.definition();
        std::string result = definition.name() + "{";
        for (auto const& f : definition.fields()) {
            if (f.index > 0) {
                result += ", ";
            }
            result += fmt::format("{}: {}", f.name, to_string(instance.get(f.index)));
        }
        return result + "}";
    }


    [[nodiscard]]
    inline std::string to_string(value const& v) {
        return std::visit(detail::overloaded{
            [](std::uint64_t const number) {
                return fmt::format("{}", number);
            },
            [](std::int64_t const number) {
                return fmt::format("{}", number);
            },
            [](double const number) {
                return fmt::format("{}", number);
            },
            [](value::list const& elements) {
                std::string result = "[";
                for (std::size_t i = 0; i < elements.size(); ++i) {
                    if (i > 0) {
                        result += ", ";
                    }
                    result += to_string(elements[i]);
                }
                return result + "]";
            },
            [](struct_instance const& instance) {
                return to_string(instance);
            }
        }, v._data);
    }

}
