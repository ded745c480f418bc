#pragma once

#include <algorithm>
#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "common.hpp"
#include "formatter.hpp"
#include "log.hpp"
#include "settings.hpp"


namespace structpp {

    /*
        Struct:
            Represented as the result of contiguously serialising each field of the struct, in declaration order, with
            no padding.
    */


    // A named field, as passed to struct_definition::create().
    struct field {
        std::string name;
        formatter_ptr format;
    };


    // A field of a validated struct_definition.
    struct field_spec {
        std::string name;
        formatter_ptr format;
        std::size_t index;      // Position in declaration order.
    };


    // Ordered, immutable schema of named fields.
    // Instances are only created through create(), which validates the layout, and are always shared.
    // auto const simple = struct_definition::create("simple", {
    //     {"b", uint8(0xDE)},
    //     {"a", uint16(0xCAFE)},
    //     {"x", uint8(0xAD)}
    // });
    class struct_definition {
    public:
        // Validates the fields and creates a definition.
        // Throws definition_error if a field has an empty or duplicate name or no formatter, if there is more than one
        // variable-length field, or if a variable-length field is not the last field.
        [[nodiscard]]
        static std::shared_ptr<struct_definition const> create(std::string name, std::vector<field> fields,
                settings struct_settings = {}) {
            std::vector<field_spec> specs;
            specs.reserve(fields.size());
            try {
                for (auto& f : fields) {
                    _check_field(name, specs, f);
                    specs.push_back(field_spec{std::move(f.name), std::move(f.format), specs.size()});
                }
            }
            catch (definition_error const& e) {
                logger().debug("Rejected struct definition \"{}\": {}", name, e.what());
                throw;
            }

            std::shared_ptr<struct_definition const> definition{
                new struct_definition{std::move(name), std::move(specs), struct_settings}};
            logger().debug("Defined struct \"{}\" with {} fields, minimum length {}", definition->name(),
                definition->size(), definition->min_length());
            return definition;
        }

        struct_definition(struct_definition const&) = delete;
        struct_definition& operator=(struct_definition const&) = delete;

        [[nodiscard]]
        std::string const& name() const noexcept {
            return _name;
        }

        [[nodiscard]]
        std::span<field_spec const> fields() const noexcept {
            return _fields;
        }

        // Number of fields.
        [[nodiscard]]
        std::size_t size() const noexcept {
            return _fields.size();
        }

        // Gets a field by declaration index. Throws std::out_of_range if index is out of bounds.
        [[nodiscard]]
        field_spec const& at(std::size_t const index) const {
            if (index < _fields.size()) {
                return _fields[index];
            }
            else {
                throw std::out_of_range{
                    fmt::format("index {} is out of bounds for struct \"{}\" with {} fields", index, _name,
                        _fields.size())};
            }
        }

        // Finds the declaration index of a field by name.
        [[nodiscard]]
        std::optional<std::size_t> find(std::string_view const field_name) const noexcept {
            auto const it = std::ranges::find(_fields, field_name, &field_spec::name);
            if (it == _fields.cend()) {
                return std::nullopt;
            }
            return it->index;
        }

        // Gets the declaration index of a field by name. Throws std::out_of_range if there is no such field.
        [[nodiscard]]
        std::size_t index_of(std::string_view const field_name) const {
            if (auto const index = find(field_name)) {
                return *index;
            }
            throw std::out_of_range{fmt::format("Struct \"{}\" has no field named \"{}\"", _name, field_name)};
        }

        // Settings declared for this struct, overriding the settings_context defaults.
        [[nodiscard]]
        settings const& struct_settings() const noexcept {
            return _settings;
        }

        // True if the last field is variable-length.
        [[nodiscard]]
        bool variable_length() const noexcept {
            return !_fields.empty() && _fields.back().format->variable_length();
        }

        // Smallest number of bytes an instance serialises to.
        [[nodiscard]]
        std::size_t min_length() const {
            std::size_t length = 0;
            for (auto const& f : _fields) {
                length += f.format->min_length();
            }
            return length;
        }

    private:
        std::string _name;
        std::vector<field_spec> _fields;
        settings _settings;

        struct_definition(std::string name, std::vector<field_spec> fields, settings const struct_settings) noexcept :
            _name{std::move(name)}, _fields{std::move(fields)}, _settings{struct_settings}
        {}

        // Checks that next may follow previous in struct name.
        static void _check_field(std::string_view const name, std::vector<field_spec> const& previous,
                field const& next) {
            if (next.name.empty()) {
                throw definition_error{fmt::format("Field {} of struct \"{}\" has no name", previous.size(), name)};
            }
            if (!next.format) {
                throw definition_error{fmt::format("Field \"{}\" of struct \"{}\" has no formatter", next.name, name)};
            }
            if (std::ranges::find(previous, next.name, &field_spec::name) != previous.cend()) {
                throw definition_error{fmt::format("Duplicate field \"{}\" in struct \"{}\"", next.name, name)};
            }
            // Only the last field may be variable-length, so nothing may follow one. Earlier fields were checked
            // the same way, so previous.back() is the only variable-length field so far.
            if (!previous.empty() && previous.back().format->variable_length()) {
                if (next.format->variable_length()) {
                    throw definition_error{fmt::format(
                        "Struct \"{}\" has more than one variable-length field (\"{}\" and \"{}\")", name,
                        previous.back().name, next.name)};
                }
                throw definition_error{fmt::format(
                    "Variable-length field \"{}\" must be the last field of struct \"{}\", but is followed by \"{}\"",
                    previous.back().name, name, next.name)};
            }
        }
    };


    using struct_definition_ptr = std::shared_ptr<struct_definition const>;

}
