#pragma once

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "common.hpp"
#include "formatter.hpp"
#include "instance.hpp"
#include "settings.hpp"
#include "utility.hpp"
#include "value.hpp"


namespace structpp {

    namespace detail {

        // Writes the low size bytes of number into buffer at offset, in the given byte order.
        inline void write_unsigned(mutable_bytes_span const buffer, std::size_t const offset, std::size_t const size,
                std::uint64_t number, endian const order) noexcept {
            auto const fixed_buffer = buffer.subspan(offset, size);
            for (std::size_t i = 0; i < size; ++i) {
                auto const index = concrete(order) == endian::little ? i : size - 1 - i;
                fixed_buffer[index] = static_cast<std::byte>(number & 0xFFu);
                number >>= 8;
            }
        }

        // Reads size bytes from buffer at offset as an unsigned integer in the given byte order.
        [[nodiscard]]
        inline std::uint64_t read_unsigned(const_bytes_span const buffer, std::size_t const offset,
                std::size_t const size, endian const order) noexcept {
            auto const fixed_buffer = buffer.subspan(offset, size);
            std::uint64_t number = 0;
            for (std::size_t i = 0; i < size; ++i) {
                auto const index = concrete(order) == endian::little ? i : size - 1 - i;
                number |= std::to_integer<std::uint64_t>(fixed_buffer[index]) << (i * 8);
            }
            return number;
        }

    }


    /*
        Integers:
            Represented with two's complement (signed) or plain binary (unsigned) in exactly bits / 8 bytes, in the
            resolved byte order.
    */

    class integer_formatter final : public formatter {
    public:
        // bits must be 8, 16, 32 or 64, otherwise definition_error is thrown.
        // Throws value_constraint_error if default_value is out of range.
        integer_formatter(std::size_t const bits, bool const is_signed, value default_value = 0) :
            _bits{bits}, _signed{is_signed}, _default{std::move(default_value)}
        {
            if (bits != 8 && bits != 16 && bits != 32 && bits != 64) {
                throw definition_error{fmt::format("Unsupported integer width of {} bits", bits)};
            }
            validate(_default);
        }

        [[nodiscard]]
        std::size_t bits() const noexcept {
            return _bits;
        }

        [[nodiscard]]
        bool is_signed() const noexcept {
            return _signed;
        }

        [[nodiscard]]
        std::string name() const override {
            return fmt::format("{}int{}", _signed ? "" : "u", _bits);
        }

        [[nodiscard]]
        value const& default_value() const noexcept override {
            return _default;
        }

        void validate(value const& v) const override {
            if (!v.is_integer()) {
                throw value_constraint_error{
                    fmt::format("{} field requires an integer, got a {}", name(), to_string(v.kind()))};
            }
            bool in_range;
            if (v.is_negative()) {
                in_range = _signed && v.as<std::int64_t>() >= _min_signed();
            }
            else {
                in_range = v.as<std::uint64_t>() <= (_signed ? _max_signed() : _max_unsigned());
            }
            if (!in_range) {
                throw value_constraint_error{fmt::format("Value {} does not fit in a {} field", to_string(v), name())};
            }
        }

    protected:
        [[nodiscard]]
        std::size_t _length(value const&) const override {
            return _bits / 8;
        }

        void _serialise(value const& v, mutable_bytes_span const buffer, std::size_t const offset,
                field_context const& context) const override {
            auto const raw = v.is_negative()
                ? static_cast<std::uint64_t>(v.as<std::int64_t>())
                : v.as<std::uint64_t>();
            detail::write_unsigned(buffer, offset, _bits / 8, raw, context.order);
        }

        [[nodiscard]]
        decode_result _deserialise(const_bytes_span const buffer, std::size_t const offset,
                field_context const& context) const override {
            auto const size = _bits / 8;
            detail::check_buffer_size(buffer, offset, size, name());
            auto raw = detail::read_unsigned(buffer, offset, size, context.order);
            if (!_signed) {
                return {value{raw}, size};
            }
            // Sign extend.
            if (_bits < 64 && (raw >> (_bits - 1)) & 1u) {
                raw |= ~std::uint64_t{0} << _bits;
            }
            return {value{static_cast<std::int64_t>(raw)}, size};
        }

    private:
        std::size_t _bits;
        bool _signed;
        value _default;

        [[nodiscard]]
        std::int64_t _min_signed() const noexcept {
            return _bits == 64 ? std::numeric_limits<std::int64_t>::min() : -(std::int64_t{1} << (_bits - 1));
        }

        [[nodiscard]]
        std::uint64_t _max_signed() const noexcept {
            return (std::uint64_t{1} << (_bits - 1)) - 1;
        }

        [[nodiscard]]
        std::uint64_t _max_unsigned() const noexcept {
            return _bits == 64 ? std::numeric_limits<std::uint64_t>::max() : (std::uint64_t{1} << _bits) - 1;
        }
    };


    using integer_formatter_ptr = std::shared_ptr<integer_formatter const>;


    [[nodiscard]]
    inline integer_formatter_ptr uint8(value default_value = 0) {
        return std::make_shared<integer_formatter const>(8, false, std::move(default_value));
    }

    [[nodiscard]]
    inline integer_formatter_ptr uint16(value default_value = 0) {
        return std::make_shared<integer_formatter const>(16, false, std::move(default_value));
    }

    [[nodiscard]]
    inline integer_formatter_ptr uint32(value default_value = 0) {
        return std::make_shared<integer_formatter const>(32, false, std::move(default_value));
    }

    [[nodiscard]]
    inline integer_formatter_ptr uint64(value default_value = 0) {
        return std::make_shared<integer_formatter const>(64, false, std::move(default_value));
    }

    [[nodiscard]]
    inline integer_formatter_ptr int8(value default_value = 0) {
        return std::make_shared<integer_formatter const>(8, true, std::move(default_value));
    }

    [[nodiscard]]
    inline integer_formatter_ptr int16(value default_value = 0) {
        return std::make_shared<integer_formatter const>(16, true, std::move(default_value));
    }

    [[nodiscard]]
    inline integer_formatter_ptr int32(value default_value = 0) {
        return std::make_shared<integer_formatter const>(32, true, std::move(default_value));
    }

    [[nodiscard]]
    inline integer_formatter_ptr int64(value default_value = 0) {
        return std::make_shared<integer_formatter const>(64, true, std::move(default_value));
    }


    /*
        Floating point numbers:
            Represented in IEEE-754 binary format, with the byte order of the same-width unsigned integer.
            float32 is 4 bytes, float64 is 8 bytes.
    */

    static_assert(std::numeric_limits<float>::is_iec559 && sizeof(float) == 4);
    static_assert(std::numeric_limits<double>::is_iec559 && sizeof(double) == 8);

    class floating_formatter final : public formatter {
    public:
        // bits must be 32 or 64, otherwise definition_error is thrown.
        floating_formatter(std::size_t const bits, value default_value = 0.0) :
            _bits{bits}, _default{std::move(default_value)}
        {
            if (bits != 32 && bits != 64) {
                throw definition_error{fmt::format("Unsupported floating point width of {} bits", bits)};
            }
            validate(_default);
        }

        [[nodiscard]]
        std::string name() const override {
            return fmt::format("float{}", _bits);
        }

        [[nodiscard]]
        value const& default_value() const noexcept override {
            return _default;
        }

        void validate(value const& v) const override {
            if (v.kind() != value_kind::floating) {
                throw value_constraint_error{
                    fmt::format("{} field requires a floating point value, got a {}", name(), to_string(v.kind()))};
            }
            auto const number = v.as_floating();
            // A float32 field only accepts values it can hold exactly.
            if (_bits == 32 && std::isfinite(number) && (std::abs(number) > std::numeric_limits<float>::max()
                    || static_cast<double>(static_cast<float>(number)) != number)) {
                throw value_constraint_error{
                    fmt::format("Value {} is not representable by a {} field", number, name())};
            }
        }

    protected:
        [[nodiscard]]
        std::size_t _length(value const&) const override {
            return _bits / 8;
        }

        void _serialise(value const& v, mutable_bytes_span const buffer, std::size_t const offset,
                field_context const& context) const override {
            auto const number = v.as_floating();
            std::uint64_t const raw = _bits == 32
                ? std::bit_cast<std::uint32_t>(static_cast<float>(number))
                : std::bit_cast<std::uint64_t>(number);
            detail::write_unsigned(buffer, offset, _bits / 8, raw, context.order);
        }

        [[nodiscard]]
        decode_result _deserialise(const_bytes_span const buffer, std::size_t const offset,
                field_context const& context) const override {
            auto const size = _bits / 8;
            detail::check_buffer_size(buffer, offset, size, name());
            auto const raw = detail::read_unsigned(buffer, offset, size, context.order);
            if (_bits == 32) {
                return {value{std::bit_cast<float>(static_cast<std::uint32_t>(raw))}, size};
            }
            else {
                return {value{std::bit_cast<double>(raw)}, size};
            }
        }

    private:
        std::size_t _bits;
        value _default;
    };


    [[nodiscard]]
    inline formatter_ptr float32(value default_value = 0.0) {
        return std::make_shared<floating_formatter const>(32, std::move(default_value));
    }

    [[nodiscard]]
    inline formatter_ptr float64(value default_value = 0.0) {
        return std::make_shared<floating_formatter const>(64, std::move(default_value));
    }


    /*
        Enumerations:
            A closed set of named integer literals, represented by an underlying integer formatter.
    */

    struct enum_literal {
        std::string name;
        value number;
    };


    class enum_formatter final : public formatter {
    public:
        // literals must be non-empty, with unique names, and each value must fit in underlying.
        // If default_value is not given, the first literal is the default.
        enum_formatter(std::vector<enum_literal> literals, integer_formatter_ptr underlying,
                std::optional<value> default_value = std::nullopt) :
            _literals{std::move(literals)}, _underlying{std::move(underlying)}, _default{}
        {
            if (!_underlying) {
                throw definition_error{"Enum requires an underlying integer formatter"};
            }
            if (_literals.empty()) {
                throw definition_error{"Enum requires at least one literal"};
            }
            for (auto it = _literals.cbegin(); it != _literals.cend(); ++it) {
                if (std::any_of(_literals.cbegin(), it, [it](enum_literal const& l) { return l.name == it->name; })) {
                    throw definition_error{fmt::format("Duplicate enum literal name \"{}\"", it->name)};
                }
                try {
                    _underlying->validate(it->number);
                }
                catch (value_constraint_error const& e) {
                    throw definition_error{fmt::format("Enum literal \"{}\" is invalid: {}", it->name, e.what())};
                }
            }
            _default = default_value ? std::move(*default_value) : _literals.front().number;
            validate(_default);
        }

        [[nodiscard]]
        std::vector<enum_literal> const& literals() const noexcept {
            return _literals;
        }

        // Gets the value of a literal by name. Throws std::out_of_range if there is no such literal.
        [[nodiscard]]
        value const& literal(std::string_view const literal_name) const {
            auto const it = std::ranges::find(_literals, literal_name, &enum_literal::name);
            if (it == _literals.cend()) {
                throw std::out_of_range{fmt::format("No enum literal named \"{}\"", literal_name)};
            }
            return it->number;
        }

        // Gets the name of the literal with value v, if any.
        [[nodiscard]]
        std::optional<std::string_view> name_of(value const& v) const {
            auto const it = std::ranges::find(_literals, v, &enum_literal::number);
            if (it == _literals.cend()) {
                return std::nullopt;
            }
            return it->name;
        }

        [[nodiscard]]
        std::string name() const override {
            return fmt::format("enum<{}>", _underlying->name());
        }

        [[nodiscard]]
        value const& default_value() const noexcept override {
            return _default;
        }

        void validate(value const& v) const override {
            _underlying->validate(v);
            if (!name_of(v)) {
                throw value_constraint_error{fmt::format("Value {} is not a literal of {}", to_string(v), name())};
            }
        }

    protected:
        [[nodiscard]]
        std::size_t _length(value const& v) const override {
            return _underlying->length(v);
        }

        void _serialise(value const& v, mutable_bytes_span const buffer, std::size_t const offset,
                field_context const& context) const override {
            _underlying->serialise(v, buffer, offset, context);
        }

        [[nodiscard]]
        decode_result _deserialise(const_bytes_span const buffer, std::size_t const offset,
                field_context const& context) const override {
            return _underlying->deserialise(buffer, offset, context);
        }

    private:
        std::vector<enum_literal> _literals;
        integer_formatter_ptr _underlying;
        value _default;
    };


    [[nodiscard]]
    inline formatter_ptr enumeration(std::vector<enum_literal> literals, integer_formatter_ptr underlying = uint32(),
            std::optional<value> default_value = std::nullopt) {
        return std::make_shared<enum_formatter const>(std::move(literals), std::move(underlying),
            std::move(default_value));
    }

}
