#pragma once

#include <cassert>
#include <cstddef>
#include <memory>
#include <string>

#include "common.hpp"
#include "settings.hpp"
#include "value.hpp"


namespace structpp {

    // Settings in effect while a field is serialised or deserialised.
    struct field_context {
        endian order;           // Concrete byte order, never endian::native.
        settings overrides;     // Per-call overrides, reapplied by nested structs over their own struct-level settings.
    };


    struct decode_result {
        value result;
        std::size_t consumed;   // Number of bytes read from the buffer.
    };


    /*
        Formatter:
            Describes the binary representation of one struct field: its byte length, default value, value domain,
            and how values are converted to and from bytes.
            Formatters are immutable once constructed and are shared between definitions via formatter_ptr.
    */

    class formatter {
    public:
        virtual ~formatter() = default;

        // Short description of the field type, e.g. "uint16" or "uint8[3]".
        [[nodiscard]]
        virtual std::string name() const = 0;

        // The value a field has when an instance is created.
        [[nodiscard]]
        virtual value const& default_value() const noexcept = 0;

        // Checks that v is in the domain of this formatter. Throws value_constraint_error if not.
        virtual void validate(value const& v) const = 0;

        // True if the encoded length depends on the value. Such a field can only be the last field of a struct.
        [[nodiscard]]
        virtual bool variable_length() const noexcept {
            return false;
        }

        // Number of bytes in the encoding of v. v must be valid.
        [[nodiscard]]
        std::size_t length(value const& v) const {
            return _length(v);
        }

        // Number of bytes in the encoding of the default value.
        [[nodiscard]]
        std::size_t length() const {
            return _length(default_value());
        }

        // Smallest number of bytes any valid value encodes to.
        [[nodiscard]]
        virtual std::size_t min_length() const {
            return length();
        }

        // Writes the encoding of v into buffer at offset. v must be valid.
        // The caller must ensure (offset + length(v)) <= buffer.size().
        void serialise(value const& v, mutable_bytes_span const buffer, std::size_t const offset,
                field_context const& context) const {
            assert(offset <= buffer.size() && buffer.size() - offset >= _length(v));
            _serialise(v, buffer, offset, context);
        }

        // Reads a value from buffer at offset.
        // Throws insufficient_data_error if the buffer is too small, or value_constraint_error if the decoded value is
        // outside the domain of this formatter.
        [[nodiscard]]
        decode_result deserialise(const_bytes_span const buffer, std::size_t const offset,
                field_context const& context) const {
            auto result = _deserialise(buffer, offset, context);
            validate(result.result);
            return result;
        }

    protected:
        [[nodiscard]]
        virtual std::size_t _length(value const& v) const = 0;

        virtual void _serialise(value const& v, mutable_bytes_span buffer, std::size_t offset,
            field_context const& context) const = 0;

        [[nodiscard]]
        virtual decode_result _deserialise(const_bytes_span buffer, std::size_t offset,
            field_context const& context) const = 0;
    };


    using formatter_ptr = std::shared_ptr<formatter const>;

}
