#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <structpp/common.hpp>
#include <structpp/formatter.hpp>
#include <structpp/value.hpp>


namespace structpp::test {

    // Formatter with a fixed length that writes nothing, and records every call made to it.
    // Deserialises to the offset it was called with. If variable, it consumes the rest of the buffer.
    class mock_formatter final : public formatter {
    public:
        mutable std::vector<std::size_t> serialise_offsets;
        mutable std::vector<std::size_t> deserialise_offsets;
        mutable std::vector<endian> orders;

        explicit mock_formatter(std::size_t const fixed_length, bool const variable = false) :
            _fixed_length{fixed_length}, _variable{variable}
        {}

        [[nodiscard]]
        std::string name() const override {
            return "mock";
        }

        [[nodiscard]]
        value const& default_value() const noexcept override {
            return _default;
        }

        void validate(value const&) const override {}

        [[nodiscard]]
        bool variable_length() const noexcept override {
            return _variable;
        }

    protected:
        [[nodiscard]]
        std::size_t _length(value const&) const override {
            return _fixed_length;
        }

        void _serialise(value const&, mutable_bytes_span, std::size_t const offset,
                field_context const& context) const override {
            serialise_offsets.push_back(offset);
            orders.push_back(context.order);
        }

        [[nodiscard]]
        decode_result _deserialise(const_bytes_span const buffer, std::size_t const offset,
                field_context const& context) const override {
            deserialise_offsets.push_back(offset);
            orders.push_back(context.order);
            auto const consumed = _variable ? buffer.size() - offset : _fixed_length;
            return {value{offset}, consumed};
        }

    private:
        std::size_t _fixed_length;
        bool _variable;
        value _default;
    };


    [[nodiscard]]
    inline std::shared_ptr<mock_formatter const> mock(std::size_t const fixed_length, bool const variable = false) {
        return std::make_shared<mock_formatter const>(fixed_length, variable);
    }

}
