#pragma once

#include <climits>
#include <cstddef>
#include <exception>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "utility.hpp"


namespace structpp {

    static_assert(CHAR_BIT == 8, "Struct++ only supports platforms with 8-bit bytes");


    using const_bytes_span = std::span<std::byte const>;
    using mutable_bytes_span = std::span<std::byte>;

    // Owning byte sequence, as produced by serialisation.
    using bytes = std::vector<std::byte>;


    // Base for all exceptions thrown by Struct++.
    class error : public std::exception {
    public:
        virtual ~error() = 0;
    };

    inline error::~error() = default;


    // Thrown when a struct definition or formatter is structurally invalid, e.g. a variable-length field that is not
    // the last field of its struct. Always thrown at declaration time.
    class definition_error : public error {
    public:
        definition_error(std::string message) noexcept :
            _message{std::move(message)}
        {}

        [[nodiscard]]
        char const* what() const noexcept override {
            return _message.c_str();
        }

    private:
        std::string _message;
    };


    // Thrown when a value is outside the domain of its formatter, either on assignment or when decoded.
    class value_constraint_error : public error {
    public:
        value_constraint_error(std::string message) noexcept :
            _message{std::move(message)}
        {}

        [[nodiscard]]
        char const* what() const noexcept override {
            return _message.c_str();
        }

    private:
        std::string _message;
    };


    // Thrown when deserialisation would require more bytes than the buffer holds.
    class insufficient_data_error : public error {
    public:
        insufficient_data_error(std::string message) noexcept :
            _message{std::move(message)}
        {}

        [[nodiscard]]
        char const* what() const noexcept override {
            return _message.c_str();
        }

    private:
        std::string _message;
    };


    // Thrown when popping (or modifying) the settings stack while only the root frame remains.
    class empty_stack_error : public error {
    public:
        empty_stack_error(std::string message) noexcept :
            _message{std::move(message)}
        {}

        [[nodiscard]]
        char const* what() const noexcept override {
            return _message.c_str();
        }

    private:
        std::string _message;
    };


    namespace detail {

        // Throws insufficient_data_error if buffer doesn't hold size bytes starting at offset.
        inline void check_buffer_size(const_bytes_span const buffer, std::size_t const offset, std::size_t const size,
                std::string_view const what) {
            if (offset > buffer.size() || buffer.size() - offset < size) {
                throw insufficient_data_error{
                    fmt::format("Data buffer of size {} is too small to deserialise {} with size {} at offset {}",
                        buffer.size(), what, size, offset)};
            }
        }

    }

}
