#pragma once

#include <bit>


namespace structpp {

    namespace detail {

        inline constexpr bool is_little_endian = std::endian::native == std::endian::little;
        inline constexpr bool is_big_endian = std::endian::native == std::endian::big;
        inline constexpr bool is_mixed_endian = !is_little_endian && !is_big_endian;

        static_assert(!is_mixed_endian, "Struct++ does not support mixed endian platforms");


        // Combines several callables into one overload set, for use with std::visit.
        template<typename... Fs>
        struct overloaded : Fs... {
            using Fs::operator()...;
        };

        template<typename... Fs>
        overloaded(Fs...) -> overloaded<Fs...>;

    }

}
