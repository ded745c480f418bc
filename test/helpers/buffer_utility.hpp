#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <span>

#include <structpp/common.hpp>


namespace structpp::test {

    template<std::size_t N>
    [[nodiscard]]
    bool buffer_equal(const_bytes_span const buffer, std::array<unsigned char, N> const& expected) {
        return std::ranges::equal(buffer, std::span{expected}, {}, [](std::byte e) {
            return std::to_integer<unsigned char>(e);
        });
    }


    template<std::size_t N>
    [[nodiscard]]
    bytes uchar_array_to_bytes(std::array<unsigned char, N> const& array) {
        bytes result(N);
        std::ranges::transform(array, result.begin(), [](unsigned char e) { return std::byte{e}; });
        return result;
    }

}
