#pragma once

#include <bit>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <stdexcept>

#include <iopp/concepts.hpp>

// writes the lowest num_bytes bytes of x in little endian byte order
template<std::output_iterator<char> Out>
void write_uint(Out& out, uint64_t const x, size_t const num_bytes) {
    static_assert(std::endian::native == std::endian::little);
    assert(num_bytes <= 8);
    char const* s = (char const*)&x;
    for(size_t i = 0; i < num_bytes; i++) {
        *out++ = s[i];
    }
}

// reads a little endian unsigned integer of num_bytes bytes
template<iopp::InputIterator<char> In>
uint64_t read_uint(In& in, In const& end, size_t const num_bytes) {
    static_assert(std::endian::native == std::endian::little);
    assert(num_bytes <= 8);
    uint64_t x = 0;
    char* s = (char*)&x;
    for(size_t i = 0; i < num_bytes; i++) {
        if(in == end) throw std::runtime_error("unexpected end of input");
        s[i] = *in++;
    }
    return x;
}
