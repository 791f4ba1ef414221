#pragma once

#include "polygraph/common.hpp"

namespace polygraph::crypto {

/**
 * CSPRNG backed by libsodium's randombytes
 */
class Random {
public:
    static bytes generate(size_t size);

    static uint64_t generate_uint64();

    template<size_t N>
    static fixed_bytes<N> generate_fixed() {
        fixed_bytes<N> value;
        generate_into(value.data(), value.size());
        return value;
    }

    static void generate_into(byte* buffer, size_t size);
};

} // namespace polygraph::crypto
