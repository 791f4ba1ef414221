#include "random.hpp"
#include <sodium.h>

namespace polygraph::crypto {

bytes Random::generate(size_t size) {
    bytes result(size);
    generate_into(result.data(), size);
    return result;
}

uint64_t Random::generate_uint64() {
    uint64_t value = 0;
    randombytes_buf(&value, sizeof(value));
    return value;
}

void Random::generate_into(byte* buffer, size_t size) {
    randombytes_buf(buffer, size);
}

} // namespace polygraph::crypto
