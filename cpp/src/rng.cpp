#include "rng.hpp"

namespace sugarscape {

PCG64::PCG64(uint64_t seed) : PCG64(seed, 1) {}

PCG64::PCG64(uint64_t seed, uint64_t stream)
    : state_(0), inc_((stream << 1) | 1) {
    next();
    state_ += seed;
    next();
}

uint64_t PCG64::next() {
    uint64_t oldstate = state_;
    state_ = oldstate * MULTIPLIER + inc_;
    // PCG-XSH-RR: produces 32-bit output from 64-bit state
    uint32_t xorshifted = static_cast<uint32_t>(((oldstate >> 18u) ^ oldstate) >> 27u);
    uint32_t rot = static_cast<uint32_t>(oldstate >> 59u);
    return (xorshifted >> rot) | (xorshifted << ((~rot + 1u) & 31u));
}

double PCG64::uniform() {
    return static_cast<double>(next()) / 4294967296.0;  // 2^32
}

double PCG64::uniform(double low, double high) {
    return low + uniform() * (high - low);
}

int PCG64::integers(int low, int high) {
    if (high <= low) return low;
    uint32_t range = static_cast<uint32_t>(high - low);
    // Reject the low end of the 32-bit output to remove modulo bias
    uint32_t threshold = static_cast<uint32_t>(-range) % range;
    uint32_t r;
    do {
        r = static_cast<uint32_t>(next());
    } while (r < threshold);
    return low + static_cast<int>(r % range);
}

bool PCG64::coin() {
    return (next() & 1u) != 0;
}

PCG64 PCG64::spawn() {
    uint64_t new_seed = next();
    uint64_t stream_high = next();
    uint64_t stream_low = next();
    uint64_t new_stream = (stream_high << 32) | stream_low;
    return PCG64(new_seed, new_stream);
}

}  // namespace sugarscape
