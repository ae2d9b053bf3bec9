#include "multicrypto/decoder_key.hpp"
#include <array>
#include <chrono>
#include <utility>

namespace multicrypto {

Rng make_rng() {
    std::random_device rd;
    auto now = static_cast<uint64_t>(
        std::chrono::system_clock::now().time_since_epoch().count());
    std::seed_seq seq{static_cast<uint32_t>(rd()), static_cast<uint32_t>(now), static_cast<uint32_t>(now >> 32)};
    return Rng(seq);
}

Rng make_rng(uint32_t seed) {
    return Rng(seed);
}

std::string identity_decoder_key() {
    return "abcdefghijklmnopqrstuvwxyz";
}

std::string random_decoder_key(Rng& rng) {
    std::string key = identity_decoder_key();
    std::uniform_int_distribution<size_t> pos(0, DECODER_KEY_LENGTH - 1);
    for (int i = 0; i < DECODER_SHUFFLE_SWAPS; ++i) {
        size_t a = pos(rng);
        size_t b = pos(rng);
        std::swap(key[a], key[b]);
    }
    return key;
}

bool is_permutation_key(const std::string& key) {
    if (key.size() != DECODER_KEY_LENGTH) return false;

    std::array<bool, DECODER_KEY_LENGTH> seen{};
    for (char c : key) {
        if (c < 'a' || c > 'z') return false;
        auto idx = static_cast<size_t>(c - 'a');
        if (seen[idx]) return false;
        seen[idx] = true;
    }
    return true;
}

} // namespace multicrypto
