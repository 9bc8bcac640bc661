#pragma once

#include <cstdint>
#include <string>

namespace modex {

/// FNV-1a, stable across platforms and builds. Used for instance
/// fingerprints and for deriving per-call seeds that end up in checkpoints.
class Fnv1a {
public:
    void add(uint64_t value) {
        for (int i = 0; i < 8; i++) {
            addByte(static_cast<uint8_t>(value >> (8 * i)));
        }
    }

    void add(const std::string& text) {
        for (char c : text) addByte(static_cast<uint8_t>(c));
        add(static_cast<uint64_t>(text.size()));
    }

    uint64_t value() const { return state_; }

private:
    void addByte(uint8_t byte) {
        state_ ^= byte;
        state_ *= 0x100000001b3ULL;
    }

    uint64_t state_ = 0xcbf29ce484222325ULL;
};

} // namespace modex
