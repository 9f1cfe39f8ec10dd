#include "xkwire/security/validation/dh_validator.hpp"
#include <algorithm>
#include <string>

namespace xkwire::protocol::security {

namespace {
    constexpr size_t kTopByte = Constants::X_25519_PUBLIC_KEY_SIZE - 1;
    constexpr uint8_t kTopBitMask = 0x7F;

    uint32_t LoadWord(std::span<const uint8_t> bytes, size_t word_index, bool mask_top_bit) {
        const size_t byte_offset = word_index * Constants::WORD_SIZE;
        uint32_t word = 0;
        for (size_t b = 0; b < Constants::WORD_SIZE; ++b) {
            uint8_t byte = bytes[byte_offset + b];
            if (mask_top_bit && byte_offset + b == kTopByte) {
                byte &= kTopBitMask;
            }
            word |= static_cast<uint32_t>(byte) << (8 * b);
        }
        return word;
    }
}

Result<Unit, ProtocolFailure> DhValidator::ValidateX25519PublicKey(
    std::span<const uint8_t> public_key) {

    if (public_key.size() != Constants::X_25519_PUBLIC_KEY_SIZE) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidKeyMaterial(
                "Invalid X25519 public key size: expected " +
                std::to_string(Constants::X_25519_PUBLIC_KEY_SIZE) +
                ", got " + std::to_string(public_key.size())));
    }

    if (HasSmallOrder(public_key)) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidKeyMaterial(
                "X25519 public key is a small-order point (invalid for DH)"));
    }

    if (!IsValidCurve25519Point(public_key)) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidKeyMaterial(
                "X25519 public key is not a canonical Curve25519 field element"));
    }

    return Result<Unit, ProtocolFailure>::Ok(unit);
}

bool DhValidator::HasSmallOrder(std::span<const uint8_t> public_key) {
    if (public_key.size() != Constants::X_25519_PUBLIC_KEY_SIZE) {
        return false;
    }

    Point masked{};
    std::copy(public_key.begin(), public_key.end(), masked.begin());
    masked[kTopByte] &= kTopBitMask;

    // Walk the whole list so timing does not depend on which entry matched.
    bool found = false;
    for (const auto& small_order_point : SMALL_ORDER_POINTS) {
        found |= ConstantTimeEquals(masked, small_order_point);
    }
    return found;
}

bool DhValidator::IsValidCurve25519Point(std::span<const uint8_t> public_key) {
    if (public_key.size() != Constants::CURVE_25519_FIELD_ELEMENT_SIZE) {
        return false;
    }

    // Most significant word first; strictly below the prime.
    for (size_t i = Constants::FIELD_256_WORD_COUNT; i-- > 0;) {
        const uint32_t key_word = LoadWord(public_key, i, true);
        const uint32_t prime_word = LoadWord(CURVE_25519_PRIME, i, false);
        if (key_word < prime_word) {
            return true;
        }
        if (key_word > prime_word) {
            return false;
        }
    }
    return false;
}

bool DhValidator::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) {

    if (a.size() != b.size()) {
        return false;
    }

    uint8_t diff = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        diff |= static_cast<uint8_t>(a[i] ^ b[i]);
    }
    return diff == 0;
}

} // namespace xkwire::protocol::security
