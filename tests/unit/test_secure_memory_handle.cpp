#include <catch2/catch_test_macros.hpp>
#include "xkwire/crypto/sodium_secure_memory_handle.hpp"
#include "xkwire/crypto/sodium_interop.hpp"
#include "xkwire/core/constants.hpp"
#include <algorithm>
#include <vector>
using namespace xkwire::protocol;
using namespace xkwire::protocol::crypto;
TEST_CASE("SecureMemoryHandle - Allocation", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Allocate valid size") {
        auto result = SecureMemoryHandle::Allocate(32);
        REQUIRE(result.IsOk());
        auto handle = std::move(result).Unwrap();
        REQUIRE_FALSE(handle.IsInvalid());
        REQUIRE(handle.Size() == 32);
    }
    SECTION("Cannot allocate zero bytes") {
        auto result = SecureMemoryHandle::Allocate(0);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == SodiumFailureType::AllocationFailed);
    }
    SECTION("FromBytes copies the input") {
        std::vector<uint8_t> key(32, 0x5A);
        auto handle = SecureMemoryHandle::FromBytes(key).Unwrap();
        REQUIRE(handle.ReadBytes(32).Unwrap() == key);
    }
}
TEST_CASE("SecureMemoryHandle - Move Semantics", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Move construction transfers ownership") {
        auto handle1 = SecureMemoryHandle::Allocate(32).Unwrap();
        SecureMemoryHandle handle2(std::move(handle1));
        REQUIRE(handle1.IsInvalid());
        REQUIRE_FALSE(handle2.IsInvalid());
        REQUIRE(handle2.Size() == 32);
    }
    SECTION("Move assignment transfers ownership") {
        auto handle1 = SecureMemoryHandle::Allocate(32).Unwrap();
        auto handle2 = SecureMemoryHandle::Allocate(64).Unwrap();
        handle2 = std::move(handle1);
        REQUIRE(handle1.IsInvalid());
        REQUIRE(handle2.Size() == 32);
    }
}
TEST_CASE("SecureMemoryHandle - Write and Read", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Short write zero-pads the rest") {
        auto handle = SecureMemoryHandle::Allocate(8).Unwrap();
        std::vector<uint8_t> data{1, 2, 3};
        REQUIRE(handle.Write(data).IsOk());
        auto read = handle.ReadBytes(8).Unwrap();
        REQUIRE(read == std::vector<uint8_t>{1, 2, 3, 0, 0, 0, 0, 0});
    }
    SECTION("Write data larger than buffer fails") {
        auto handle = SecureMemoryHandle::Allocate(16).Unwrap();
        std::vector<uint8_t> data(32, 0x42);
        REQUIRE(handle.Write(data).IsErr());
    }
    SECTION("Read into too-small buffer fails") {
        auto handle = SecureMemoryHandle::Allocate(32).Unwrap();
        std::vector<uint8_t> buffer(16);
        REQUIRE(handle.Read(buffer).IsErr());
    }
    SECTION("ReadBytes with too-large size fails") {
        auto handle = SecureMemoryHandle::Allocate(32).Unwrap();
        REQUIRE(handle.ReadBytes(64).IsErr());
    }
}
TEST_CASE("SecureMemoryHandle - Reset", "[crypto][memory][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto handle = SecureMemoryHandle::FromBytes(std::vector<uint8_t>(32, 0x42)).Unwrap();
    handle.Reset();
    REQUIRE(handle.IsInvalid());
    SECTION("Every access fails afterwards") {
        auto read = handle.ReadBytes(32);
        REQUIRE(read.IsErr());
        REQUIRE(read.UnwrapErr().message.find(ErrorMessages::HANDLE_DISPOSED) != std::string::npos);
        REQUIRE(handle.Write(std::vector<uint8_t>(32, 0x01)).IsErr());
        auto access = handle.WithReadAccess([](std::span<const uint8_t>) { return 1; });
        REQUIRE(access.IsErr());
    }
    SECTION("Reset twice is harmless") {
        handle.Reset();
        REQUIRE(handle.IsInvalid());
    }
}
TEST_CASE("SecureMemoryHandle - Scoped access", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Read access provides correct span") {
        auto handle = SecureMemoryHandle::FromBytes(std::vector<uint8_t>(32, 0x42)).Unwrap();
        auto result = handle.WithReadAccess([&](std::span<const uint8_t> span) {
            REQUIRE(span.size() == 32);
            REQUIRE(std::all_of(span.begin(), span.end(),
                [](uint8_t b) { return b == 0x42; }));
            return 42;
        });
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == 42);
    }
    SECTION("Write access allows modification") {
        auto handle = SecureMemoryHandle::Allocate(32).Unwrap();
        auto result = handle.WithWriteAccess([](std::span<uint8_t> span) {
            std::fill(span.begin(), span.end(), 0xFF);
            return unit;
        });
        REQUIRE(result.IsOk());
        auto read_data = handle.ReadBytes(32).Unwrap();
        REQUIRE(std::all_of(read_data.begin(), read_data.end(),
            [](uint8_t b) { return b == 0xFF; }));
    }
}

TEST_CASE("SecureMemoryHandle - Content comparison", "[crypto][memory][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> key(32, 0x5A);
    auto a = SecureMemoryHandle::FromBytes(key).Unwrap();
    auto b = SecureMemoryHandle::FromBytes(key).Unwrap();

    SECTION("Equal contents") {
        REQUIRE(a.ContentEquals(b));
    }
    SECTION("One differing byte") {
        std::vector<uint8_t> other = key;
        other[31] ^= 0x01;
        auto c = SecureMemoryHandle::FromBytes(other).Unwrap();
        REQUIRE_FALSE(a.ContentEquals(c));
    }
    SECTION("Different sizes") {
        auto shorter = SecureMemoryHandle::FromBytes(std::span<const uint8_t>(key).first(16)).Unwrap();
        REQUIRE_FALSE(a.ContentEquals(shorter));
    }
    SECTION("Disposed handle matches nothing") {
        b.Reset();
        REQUIRE_FALSE(a.ContentEquals(b));
        REQUIRE_FALSE(b.ContentEquals(b));
    }
}
