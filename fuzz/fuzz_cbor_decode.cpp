// Fuzz target for the CBOR decoder. Any value that decodes is re-encoded
// and must decode again.

#include "src/encoding/cbor.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    auto value = xmit_cpp::cbor::decode(span);
    if (value) {
        auto again = xmit_cpp::cbor::decode(xmit_cpp::cbor::encode(*value));
        if (!again) std::abort();
    }
    return 0;
}
