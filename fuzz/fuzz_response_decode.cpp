// Fuzz target for the response path: gunzip, then every endpoint decoder on
// both the raw and the inflated body.

#include <xmit-cpp/wire.hpp>

#include <cstddef>
#include <cstdint>
#include <span>

static void decode_all(std::span<const std::byte> body) {
    (void)xmit_cpp::decode_suggest_response(body);
    (void)xmit_cpp::decode_bundle_response(body);
    (void)xmit_cpp::decode_status_response(body);
    (void)xmit_cpp::decode_teams_response(body);
    (void)xmit_cpp::decode_key_request_response(body);
}

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    decode_all(span);
    if (auto inflated = xmit_cpp::unframe_body(span)) {
        decode_all(*inflated);
    }
    return 0;
}
