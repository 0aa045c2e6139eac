// Helper to generate valid seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself. Writes plain and gzip-framed CBOR responses.

#include <xmit-cpp/types.hpp>
#include <xmit-cpp/wire.hpp>
#include "src/encoding/cbor.hpp"

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using xmit_cpp::cbor::Value;

static void write_seed(const std::string& path, const std::vector<std::byte>& data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
}

static auto key(std::uint64_t k) -> Value { return Value{k}; }

static auto hash_value(std::string_view seed) -> Value {
    auto h = xmit_cpp::hash_content(xmit_cpp::to_bytes(seed));
    return Value{xmit_cpp::Bytes{h.bytes.begin(), h.bytes.end()}};
}

static void write_pair(const std::string& dir, const std::string& name, const Value& value) {
    auto encoded = xmit_cpp::cbor::encode(value);
    write_seed(dir + "/" + name + ".cbor", encoded);
    write_seed(dir + "/" + name + ".cbor.gz", xmit_cpp::frame_body(encoded));
}

int main() {
    namespace fs = std::filesystem;
    const auto dir = std::string{"fuzz/corpus"};
    fs::create_directories(dir);

    // Seed 1: suggest, bundle present, two parts missing
    write_pair(dir, "suggest", Value{Value::Map{
        {key(1), Value{true}},
        {key(5), Value{true}},
        {key(6), Value{Value::Array{hash_value("a"), hash_value("b")}}},
    }});

    // Seed 2: failure with every diagnostic list
    write_pair(dir, "diagnostics", Value{Value::Map{
        {key(1), Value{false}},
        {key(2), Value{Value::Array{Value{"Domain requires team ID"}}}},
        {key(3), Value{Value::Array{Value{"quota nearly reached"}}}},
        {key(4), Value{Value::Array{Value{"hello"}}}},
    }});

    // Seed 3: bundle upload with an id
    write_pair(dir, "bundle", Value{Value::Map{
        {key(1), Value{true}},
        {key(5), hash_value("bundle")},
        {key(6), Value{Value::Array{hash_value("c")}}},
    }});

    // Seed 4: team list
    write_pair(dir, "teams", Value{Value::Map{
        {key(1), Value{true}},
        {key(5), Value{Value::Array{
            Value{Value::Map{{key(1), Value{"t1"}}, {key(2), Value{"Web"}}}},
            Value{Value::Map{{key(1), Value{"t2"}}}},
        }}},
        {key(6), Value{"https://xmit.co/admin"}},
    }});

    // Seed 5: key request ticket
    write_pair(dir, "key_request", Value{Value::Map{
        {key(1), Value{true}},
        {key(5), Value{"https://xmit.co/approve/abc"}},
        {key(6), Value{"/api/0/poll-key/abc"}},
        {key(7), Value{"s3cret"}},
        {key(8), Value{"abc"}},
    }});

    return 0;
}
