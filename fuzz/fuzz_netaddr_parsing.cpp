// Fuzz target for endpoint parsing
// Tests ValidateAndNormalizeIP, ParseIPPort, ParsePort and Address::Parse
//
// Every introduced endpoint and every exclusion-list entry goes through this
// code before it becomes a registry key. Bugs here can:
// - Let one endpoint appear under two keys (IPv4-mapped normalization bypass
//   of the blacklist)
// - Accept invalid endpoints into the walkable set
// - Crash on hostile input (exception leaks, out-of-range access)
//
// Target code:
// - src/util/netaddress.cpp
// - src/discovery/types.cpp (Address::Parse, Address::ToString)

#include "discovery/types.hpp"
#include "util/netaddress.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

using namespace overlay::util;
using overlay::discovery::Address;

// FuzzInput: Parse structured fuzz data
class FuzzInput {
public:
    FuzzInput(const uint8_t *data, size_t size) : data_(data), size_(size), offset_(0) {}

    std::string read_remaining() {
        if (offset_ >= size_) {
            return "";
        }
        std::string result(reinterpret_cast<const char*>(data_ + offset_), size_ - offset_);
        offset_ = size_;
        return result;
    }

    template<typename T>
    T read() {
        if (offset_ + sizeof(T) > size_) {
            return T{};
        }
        T value;
        memcpy(&value, data_ + offset_, sizeof(T));
        offset_ += sizeof(T);
        return value;
    }

private:
    const uint8_t *data_;
    size_t size_;
    size_t offset_;
};

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size < 2) return 0;

    FuzzInput input(data, size);
    uint8_t mode = input.read<uint8_t>();

    // TEST 1: normalization is idempotent and agrees with IsValidIPAddress
    if ((mode & 0x03) == 0) {
        std::string address = input.read_remaining();

        auto result = ValidateAndNormalizeIP(address);
        if (IsValidIPAddress(address) != result.has_value()) {
            __builtin_trap();
        }
        if (result.has_value()) {
            auto again = ValidateAndNormalizeIP(*result);
            if (!again.has_value() || *again != *result) {
                __builtin_trap();
            }
        }
    }

    // TEST 2: ParseIPPort output is a normalized IP and a nonzero port
    if ((mode & 0x03) == 1) {
        std::string address_port = input.read_remaining();

        std::string out_ip;
        uint16_t out_port = 0;
        if (ParseIPPort(address_port, out_ip, out_port)) {
            auto normalized = ValidateAndNormalizeIP(out_ip);
            if (!normalized.has_value() || *normalized != out_ip || out_port == 0) {
                __builtin_trap();
            }
        }
    }

    // TEST 3: Address::Parse and ToString round-trip for accepted endpoints
    if ((mode & 0x03) == 2) {
        std::string endpoint = input.read_remaining();

        auto addr = Address::Parse(endpoint);
        if (addr.has_value()) {
            auto reparsed = Address::Parse(addr->ToString());
            if (!reparsed.has_value() || *reparsed != *addr) {
                __builtin_trap();
            }
        }
    }

    // TEST 4: IPv4 and IPv4-mapped IPv6 produce the same key
    if ((mode & 0x03) == 3 && size >= 7) {
        uint8_t oct1 = input.read<uint8_t>();
        uint8_t oct2 = input.read<uint8_t>();
        uint8_t oct3 = input.read<uint8_t>();
        uint8_t oct4 = input.read<uint8_t>();
        uint16_t port = input.read<uint16_t>();
        if (port == 0) port = 1;

        char plain[32];
        snprintf(plain, sizeof(plain), "%u.%u.%u.%u:%u", oct1, oct2, oct3, oct4, port);
        char mapped[64];
        snprintf(mapped, sizeof(mapped), "[::ffff:%u.%u.%u.%u]:%u", oct1, oct2, oct3, oct4, port);

        auto a = Address::Parse(plain);
        auto b = Address::Parse(mapped);
        if (!a.has_value() || !b.has_value() || *a != *b) {
            __builtin_trap();
        }
    }

    // TEST 5: ParsePort accepts exactly 1..65535 without sign or padding spaces
    if ((mode & 0x0F) == 4) {
        std::string port_str = input.read_remaining();
        auto port = ParsePort(port_str);
        if (port.has_value()) {
            if (*port == 0 || port_str.empty() || port_str.size() > 5) {
                __builtin_trap();
            }
            for (char c : port_str) {
                if (c < '0' || c > '9') {
                    __builtin_trap();
                }
            }
        }
    }

    // TEST 6: bracket edge cases never crash
    if ((mode & 0x0F) == 5) {
        std::string body = input.read_remaining();

        std::vector<std::string> cases;
        cases.push_back("[" + body + "]:1234");
        cases.push_back("[" + body);
        cases.push_back(body + "]");
        cases.push_back("[]:" + body);
        cases.push_back("[:" + body);

        for (const auto& test : cases) {
            std::string out_ip;
            uint16_t out_port = 0;
            ParseIPPort(test, out_ip, out_port);
        }
    }

    return 0;
}
