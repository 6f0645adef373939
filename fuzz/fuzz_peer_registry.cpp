// Fuzz target for PeerRegistry
// Replays an arbitrary sequence of registry mutations and queries
//
// Introductions arrive from untrusted peers, so the registry must stay
// consistent under any interleaving of discover, promote, move and remove.
// After every operation the harness checks:
// - Walkable addresses are never blacklisted or owned by a verified peer
// - The introducer of a walkable address is a verified peer listing it
// - Stats agree with the query results
//
// Target code:
// - src/discovery/peer_registry.cpp
// - src/discovery/provenance_graph.cpp
// - src/discovery/verified_peer_index.cpp

#include "discovery/peer_registry.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

using namespace overlay::discovery;

namespace {

// FuzzInput: Parse structured fuzz data
class FuzzInput {
public:
    FuzzInput(const uint8_t *data, size_t size) : data_(data), size_(size), offset_(0) {}

    template<typename T>
    T read() {
        if (offset_ + sizeof(T) > size_) {
            offset_ = size_;
            return T{};
        }
        T value;
        memcpy(&value, data_ + offset_, sizeof(T));
        offset_ += sizeof(T);
        return value;
    }

    bool empty() const { return offset_ >= size_; }

private:
    const uint8_t *data_;
    size_t size_;
    size_t offset_;
};

// Small key spaces so operations collide often
Address AddressFor(uint8_t n) {
    if (n & 0x80) {
        return Address("2001:db8::" + std::to_string(n & 0x0F), 8090);
    }
    return Address("10.0.0." + std::to_string(n & 0x1F), static_cast<uint16_t>(8090 + ((n >> 5) & 0x01)));
}

IdentityKey KeyFor(uint8_t n) {
    std::array<uint8_t, IdentityKey::SIZE> bytes{};
    bytes[0] = static_cast<uint8_t>(n & 0x1F);
    return IdentityKey(bytes);
}

VerifiedPeer PeerFor(uint8_t id, uint8_t addr) {
    std::vector<uint8_t> pk(33, 0x03);
    pk[32] = static_cast<uint8_t>(id & 0x1F);
    return VerifiedPeer(std::move(pk), KeyFor(id), AddressFor(addr));
}

ServiceId ServiceFor(uint8_t n) {
    std::array<uint8_t, ServiceId::SIZE> bytes{};
    bytes[19] = static_cast<uint8_t>(n & 0x03);
    return ServiceId(bytes);
}

void CheckConsistency(const PeerRegistry& registry) {
    const auto walkable = registry.GetWalkableAddresses();
    size_t orphaned = 0;
    for (const auto& addr : walkable) {
        if (registry.IsBlacklisted(addr) || registry.GetVerifiedByAddress(addr).has_value()) {
            __builtin_trap();
        }
        auto introducer = registry.GetIntroducer(addr);
        if (!introducer) {
            orphaned++;
            continue;
        }
        auto peer = registry.GetVerifiedByKey(*introducer);
        if (!peer.has_value()) {
            __builtin_trap();
        }
        auto intros = registry.GetIntroductionsFrom(*peer);
        if (std::find(intros.begin(), intros.end(), addr) == intros.end()) {
            __builtin_trap();
        }
    }

    const auto verified = registry.VerifiedPeers();
    for (const auto& peer : verified) {
        if (!registry.HasPeerNode(peer.key)) {
            __builtin_trap();
        }
    }

    auto stats = registry.GetStats();
    if (stats.verified != verified.size() || stats.walkable != walkable.size() || stats.orphaned != orphaned) {
        __builtin_trap();
    }
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size < 3) return 0;

    FuzzInput input(data, size);
    PeerRegistry registry;

    while (!input.empty()) {
        uint8_t op = input.read<uint8_t>();
        uint8_t a = input.read<uint8_t>();
        uint8_t b = input.read<uint8_t>();

        switch (op % 9) {
            case 0:
                registry.DiscoverAddress(PeerFor(a, a), AddressFor(b));
                break;
            case 1:
                registry.AddVerifiedPeer(PeerFor(a, b));
                break;
            case 2:
                registry.RemovePeer(PeerFor(a, b));
                break;
            case 3:
                registry.RemoveByAddress(AddressFor(b));
                break;
            case 4:
                registry.DiscoverServices(PeerFor(a, a), {ServiceFor(b)});
                break;
            case 5:
                registry.BlacklistAddress(AddressFor(b));
                break;
            case 6:
                registry.BlacklistIdentity(KeyFor(a));
                break;
            case 7:
                (void)registry.GetWalkableAddresses(ServiceFor(b), static_cast<int64_t>(a));
                break;
            default:
                (void)registry.ToJson().dump();
                break;
        }

        CheckConsistency(registry);
    }

    return 0;
}
