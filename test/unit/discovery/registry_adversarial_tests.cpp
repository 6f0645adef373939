// Copyright (c) 2025 The Unicity Foundation
// Registry Consistency Adversarial Tests
//
// Drives PeerRegistry with long random sequences of mutations and checks that
// the public view stays consistent after every step:
// 1. Walkable addresses are never blacklisted or owned by a verified peer
// 2. The introducer of a walkable address is a verified peer and lists it
// 3. No address is listed as an introduction of two different peers
// 4. Stats agree with the query results
//
// A second test hammers the registry from several threads.

#include <catch2/catch_test_macros.hpp>

#include "common/peer_factory.hpp"
#include "discovery/peer_registry.hpp"

#include <algorithm>
#include <map>
#include <random>
#include <thread>
#include <vector>

using namespace overlay::discovery;
using namespace overlay::test;

namespace {

constexpr uint32_t kPeerCount = 16;
constexpr uint32_t kExtraAddressBase = 100;

void CheckConsistency(const PeerRegistry& registry) {
  const auto verified = registry.VerifiedPeers();
  const auto walkable = registry.GetWalkableAddresses();

  for (const auto& peer : verified) {
    REQUIRE(registry.HasPeerNode(peer.key));
  }

  REQUIRE(std::is_sorted(walkable.begin(), walkable.end()));
  REQUIRE(std::adjacent_find(walkable.begin(), walkable.end()) == walkable.end());

  size_t orphaned = 0;
  for (const auto& addr : walkable) {
    REQUIRE(registry.HasAddressNode(addr));
    REQUIRE_FALSE(registry.IsBlacklisted(addr));
    REQUIRE_FALSE(registry.GetVerifiedByAddress(addr).has_value());

    auto introducer = registry.GetIntroducer(addr);
    if (!introducer) {
      orphaned++;
      continue;
    }
    auto peer = registry.GetVerifiedByKey(*introducer);
    REQUIRE(peer.has_value());
    auto intros = registry.GetIntroductionsFrom(*peer);
    REQUIRE(std::find(intros.begin(), intros.end(), addr) != intros.end());
  }

  std::map<Address, IdentityKey> claimed;
  for (const auto& peer : verified) {
    for (const auto& addr : registry.GetIntroductionsFrom(peer)) {
      REQUIRE(claimed.emplace(addr, peer.key).second);
      REQUIRE(registry.GetIntroducer(addr) == peer.key);
    }
  }

  auto stats = registry.GetStats();
  REQUIRE(stats.verified == verified.size());
  REQUIRE(stats.walkable == walkable.size());
  REQUIRE(stats.orphaned == orphaned);
}

Address RandomAddress(std::mt19937& rng) {
  uint32_t n = rng() % (2 * kPeerCount);
  return n < kPeerCount ? MakeAddress(n) : MakeAddress(kExtraAddressBase + n - kPeerCount);
}

void ApplyRandomOperation(PeerRegistry& registry, std::mt19937& rng) {
  auto peer = MakePeer(rng() % kPeerCount);
  switch (rng() % 10) {
    case 0:
    case 1:
    case 2:
      registry.DiscoverAddress(peer, RandomAddress(rng));
      break;
    case 3:
      registry.AddVerifiedPeer(peer);
      break;
    case 4: {
      // Same identity seen at another endpoint
      peer.address = RandomAddress(rng);
      peer.UpdateClock(rng() % 1000);
      registry.AddVerifiedPeer(peer);
      break;
    }
    case 5:
      registry.RemovePeer(peer);
      break;
    case 6:
      registry.RemoveByAddress(RandomAddress(rng));
      break;
    case 7:
      registry.DiscoverServices(peer, {MakeService(static_cast<uint8_t>(rng() % 4))});
      break;
    case 8:
      if (rng() % 8 == 0) {
        registry.BlacklistAddress(RandomAddress(rng));
      }
      break;
    default:
      (void)registry.GetWalkableAddresses(MakeService(static_cast<uint8_t>(rng() % 4)));
      break;
  }
}

}  // namespace

TEST_CASE("Registry adversarial - random mutation sequences stay consistent", "[discovery][registry][adversarial]") {
  for (uint32_t seed : {1u, 7u, 42u, 1337u}) {
    INFO("seed " << seed);
    std::mt19937 rng(seed);
    PeerRegistry registry;

    for (int step = 0; step < 400; ++step) {
      ApplyRandomOperation(registry, rng);
      CheckConsistency(registry);
    }
  }
}

TEST_CASE("Registry adversarial - introduction churn from many introducers", "[discovery][registry][adversarial]") {
  PeerRegistry registry;
  const auto target = MakeAddress(kExtraAddressBase);

  // Every peer claims the same address; only the first one keeps it
  for (uint32_t i = 0; i < kPeerCount; ++i) {
    registry.DiscoverAddress(MakePeer(i), target);
  }
  REQUIRE(registry.GetIntroducer(target) == MakeKey(0));

  // Knock out introducers one by one; the address is re-adopted each time
  for (uint32_t i = 0; i + 1 < kPeerCount; ++i) {
    registry.RemovePeer(MakePeer(i));
    REQUIRE_FALSE(registry.GetIntroducer(target).has_value());
    registry.DiscoverAddress(MakePeer(i + 1), target);
    REQUIRE(registry.GetIntroducer(target) == MakeKey(i + 1));
    CheckConsistency(registry);
  }

  REQUIRE(registry.GetWalkableAddresses() == std::vector<Address>{target});
  REQUIRE(registry.GetStats().edges == 1);
}

TEST_CASE("Registry adversarial - concurrent mutation and queries", "[discovery][registry][threading]") {
  PeerRegistry registry;
  const int num_threads = 8;
  const int ops_per_thread = 500;

  std::vector<std::thread> threads;
  for (int t = 0; t < num_threads; ++t) {
    threads.emplace_back([&registry, t]() {
      std::mt19937 rng(static_cast<uint32_t>(t + 1));
      for (int i = 0; i < ops_per_thread; ++i) {
        ApplyRandomOperation(registry, rng);
        (void)registry.ToJson();
      }
    });
  }

  for (auto& thread : threads) {
    thread.join();
  }

  CheckConsistency(registry);
}
