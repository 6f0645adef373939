// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>

#include "common/peer_factory.hpp"
#include "discovery/types.hpp"

#include <cctype>
#include <unordered_set>

using namespace overlay::discovery;
using namespace overlay::test;

TEST_CASE("FixedBytes - hex and raw construction", "[discovery][types]") {
  SECTION("Default is null") {
    IdentityKey key;
    REQUIRE(key.IsNull());
    REQUIRE(key.ToHex() == std::string(40, '0'));
  }

  SECTION("Hex is lowercase and accepts either case") {
    auto key = MakeKey(0xDEADBEEF);
    auto hex = key.ToHex();
    REQUIRE(hex == "a5000000000000000000000000000000deadbeef");
    REQUIRE(IdentityKey::FromHex(hex) == key);

    std::string upper = hex;
    for (auto& c : upper) {
      c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    REQUIRE(IdentityKey::FromHex(upper) == key);
  }

  SECTION("Bad hex is rejected") {
    REQUIRE_FALSE(IdentityKey::FromHex("").has_value());
    REQUIRE_FALSE(IdentityKey::FromHex(std::string(38, 'a')).has_value());
    REQUIRE_FALSE(IdentityKey::FromHex(std::string(42, 'a')).has_value());
    REQUIRE_FALSE(IdentityKey::FromHex(std::string(39, 'a') + "z").has_value());
  }

  SECTION("FromBytes requires exact width") {
    std::vector<uint8_t> bytes(20, 0x11);
    auto service = ServiceId::FromBytes(bytes);
    REQUIRE(service.has_value());
    REQUIRE_FALSE(service->IsNull());

    bytes.push_back(0);
    REQUIRE_FALSE(ServiceId::FromBytes(bytes).has_value());
  }

  SECTION("Ordering follows byte order") {
    REQUIRE(MakeKey(1) < MakeKey(2));
    REQUIRE(MakeService(0) < MakeService(1));
    REQUIRE(MakeKey(3) == MakeKey(3));
  }
}

TEST_CASE("Address - parsing and formatting", "[discovery][types]") {
  SECTION("IPv4") {
    auto addr = Address::Parse("93.184.0.1:8090");
    REQUIRE(addr.has_value());
    REQUIRE(*addr == MakeAddress(1));
    REQUIRE(addr->ToString() == "93.184.0.1:8090");
  }

  SECTION("IPv6 is bracketed on output") {
    auto addr = Address::Parse("[2001:0db8::0001]:9000");
    REQUIRE(addr.has_value());
    REQUIRE(addr->host == "2001:db8::1");
    REQUIRE(addr->ToString() == "[2001:db8::1]:9000");
    REQUIRE(Address::Parse(addr->ToString()) == addr);
  }

  SECTION("IPv4-mapped endpoints compare equal to IPv4") {
    REQUIRE(Address::Parse("[::ffff:93.184.0.1]:8090") == MakeAddress(1));
  }

  SECTION("Invalid endpoints") {
    REQUIRE_FALSE(Address::Parse("93.184.0.1").has_value());
    REQUIRE_FALSE(Address::Parse("host.example:8090").has_value());
    REQUIRE_FALSE(Address::Parse("2001:db8::1:8090").has_value());
  }

  SECTION("Equality and hashing use host and port") {
    std::unordered_set<Address> set{MakeAddress(1), MakeAddress(1), MakeAddress(1, 8091)};
    REQUIRE(set.size() == 2);
    REQUIRE(MakeAddress(1) != MakeAddress(1, 8091));
    REQUIRE(MakeAddress(1) < MakeAddress(2));
  }
}

TEST_CASE("VerifiedPeer - identity and clock", "[discovery][types]") {
  auto peer = MakePeer(1);

  SECTION("Equality is by key only") {
    auto moved = peer;
    moved.address = MakeAddress(9);
    moved.public_key.clear();
    REQUIRE(moved == peer);
    REQUIRE_FALSE(MakePeer(2) == peer);
  }

  SECTION("Lamport clock never goes backwards") {
    peer.UpdateClock(5);
    REQUIRE(peer.lamport_clock == 5);
    peer.UpdateClock(3);
    REQUIRE(peer.lamport_clock == 5);
    peer.UpdateClock(8);
    REQUIRE(peer.lamport_clock == 8);
  }
}
