// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for network address parsing utilities
#include <catch2/catch_test_macros.hpp>

#include "util/netaddress.hpp"

#include <string>

using namespace overlay::util;

TEST_CASE("IsValidIPAddress", "[util][netaddress]") {
    SECTION("IPv4") {
        REQUIRE(IsValidIPAddress("192.168.1.1"));
        REQUIRE(IsValidIPAddress("127.0.0.1"));
        REQUIRE(IsValidIPAddress("255.255.255.255"));
        REQUIRE(IsValidIPAddress("0.0.0.0"));
    }

    SECTION("IPv6") {
        REQUIRE(IsValidIPAddress("2001:0db8:0000:0000:0000:0000:0000:0001"));
        REQUIRE(IsValidIPAddress("2001:db8::1"));
        REQUIRE(IsValidIPAddress("::1"));
        REQUIRE(IsValidIPAddress("::ffff:192.168.1.1"));
    }

    SECTION("Invalid inputs") {
        REQUIRE_FALSE(IsValidIPAddress(""));
        REQUIRE_FALSE(IsValidIPAddress("256.1.1.1"));
        REQUIRE_FALSE(IsValidIPAddress("1.2.3"));
        REQUIRE_FALSE(IsValidIPAddress("2001:db8::g"));
        REQUIRE_FALSE(IsValidIPAddress("localhost"));
        REQUIRE_FALSE(IsValidIPAddress("example.com"));
        REQUIRE_FALSE(IsValidIPAddress("192.168.1.1:8080"));
    }
}

TEST_CASE("ValidateAndNormalizeIP", "[util][netaddress]") {
    SECTION("IPv4 unchanged") {
        REQUIRE(ValidateAndNormalizeIP("192.168.1.1") == "192.168.1.1");
        REQUIRE(ValidateAndNormalizeIP("127.0.0.1") == "127.0.0.1");
    }

    SECTION("IPv6 compressed") {
        REQUIRE(ValidateAndNormalizeIP("2001:0db8:0000:0000:0000:0000:0000:0001") == "2001:db8::1");
        REQUIRE(ValidateAndNormalizeIP("::1") == "::1");
        REQUIRE(ValidateAndNormalizeIP("::") == "::");
    }

    SECTION("IPv4-mapped IPv6 collapses to IPv4") {
        REQUIRE(ValidateAndNormalizeIP("::ffff:192.168.1.1") == "192.168.1.1");
        REQUIRE(ValidateAndNormalizeIP("::ffff:93.184.0.1") == ValidateAndNormalizeIP("93.184.0.1"));
    }

    SECTION("Invalid inputs") {
        REQUIRE_FALSE(ValidateAndNormalizeIP("").has_value());
        REQUIRE_FALSE(ValidateAndNormalizeIP("999.1.1.1").has_value());
        REQUIRE_FALSE(ValidateAndNormalizeIP("::gggg").has_value());
        REQUIRE_FALSE(ValidateAndNormalizeIP("localhost").has_value());
    }
}

TEST_CASE("IsIPv6", "[util][netaddress]") {
    REQUIRE(IsIPv6("2001:db8::1"));
    REQUIRE(IsIPv6("::1"));
    REQUIRE_FALSE(IsIPv6("192.168.1.1"));
    REQUIRE_FALSE(IsIPv6("::ffff:192.168.1.1"));
    REQUIRE_FALSE(IsIPv6("not-an-ip"));
}

TEST_CASE("ParsePort", "[util][netaddress]") {
    REQUIRE(ParsePort("1") == 1);
    REQUIRE(ParsePort("8090") == 8090);
    REQUIRE(ParsePort("65535") == 65535);
    REQUIRE(ParsePort("08090") == 8090);

    REQUIRE_FALSE(ParsePort("").has_value());
    REQUIRE_FALSE(ParsePort("0").has_value());
    REQUIRE_FALSE(ParsePort("65536").has_value());
    REQUIRE_FALSE(ParsePort("123456").has_value());
    REQUIRE_FALSE(ParsePort("-1").has_value());
    REQUIRE_FALSE(ParsePort("+80").has_value());
    REQUIRE_FALSE(ParsePort("80a").has_value());
    REQUIRE_FALSE(ParsePort(" 80").has_value());
    REQUIRE_FALSE(ParsePort("80 ").has_value());
}

TEST_CASE("ParseIPPort - IPv4 format", "[util][netaddress]") {
    std::string ip;
    uint16_t port = 0;

    SECTION("Standard IPv4:port") {
        REQUIRE(ParseIPPort("192.168.1.1:8080", ip, port));
        REQUIRE(ip == "192.168.1.1");
        REQUIRE(port == 8080);
    }

    SECTION("Port bounds") {
        REQUIRE(ParseIPPort("10.0.0.1:1", ip, port));
        REQUIRE(port == 1);
        REQUIRE(ParseIPPort("10.0.0.1:65535", ip, port));
        REQUIRE(port == 65535);
    }
}

TEST_CASE("ParseIPPort - IPv6 format", "[util][netaddress]") {
    std::string ip;
    uint16_t port = 0;

    SECTION("Bracketed IPv6 with port") {
        REQUIRE(ParseIPPort("[2001:db8::1]:8090", ip, port));
        REQUIRE(ip == "2001:db8::1");
        REQUIRE(port == 8090);
    }

    SECTION("Full form is compressed") {
        REQUIRE(ParseIPPort("[2001:0db8:0000:0000:0000:0000:0000:0001]:9000", ip, port));
        REQUIRE(ip == "2001:db8::1");
    }

    SECTION("IPv4-mapped IPv6 is collapsed") {
        REQUIRE(ParseIPPort("[::ffff:192.168.1.1]:8090", ip, port));
        REQUIRE(ip == "192.168.1.1");
        REQUIRE(port == 8090);
    }
}

TEST_CASE("ParseIPPort - invalid formats", "[util][netaddress]") {
    std::string ip = "unchanged";
    uint16_t port = 7;

    REQUIRE_FALSE(ParseIPPort("", ip, port));
    REQUIRE_FALSE(ParseIPPort("192.168.1.1", ip, port));
    REQUIRE_FALSE(ParseIPPort("192.168.1.1:", ip, port));
    REQUIRE_FALSE(ParseIPPort("192.168.1.1:0", ip, port));
    REQUIRE_FALSE(ParseIPPort("192.168.1.1:-1", ip, port));
    REQUIRE_FALSE(ParseIPPort("192.168.1.1:65536", ip, port));
    REQUIRE_FALSE(ParseIPPort("192.168.1.1:abc", ip, port));
    REQUIRE_FALSE(ParseIPPort("192.168.1.1:80:90", ip, port));
    REQUIRE_FALSE(ParseIPPort("2001:db8::1:8090", ip, port));
    REQUIRE_FALSE(ParseIPPort("[2001:db8::1:8090", ip, port));
    REQUIRE_FALSE(ParseIPPort("[2001:db8::1]8090", ip, port));
    REQUIRE_FALSE(ParseIPPort("[]:8090", ip, port));
    REQUIRE_FALSE(ParseIPPort("256.1.1.1:8090", ip, port));
    REQUIRE_FALSE(ParseIPPort("localhost:8090", ip, port));
    REQUIRE_FALSE(ParseIPPort("http://1.2.3.4:80", ip, port));
    REQUIRE_FALSE(ParseIPPort(std::string(10000, 'A') + ":80", ip, port));

    // Outputs are only written on success
    REQUIRE(ip == "unchanged");
    REQUIRE(port == 7);
}
