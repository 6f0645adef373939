// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/blacklist.hpp"

#include "util/logging.hpp"

#include <fstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace overlay {
namespace discovery {

bool Blacklist::LoadFromFile(const std::string& path) {
  if (path.empty()) {
    return true;
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    LOG_DISC_TRACE("Blacklist: no exclusion list found at {}", path);
    return true;  // Not an error - nothing to exclude
  }

  try {
    json j;
    file >> j;

    size_t loaded = 0;
    size_t skipped = 0;

    if (j.contains("addresses")) {
      for (const auto& entry : j.at("addresses")) {
        auto addr = entry.is_string() ? Address::Parse(entry.get<std::string>()) : std::nullopt;
        if (!addr) {
          LOG_DISC_WARN("Blacklist: skipping malformed address entry {} in {}", entry.dump(), path);
          skipped++;
          continue;
        }
        addresses_.insert(*addr);
        loaded++;
      }
    }

    if (j.contains("identities")) {
      for (const auto& entry : j.at("identities")) {
        auto key = entry.is_string() ? IdentityKey::FromHex(entry.get<std::string>()) : std::nullopt;
        if (!key) {
          LOG_DISC_WARN("Blacklist: skipping malformed identity entry {} in {}", entry.dump(), path);
          skipped++;
          continue;
        }
        identities_.insert(*key);
        loaded++;
      }
    }

    LOG_DISC_DEBUG("Blacklist: loaded {} entries from {} (skipped {})", loaded, path, skipped);
    return true;

  } catch (const std::exception& e) {
    LOG_DISC_ERROR("Blacklist: failed to parse {}: {}", path, e.what());
    return false;
  }
}

}  // namespace discovery
}  // namespace overlay
