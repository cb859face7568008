/* @file ClientAdmission.cpp
 * @brief admission checks, eviction planning and client bookkeeping
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>

// apctl headers
#include "core/ClientAdmission.hpp"

using namespace apctl::core;
using apctl::model::BlockReason;
using apctl::model::CapabilitySnapshot;
using apctl::model::ConnectedClient;
using apctl::model::DesiredConfiguration;
using apctl::model::Feature;
using apctl::model::MacAddress;

//---ClientAdmissionController-----------------------------------------------

int ClientAdmissionController::effectiveCapacity(const DesiredConfiguration& settings,
                                                 const CapabilitySnapshot& capability) {
  int capacity = capability.maxSupportedClients;
  if (settings.maxClients > 0)
    capacity = std::min(capacity, settings.maxClients);
  return capacity;
}

bool ClientAdmissionController::isUserBlocked(const MacAddress& mac,
                                              const DesiredConfiguration& settings) {
  if (settings.blockedClients.count(mac) != 0)
    return true;
  return settings.clientControlByUser && settings.allowedClients.count(mac) == 0;
}

AdmissionDecision ClientAdmissionController::admit(const MacAddress& mac,
                                                   const DesiredConfiguration& settings,
                                                   const CapabilitySnapshot& capability,
                                                   std::size_t currentCount) const {
  if (!capability.hasFeature(Feature::ClientForceDisconnect))
    return {};

  if (isUserBlocked(mac, settings))
    return { false, BlockReason::BlockedByUser };

  const int capacity = effectiveCapacity(settings, capability);
  if (static_cast<long>(currentCount) >= capacity)
    return { false, BlockReason::NoMoreStations };

  return {};
}

std::vector<Eviction>
ClientAdmissionController::planEvictions(const std::vector<ConnectedClient>& admissionOrder,
                                         const DesiredConfiguration& settings,
                                         const CapabilitySnapshot& capability) const {
  std::vector<Eviction> evictions;
  if (!capability.hasFeature(Feature::ClientForceDisconnect))
    return evictions;

  std::vector<ConnectedClient> allowed;
  for (const auto& client : admissionOrder) {
    if (isUserBlocked(client.mac, settings))
      evictions.push_back({ client, BlockReason::BlockedByUser });
    else
      allowed.push_back(client);
  }

  const long capacity = std::max(0, effectiveCapacity(settings, capability));
  long overflow = static_cast<long>(allowed.size()) - capacity;
  for (auto it = allowed.rbegin(); it != allowed.rend() && overflow > 0; ++it, --overflow)
    evictions.push_back({ *it, BlockReason::NoMoreStations });

  return evictions;
}

//---ClientRegistry----------------------------------------------------------

bool ClientRegistry::add(const ConnectedClient& client) {
  if (contains(client))
    return false;
  order_.push_back(client);
  byInstance_[client.instance].push_back(client);
  return true;
}

bool ClientRegistry::remove(const ConnectedClient& client) {
  auto it = std::find(order_.begin(), order_.end(), client);
  if (it == order_.end())
    return false;
  order_.erase(it);
  auto& bucket = byInstance_[client.instance];
  bucket.erase(std::remove(bucket.begin(), bucket.end(), client), bucket.end());
  return true;
}

bool ClientRegistry::contains(const ConnectedClient& client) const {
  return std::find(order_.begin(), order_.end(), client) != order_.end();
}

bool ClientRegistry::containsMac(const MacAddress& mac) const {
  return std::any_of(order_.begin(), order_.end(),
                     [&](const ConnectedClient& c) { return c.mac == mac; });
}

std::size_t ClientRegistry::countOn(const std::string& instance) const {
  auto it = byInstance_.find(instance);
  return it == byInstance_.end() ? 0 : it->second.size();
}

void ClientRegistry::ensureInstance(const std::string& instance) { byInstance_[instance]; }

void ClientRegistry::removeInstance(const std::string& instance) {
  order_.erase(std::remove_if(order_.begin(), order_.end(),
                              [&](const ConnectedClient& c) { return c.instance == instance; }),
               order_.end());
  byInstance_.erase(instance);
}

void ClientRegistry::clear() {
  order_.clear();
  byInstance_.clear();
}

//---PendingDisconnectList---------------------------------------------------

void PendingDisconnectList::add(const ConnectedClient& client, BlockReason reason) {
  pending_[client] = reason;
}

bool PendingDisconnectList::remove(const ConnectedClient& client) {
  return pending_.erase(client) != 0;
}

std::size_t PendingDisconnectList::removeMac(const MacAddress& mac) {
  return std::erase_if(pending_, [&](const auto& entry) { return entry.first.mac == mac; });
}

bool PendingDisconnectList::containsMac(const MacAddress& mac) const {
  return std::any_of(pending_.begin(), pending_.end(),
                     [&](const auto& entry) { return entry.first.mac == mac; });
}
