#pragma once
/** @file  ClientAdmission.hpp
 *  @brief Station admission policy, connected-client registry and the
 *         pending forced-disconnect list.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "model/ApConfiguration.hpp"
#include "model/ApTypes.hpp"
#include "model/Capability.hpp"

namespace apctl::core {

  struct AdmissionDecision {
    bool allowed{ true };
    model::BlockReason reason{ model::BlockReason::Unspecified };
  };

  struct Eviction {
    model::ConnectedClient client;
    model::BlockReason reason{ model::BlockReason::Unspecified };
  };

  /**
 * @class ClientAdmissionController
 * @brief Stateless policy: blocked list, then allow list, then capacity.
 *
 *  * Admission is bypassed entirely when the driver cannot force a disconnect.
 */
  class ClientAdmissionController {
  public:
    AdmissionDecision admit(const model::MacAddress& mac,
                            const model::DesiredConfiguration& settings,
                            const model::CapabilitySnapshot& capability,
                            std::size_t currentCount) const;

    /// min(hardware capacity, configured max if positive).
    static int effectiveCapacity(const model::DesiredConfiguration& settings,
                                 const model::CapabilitySnapshot& capability);

    /**
     * @brief Clients to force off after a capacity or list change.
     *
     * @param admissionOrder connected clients, oldest admission first.
     * @return blocked / not-allowed clients first, then the most recently
     *         admitted clients until the capacity holds.
     */
    std::vector<Eviction> planEvictions(const std::vector<model::ConnectedClient>& admissionOrder,
                                        const model::DesiredConfiguration& settings,
                                        const model::CapabilitySnapshot& capability) const;

  private:
    static bool isUserBlocked(const model::MacAddress& mac,
                              const model::DesiredConfiguration& settings);
  };

  /**
 * @class ClientRegistry
 * @brief Connected stations grouped by instance, remembering admission order.
 */
  class ClientRegistry {
  public:
    /// @returns false if the client is already present.
    bool add(const model::ConnectedClient& client);

    /// @returns false if the client was not present.
    bool remove(const model::ConnectedClient& client);

    bool contains(const model::ConnectedClient& client) const;
    bool containsMac(const model::MacAddress& mac) const;

    std::size_t size() const { return order_.size(); }
    std::size_t countOn(const std::string& instance) const;

    /// Make sure an (empty) bucket exists for \p instance.
    void ensureInstance(const std::string& instance);
    void removeInstance(const std::string& instance);
    void clear();

    const std::vector<model::ConnectedClient>& admissionOrder() const { return order_; }
    const model::ClientMap& byInstance() const { return byInstance_; }

  private:
    std::vector<model::ConnectedClient> order_; ///< oldest first
    model::ClientMap byInstance_;
  };

  /**
 * @class PendingDisconnectList
 * @brief Rejected/evicted clients whose forced disconnect is not confirmed yet.
 */
  class PendingDisconnectList {
  public:
    static constexpr std::chrono::milliseconds kRetryInterval{ 1000 };

    void add(const model::ConnectedClient& client, model::BlockReason reason);
    bool remove(const model::ConnectedClient& client);
    /// Drop every entry for \p mac; @returns the number removed.
    std::size_t removeMac(const model::MacAddress& mac);
    bool containsMac(const model::MacAddress& mac) const;
    bool empty() const { return pending_.empty(); }
    std::size_t size() const { return pending_.size(); }
    void clear() { pending_.clear(); }

    const std::map<model::ConnectedClient, model::BlockReason>& entries() const {
      return pending_;
    }

  private:
    std::map<model::ConnectedClient, model::BlockReason> pending_;
  };

} // namespace apctl::core
