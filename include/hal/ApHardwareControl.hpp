#pragma once
/** @file  ApHardwareControl.hpp
 *  @brief Driver/HAL control surface consumed by the soft AP state machine,
 *         plus the sink its asynchronous notifications are delivered to.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <optional>
#include <string>
#include <vector>

#include "model/ApConfiguration.hpp"
#include "model/ApTypes.hpp"
#include "model/MacAddress.hpp"

namespace apctl::hal {

  /**
 * @class ApEventSink
 * @brief Asynchronous driver notifications.
 *
 *  * May be invoked from any thread; implementations only enqueue.
 *  * `instance` is the bridged leg name, or the interface name for a single AP.
 */
  class ApEventSink {
  public:
    virtual ~ApEventSink() = default;

    virtual void onInterfaceUp(const std::string& iface) = 0;
    virtual void onInterfaceDown(const std::string& iface) = 0;
    virtual void onInterfaceDestroyed(const std::string& iface) = 0;
    virtual void onFailure() = 0;
    virtual void onInstanceFailure(const std::string& instance) = 0;
    virtual void onInfoChanged(const model::InstanceInfo& info) = 0;
    virtual void onConnectedClientsChanged(const std::string& instance,
                                           const model::MacAddress& mac, bool connected) = 0;
  };

  /// Outcome of interface-conflict arbitration with other radio users.
  enum class ConflictDecision { Proceed, UserRejected };

  /**
 * @class ApHardwareControl
 * @brief Opaque collaborator that programs the radio.
 *
 *  * All calls are synchronous and made from the state machine's queue.
 *  * Virtual so tests can substitute a recording fake.
 */
  class ApHardwareControl {
  public:
    virtual ~ApHardwareControl() = default;

    //---interface arbitration -----------------------------------------------
    virtual ConflictDecision manageInterfaceConflict(bool bridged, const std::string& requestor,
                                                     bool bypassDialog) = 0;
    virtual bool isApInterfaceCreationPossible(const std::string& requestor) = 0;
    virtual bool isBridgedApInterfaceCreationPossible(const std::string& requestor) = 0;
    /// True when a bridged AP would destroy an existing iface but a single AP would not.
    virtual bool shouldDowngradeToSingleApForConcurrency(const std::string& requestor) = 0;
    virtual bool isStaApConcurrencySupported() = 0;

    //---interface lifecycle ---------------------------------------------------
    /// @returns the interface name, or std::nullopt on failure.
    virtual std::optional<std::string> bringUpInterface(model::Band band, bool bridged,
                                                        const model::VendorData& vendorData,
                                                        const std::string& requestor,
                                                        ApEventSink& sink) = 0;
    virtual void teardownInterface(const std::string& iface) = 0;
    virtual bool isInterfaceUp(const std::string& iface) = 0;

    //---configuration ---------------------------------------------------------
    virtual bool setCountryCode(const std::string& iface, const std::string& code) = 0;
    virtual bool resetToFactoryMacAddress(const std::string& iface) = 0;
    virtual bool isSetMacAddressSupported(const std::string& iface) = 0;
    virtual bool setMacAddress(const std::string& iface, const model::MacAddress& mac) = 0;

    /// Hand the resolved configuration to the AP daemon.
    virtual model::StartResult startAp(const std::string& iface,
                                       const model::ActiveConfiguration& config,
                                       bool tethered) = 0;

    //---runtime ---------------------------------------------------------------
    virtual bool forceClientDisconnect(const std::string& iface, const model::MacAddress& mac,
                                       model::BlockReason reason) = 0;
    virtual std::vector<std::string> getBridgedInstances(const std::string& iface) = 0;
    virtual bool removeInstanceFromBridgedInterface(const std::string& iface,
                                                    const std::string& instance) = 0;
  };

} // namespace apctl::hal
