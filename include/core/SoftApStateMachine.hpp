#pragma once
/** @file  SoftApStateMachine.hpp
 *  @brief Lifecycle of one soft AP radio: negotiated bring-up, client
 *         admission, idle shutdown and teardown.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <variant>

// apctl headers
#include "core/ChannelResolver.hpp"
#include "core/ClientAdmission.hpp"
#include "core/Commands.hpp"
#include "core/DeviceOverlay.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/Scheduler.hpp"
#include "core/ShutdownTimerManager.hpp"
#include "core/SoftApListener.hpp"
#include "hal/ApHardwareControl.hpp"

namespace apctl::core {

  /// Coarse lifecycle visible to the owner.
  enum class LifecycleState : std::uint8_t { Idle, NegotiatingStart, Running, Stopped };

  const char* toString(LifecycleState state);

  namespace state {
    struct Idle {};

    /// Interface is up and configured; waiting for the driver to confirm the country code.
    struct WaitingForCountryCode {
      Scheduler::TimerId timeout{ Scheduler::kInvalidTimer };
      std::deque<Command> deferred; ///< replayed in arrival order once the wait resolves
    };

    struct Running {
      bool ifaceUp{ false };
      bool ifaceDestroyed{ false };
    };

    struct Stopped {};
  } // namespace state

  using State = std::variant<state::Idle, state::WaitingForCountryCode, state::Running,
                             state::Stopped>;

  /**
 * @class SoftApStateMachine
 * @brief One instance per start/stop cycle; terminal once stopped.
 *
 *  * Every public call and every hardware notification only posts a command
 *    value to the scheduler; commands run one at a time to completion.
 *  * State getters are meant for the scheduler thread (or a quiescent test
 *    scheduler).
 *  * Owner must keep the scheduler from running this machine's tasks after
 *    destroying it (stop the EventLoop first).
 */
  class SoftApStateMachine : public hal::ApEventSink {
  public:
    static constexpr std::chrono::milliseconds kCountryCodeWaitTimeout{ 5000 };

    SoftApStateMachine(std::shared_ptr<hal::ApHardwareControl> hardware,
                       std::shared_ptr<Scheduler> scheduler, SoftApListener& listener,
                       std::shared_ptr<ErrorMonitor> errorMonitor, std::shared_ptr<Logger> logger,
                       DeviceOverlay overlay = {});
    ~SoftApStateMachine() override; ///< cancels the machine's own timers

    //---owner API (thread-safe, asynchronous)----------------------------
    void start(StartRequest request);
    void stop();
    void updateCapability(model::CapabilitySnapshot capability);
    void updateConfiguration(model::DesiredConfiguration config);
    void updateCountryCode(std::string countryCode);
    void onDriverCountryCodeChanged(std::string countryCode);
    void onSafeChannelsChanged(std::set<int> unsafeFrequencies, bool restrictsSoftAp);
    void onStationConnected(int frequencyMhz);
    void updatePluggedState(bool plugged);

    //---hal::ApEventSink---------------------------------------------------
    void onInterfaceUp(const std::string& iface) override;
    void onInterfaceDown(const std::string& iface) override;
    void onInterfaceDestroyed(const std::string& iface) override;
    void onFailure() override;
    void onInstanceFailure(const std::string& instance) override;
    void onInfoChanged(const model::InstanceInfo& info) override;
    void onConnectedClientsChanged(const std::string& instance, const model::MacAddress& mac,
                                   bool connected) override;

    //---state getters (scheduler thread)--------------------------------
    LifecycleState lifecycleState() const;
    model::ApState apState() const { return apState_; }
    const std::string& interfaceName() const { return iface_; }
    const std::optional<model::ActiveConfiguration>& activeConfiguration() const { return active_; }
    const model::CapabilitySnapshot& capability() const { return capability_; }
    const std::string& countryCode() const { return countryCode_; }
    const model::InstanceInfoMap& instanceInfos() const { return infos_; }
    const model::ClientMap& connectedClients() const { return clients_.byInstance(); }
    std::size_t connectedClientCount() const { return clients_.size(); }
    const PendingDisconnectList& pendingDisconnects() const { return pending_; }
    const SafeChannelSet& safeChannels() const { return safeChannels_; }
    const ShutdownTimerManager& timers() const { return timers_; }
    std::size_t deferredCommandCount() const;

    //---non-copyable (queued tasks capture this)-------------------------
    SoftApStateMachine(const SoftApStateMachine&) = delete;
    SoftApStateMachine& operator=(const SoftApStateMachine&) = delete;

  private:
    enum class StateId : std::uint8_t { Idle, WaitingForCountryCode, Running, Stopped };
    static StateId idOf(const State& s) { return static_cast<StateId>(s.index()); }
    static bool isAllowed(StateId from, StateId to);
    void transitionTo(State next);

    //---queue------------------------------------------------------------
    void enqueue(Command command);
    void dispatch(Command command);

    //---command handlers-------------------------------------------------
    void on(const cmd::Start& c);
    void on(const cmd::Stop& c);
    void on(const cmd::Failure& c);
    void on(const cmd::InterfaceStatusChanged& c);
    void on(const cmd::InterfaceDestroyed& c);
    void on(const cmd::InterfaceDown& c);
    void on(const cmd::ClientChanged& c);
    void on(const cmd::ApInfoChanged& c);
    void on(const cmd::UpdateCapability& c);
    void on(const cmd::UpdateConfig& c);
    void on(const cmd::ForceDisconnectPending& c);
    void on(const cmd::IdleTimeout& c);
    void on(const cmd::InstanceIdleTimeout& c);
    void on(const cmd::SafeChannelsChanged& c);
    void on(const cmd::StationConnected& c);
    void on(const cmd::UpdateCountryCode& c);
    void on(const cmd::DriverCountryCodeChanged& c);
    void on(const cmd::CountryCodeWaitTimedOut& c);
    void on(const cmd::PluggedStateChanged& c);

    //---start sequence---------------------------------------------------
    Resolution resolveConfiguration(bool countryCodeChangePending);
    bool bringUpInterface();
    bool applyCountryCode();
    model::StartResult adoptConfirmedCountryCode(const std::string& code);
    void finishCountryCodeWait(const std::optional<std::string>& confirmedCode);
    model::StartResult configureMacAddress();
    model::StartResult startSoftAp();
    void enterRunning();
    void failStart(model::StartResult result);

    //---running helpers--------------------------------------------------
    void onUpChanged(bool up);
    void updateInstanceInfo(const model::InstanceInfo& info);
    void removeInstance(const std::string& instance);
    void updateClientConnection();
    void forceDisconnect(const model::ConnectedClient& client, model::BlockReason reason);
    void schedulePendingRetry();
    void notifyClientsOrInfo();
    void rescheduleTimers(const std::string& changedKey);
    TimerContext timerContext() const;

    //---stop sequence----------------------------------------------------
    void stopRunning(model::StopEvent event, bool failure);
    void exitRunning(bool ifaceDestroyed);
    void terminate();

    //---misc---------------------------------------------------------------
    void setApState(model::ApState next,
                    model::FailureReason reason = model::FailureReason::None);
    void reportStartResult(model::StartResult result);
    void reportStopEvent(model::StopEvent event);
    void recomputeSafeChannels();
    void disconnectAllClients();
    void releaseInterface();
    const model::DesiredConfiguration& settings() const;
    std::chrono::milliseconds shutdownTimeout() const;
    std::chrono::milliseconds instanceShutdownTimeout() const;
    bool instanceShutdownEnabled() const;
    std::string highestFrequencyInstance(const std::set<std::string>& instances) const;
    std::string tag() const;

    std::shared_ptr<hal::ApHardwareControl> hardware_;
    std::shared_ptr<Scheduler> scheduler_;
    SoftApListener& listener_;
    std::shared_ptr<ErrorMonitor> errorMonitor_;
    std::shared_ptr<Logger> logger_;
    DeviceOverlay overlay_;

    ChannelResolver resolver_;
    ClientAdmissionController admission_;
    ShutdownTimerManager timers_;

    State state_{ state::Idle{} };
    model::ApState apState_{ model::ApState::Disabled };

    StartRequest request_;                 ///< last start request (config replaced by updates)
    model::CapabilitySnapshot capability_;
    std::string countryCode_;
    std::optional<model::ActiveConfiguration> active_;
    std::string iface_;

    SafeChannelSet safeChannels_;
    std::set<int> coexUnsafe_;
    bool coexRestrictsSoftAp_{ true };
    bool plugged_{ false };

    model::InstanceInfoMap infos_;
    ClientRegistry clients_;
    PendingDisconnectList pending_;
    Scheduler::TimerId pendingRetryTimer_{ Scheduler::kInvalidTimer };

    bool startResultReported_{ false };
    bool stopEventReported_{ false };
  };

} // namespace apctl::core
