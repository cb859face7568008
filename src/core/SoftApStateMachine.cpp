/* @file SoftApStateMachine.cpp
 * @brief command handlers of the soft AP lifecycle
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>
#include <utility>

// apctl headers
#include "core/SoftApStateMachine.hpp"

using namespace apctl::core;
using apctl::model::ApState;
using apctl::model::Band;
using apctl::model::BlockReason;
using apctl::model::ConnectedClient;
using apctl::model::DesiredConfiguration;
using apctl::model::FailureReason;
using apctl::model::Feature;
using apctl::model::InstanceInfo;
using apctl::model::StartResult;
using apctl::model::StopEvent;

namespace {

  std::string upper(std::string code) {
    std::transform(code.begin(), code.end(), code.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return code;
  }

  bool sameCountryCode(const std::string& a, const std::string& b) { return upper(a) == upper(b); }

} // namespace

const char* apctl::core::toString(LifecycleState state) {
  switch (state) {
  case LifecycleState::Idle:
    return "Idle";
  case LifecycleState::NegotiatingStart:
    return "NegotiatingStart";
  case LifecycleState::Running:
    return "Running";
  case LifecycleState::Stopped:
    return "Stopped";
  default:
    return "Unknown";
  }
}

SoftApStateMachine::SoftApStateMachine(std::shared_ptr<hal::ApHardwareControl> hardware,
                                       std::shared_ptr<Scheduler> scheduler,
                                       SoftApListener& listener,
                                       std::shared_ptr<ErrorMonitor> errorMonitor,
                                       std::shared_ptr<Logger> logger, DeviceOverlay overlay)
    : hardware_(std::move(hardware)), scheduler_(std::move(scheduler)), listener_(listener),
      errorMonitor_(std::move(errorMonitor)), logger_(std::move(logger)),
      overlay_(std::move(overlay)), resolver_(overlay_),
      timers_(scheduler_, [this](const std::string& key) {
        if (key == iface_)
          enqueue(cmd::IdleTimeout{ key });
        else
          enqueue(cmd::InstanceIdleTimeout{ key });
      }) {
  if (!hardware_)
    throw std::invalid_argument("[SoftApStateMachine] hardware control is nullptr");
  if (!errorMonitor_)
    throw std::invalid_argument("[SoftApStateMachine] error monitor is nullptr");
  if (!logger_)
    throw std::invalid_argument("[SoftApStateMachine] logger is nullptr");
}

SoftApStateMachine::~SoftApStateMachine() {
  if (pendingRetryTimer_ != Scheduler::kInvalidTimer)
    scheduler_->cancel(pendingRetryTimer_);
  if (auto* wait = std::get_if<state::WaitingForCountryCode>(&state_))
    scheduler_->cancel(wait->timeout);
}

//---owner API---------------------------------------------------------------

void SoftApStateMachine::start(StartRequest request) {
  enqueue(cmd::Start{ std::move(request) });
}

void SoftApStateMachine::stop() { enqueue(cmd::Stop{}); }

void SoftApStateMachine::updateCapability(model::CapabilitySnapshot capability) {
  enqueue(cmd::UpdateCapability{ std::move(capability) });
}

void SoftApStateMachine::updateConfiguration(DesiredConfiguration config) {
  enqueue(cmd::UpdateConfig{ std::move(config) });
}

void SoftApStateMachine::updateCountryCode(std::string countryCode) {
  enqueue(cmd::UpdateCountryCode{ std::move(countryCode) });
}

void SoftApStateMachine::onDriverCountryCodeChanged(std::string countryCode) {
  enqueue(cmd::DriverCountryCodeChanged{ std::move(countryCode) });
}

void SoftApStateMachine::onSafeChannelsChanged(std::set<int> unsafeFrequencies,
                                               bool restrictsSoftAp) {
  enqueue(cmd::SafeChannelsChanged{ std::move(unsafeFrequencies), restrictsSoftAp });
}

void SoftApStateMachine::onStationConnected(int frequencyMhz) {
  enqueue(cmd::StationConnected{ frequencyMhz });
}

void SoftApStateMachine::updatePluggedState(bool plugged) {
  enqueue(cmd::PluggedStateChanged{ plugged });
}

//---hal::ApEventSink----------------------------------------------------------

void SoftApStateMachine::onInterfaceUp(const std::string& iface) {
  enqueue(cmd::InterfaceStatusChanged{ iface, true });
}

void SoftApStateMachine::onInterfaceDown(const std::string& iface) {
  enqueue(cmd::InterfaceStatusChanged{ iface, false });
}

void SoftApStateMachine::onInterfaceDestroyed(const std::string& iface) {
  enqueue(cmd::InterfaceDestroyed{ iface });
}

void SoftApStateMachine::onFailure() { enqueue(cmd::Failure{}); }

void SoftApStateMachine::onInstanceFailure(const std::string& instance) {
  enqueue(cmd::Failure{ instance });
}

void SoftApStateMachine::onInfoChanged(const InstanceInfo& info) {
  enqueue(cmd::ApInfoChanged{ info });
}

void SoftApStateMachine::onConnectedClientsChanged(const std::string& instance,
                                                   const model::MacAddress& mac,
                                                   bool connected) {
  enqueue(cmd::ClientChanged{ ConnectedClient{ mac, instance }, connected });
}

//---getters-------------------------------------------------------------------

LifecycleState SoftApStateMachine::lifecycleState() const {
  switch (idOf(state_)) {
  case StateId::WaitingForCountryCode:
    return LifecycleState::NegotiatingStart;
  case StateId::Running:
    return LifecycleState::Running;
  case StateId::Stopped:
    return LifecycleState::Stopped;
  default:
    return LifecycleState::Idle;
  }
}

std::size_t SoftApStateMachine::deferredCommandCount() const {
  auto* wait = std::get_if<state::WaitingForCountryCode>(&state_);
  return wait ? wait->deferred.size() : 0;
}

//---states and queue----------------------------------------------------------

bool SoftApStateMachine::isAllowed(StateId from, StateId to) {
  // rows: from, columns: to (Idle, WaitingForCountryCode, Running, Stopped)
  static constexpr std::array<std::array<bool, 4>, 4> kTransitions{ {
      { false, true, true, true },   // Idle
      { true, false, true, true },   // WaitingForCountryCode
      { false, false, false, true }, // Running
      { false, false, false, false } // Stopped
  } };
  return kTransitions[static_cast<std::size_t>(from)][static_cast<std::size_t>(to)];
}

void SoftApStateMachine::transitionTo(State next) {
  const StateId from = idOf(state_);
  const StateId to = idOf(next);
  if (!isAllowed(from, to))
    throw std::logic_error("[SoftApStateMachine] illegal transition " +
                           std::to_string(static_cast<int>(from)) + " -> " +
                           std::to_string(static_cast<int>(to)));
  state_ = std::move(next);
}

void SoftApStateMachine::enqueue(Command command) {
  scheduler_->post([this, command = std::move(command)]() mutable {
    dispatch(std::move(command));
  });
}

void SoftApStateMachine::dispatch(Command command) {
  if (std::holds_alternative<state::Stopped>(state_)) {
    logger_->debug(tag(), std::string("drop ") + commandName(command) + " after stop");
    return;
  }

  if (auto* wait = std::get_if<state::WaitingForCountryCode>(&state_)) {
    const bool resolvesWait = std::holds_alternative<cmd::Stop>(command) ||
                              std::holds_alternative<cmd::DriverCountryCodeChanged>(command) ||
                              std::holds_alternative<cmd::CountryCodeWaitTimedOut>(command);
    if (!resolvesWait) {
      logger_->info(tag(), std::string("defer ") + commandName(command) +
                               " while waiting for driver country code change");
      wait->deferred.push_back(std::move(command));
      return;
    }
  }

  std::visit([this](const auto& c) { on(c); }, command);
}

//---start---------------------------------------------------------------------

void SoftApStateMachine::on(const cmd::Start& c) {
  if (!std::holds_alternative<state::Idle>(state_)) {
    logger_->warn(tag(), std::string("start ignored in state ") + toString(lifecycleState()));
    return;
  }

  const std::string storedCountryCode = countryCode_;
  request_ = c.request;
  capability_ = request_.capability;
  countryCode_ = request_.countryCode.empty() ? storedCountryCode : request_.countryCode;
  active_.reset();
  startResultReported_ = false;

  if (request_.config.ssid.empty()) {
    logger_->error(tag(), "unable to start soft AP without valid configuration");
    failStart(StartResult::FailureGeneral);
    return;
  }

  const bool countryCodeChanged =
      !countryCode_.empty() && !sameCountryCode(countryCode_, capability_.countryCode);
  if (countryCodeChanged)
    logger_->info(tag(), "country code changed: requested " + countryCode_ +
                             ", capability reports " + capability_.countryCode);

  recomputeSafeChannels();

  Resolution resolution = resolveConfiguration(countryCodeChanged);
  if (!resolution.ok()) {
    failStart(resolution.result);
    return;
  }
  active_ = std::move(resolution.config);
  if (active_->fellBackToSingle)
    logger_->info(tag(), "fallback to single AP mode with band " + model::toString(active_->band()));

  const bool tethered = request_.mode == model::TargetMode::Tethered;
  if (hardware_->manageInterfaceConflict(active_->isBridgeRequired(), request_.requestor,
                                         tethered) == hal::ConflictDecision::UserRejected) {
    logger_->error(tag(), "user refused to set up interface");
    failStart(StartResult::FailureInterfaceConflictUserRejected);
    return;
  }

  // a bridged request already fell back to single AP if bridged was impossible
  if (!hardware_->isApInterfaceCreationPossible(request_.requestor)) {
    failStart(StartResult::FailureInterfaceConflict);
    return;
  }

  if (!bringUpInterface()) {
    failStart(StartResult::FailureCreateInterface);
    return;
  }
  setApState(ApState::Enabling);

  if (!applyCountryCode()) {
    failStart(StartResult::FailureSetCountryCode);
    return;
  }

  if (countryCodeChanged) {
    logger_->info(tag(), "need to wait for driver country code update before starting");
    state::WaitingForCountryCode wait;
    wait.timeout = scheduler_->postDelayed(
        [this] { enqueue(cmd::CountryCodeWaitTimedOut{}); }, kCountryCodeWaitTimeout);
    transitionTo(std::move(wait));
    return;
  }

  const StartResult result = startSoftAp();
  if (result != StartResult::Success) {
    failStart(result);
    return;
  }
  enterRunning();
}

Resolution SoftApStateMachine::resolveConfiguration(bool countryCodeChangePending) {
  ResolveInputs in;
  in.desired = request_.config;
  in.capability = capability_;
  in.safeChannels = safeChannels_;
  in.countryCode = countryCode_;
  in.countryCodeChangePending = countryCodeChangePending;
  in.concurrency.stationFrequencies = request_.stationFrequencies;
  if (request_.config.isBridged()) {
    in.concurrency.bridgedIfacePossible =
        hardware_->isBridgedApInterfaceCreationPossible(request_.requestor);
    in.concurrency.bridgedWouldDestroyExisting =
        hardware_->shouldDowngradeToSingleApForConcurrency(request_.requestor);
    in.concurrency.staApConcurrencySupported = hardware_->isStaApConcurrencySupported();
  }
  return resolver_.resolve(in);
}

bool SoftApStateMachine::bringUpInterface() {
  auto name = hardware_->bringUpInterface(active_->band(), active_->isBridgeRequired(),
                                          active_->settings.vendorData, request_.requestor,
                                          *this);
  if (!name || name->empty()) {
    logger_->error(tag(), "setup failure when creating ap interface");
    return false;
  }
  iface_ = *name;
  return true;
}

bool SoftApStateMachine::applyCountryCode() {
  const Band band = active_->band();
  const bool mandatory = !active_->isBridged() && (band == Band::Ghz5 || band == Band::Ghz6);

  if (countryCode_.empty()) {
    if (mandatory) {
      logger_->error(tag(), "country code required for soft AP in band " + model::toString(band));
      return false;
    }
    return true;
  }

  if (!hardware_->setCountryCode(iface_, upper(countryCode_))) {
    if (mandatory) {
      logger_->error(tag(), "failed to set country code required for band " +
                                model::toString(band));
      return false;
    }
    logger_->warn(tag(), "failed to set country code " + countryCode_ + ", continuing");
  }
  return true;
}

void SoftApStateMachine::on(const cmd::DriverCountryCodeChanged& c) {
  if (!std::holds_alternative<state::WaitingForCountryCode>(state_))
    return;
  if (!sameCountryCode(c.code, countryCode_)) {
    logger_->info(tag(), "ignore country code changed: " + c.code);
    return;
  }
  logger_->info(tag(), "driver country code changed to " + c.code + ", continue starting");
  finishCountryCodeWait(c.code);
}

void SoftApStateMachine::on(const cmd::CountryCodeWaitTimedOut&) {
  if (!std::holds_alternative<state::WaitingForCountryCode>(state_))
    return; // the wait already resolved
  logger_->info(tag(), "timed out waiting for driver country code change, continue starting");
  finishCountryCodeWait(std::nullopt);
}

StartResult SoftApStateMachine::adoptConfirmedCountryCode(const std::string& code) {
  capability_.countryCode = code;
  recomputeSafeChannels();

  Resolution resolution = resolveConfiguration(false);
  if (!resolution.ok())
    return resolution.result;

  const bool bridgeChanged = resolution.config.isBridgeRequired() != active_->isBridgeRequired();
  active_ = std::move(resolution.config);
  if (!bridgeChanged)
    return StartResult::Success;

  logger_->info(tag(), "moving to single AP after country code update, recreating interface");
  hardware_->teardownInterface(iface_);
  iface_.clear();
  if (!bringUpInterface())
    return StartResult::FailureGeneral;
  if (!applyCountryCode())
    return StartResult::FailureSetCountryCode;
  return StartResult::Success;
}

void SoftApStateMachine::finishCountryCodeWait(const std::optional<std::string>& confirmedCode) {
  auto& wait = std::get<state::WaitingForCountryCode>(state_);
  scheduler_->cancel(wait.timeout);
  std::deque<Command> deferred = std::move(wait.deferred);

  StartResult result = StartResult::Success;
  if (confirmedCode)
    result = adoptConfirmedCountryCode(*confirmedCode);
  if (result == StartResult::Success)
    result = startSoftAp();

  if (result == StartResult::Success)
    enterRunning();
  else
    failStart(result);

  for (auto& command : deferred)
    dispatch(std::move(command));
}

StartResult SoftApStateMachine::configureMacAddress() {
  const auto& bssid = active_->settings.bssid;
  if (!bssid) {
    // drivers that cannot set the MAC still start fine
    if (!hardware_->resetToFactoryMacAddress(iface_))
      logger_->warn(tag(), "failed to reset to factory MAC address; continuing with current MAC");
    return StartResult::Success;
  }

  if (!hardware_->isSetMacAddressSupported(iface_))
    return StartResult::FailureUnsupportedConfig;
  if (!hardware_->setMacAddress(iface_, *bssid)) {
    logger_->error(tag(), "failed to set explicitly requested MAC address " + bssid->toString());
    return StartResult::FailureSetMacAddress;
  }
  return StartResult::Success;
}

StartResult SoftApStateMachine::startSoftAp() {
  StartResult result = configureMacAddress();
  if (result != StartResult::Success)
    return result;

  if (active_->settings.hiddenSsid)
    logger_->debug(tag(), "soft AP is a hidden network");

  result = hardware_->startAp(iface_, *active_,
                              request_.mode == model::TargetMode::Tethered);
  if (result != StartResult::Success) {
    logger_->error(tag(), std::string("soft AP start failed: ") + model::toString(result));
    return result;
  }
  logger_->info(tag(), "soft AP is started on band " + model::toString(active_->band()));
  return StartResult::Success;
}

void SoftApStateMachine::enterRunning() {
  transitionTo(state::Running{});
  clients_.clear();
  pending_.clear();
  onUpChanged(hardware_->isInterfaceUp(iface_));
  reportStartResult(StartResult::Success);
}

void SoftApStateMachine::failStart(StartResult result) {
  logger_->error(tag(), std::string("start failed: ") + model::toString(result));
  setApState(ApState::Failed, model::toFailureReason(result));
  releaseInterface();
  errorMonitor_->notifyFailure(std::string("[SoftApStateMachine] start failed: ") +
                               model::toString(result));
  listener_.onStartFailure(result);
  reportStartResult(result);
  active_.reset();
  if (!std::holds_alternative<state::Idle>(state_))
    transitionTo(state::Idle{});
}

//---stop------------------------------------------------------------------------

void SoftApStateMachine::on(const cmd::Stop&) {
  if (std::holds_alternative<state::Idle>(state_)) {
    reportStopEvent(StopEvent::Stopped);
    terminate();
    return;
  }

  if (auto* wait = std::get_if<state::WaitingForCountryCode>(&state_)) {
    scheduler_->cancel(wait->timeout);
    if (!wait->deferred.empty())
      logger_->info(tag(), "stop during country code wait drops " +
                               std::to_string(wait->deferred.size()) + " deferred commands");
    wait->deferred.clear();
    setApState(ApState::Disabling);
    reportStopEvent(StopEvent::Stopped);
    releaseInterface();
    setApState(ApState::Disabled);
    active_.reset();
    terminate();
    return;
  }

  stopRunning(StopEvent::Stopped, false);
}

void SoftApStateMachine::stopRunning(StopEvent event, bool failure) {
  auto& running = std::get<state::Running>(state_);
  if (failure)
    setApState(ApState::Failed, FailureReason::General);
  setApState(ApState::Disabling);
  reportStopEvent(event);
  exitRunning(running.ifaceDestroyed);
  terminate();
}

void SoftApStateMachine::exitRunning(bool ifaceDestroyed) {
  if (!ifaceDestroyed)
    releaseInterface();

  if (clients_.size() != 0) {
    logger_->debug(tag(), "resetting connected clients on stop");
    clients_.clear();
    notifyClientsOrInfo();
  }
  pending_.clear();
  if (pendingRetryTimer_ != Scheduler::kInvalidTimer) {
    scheduler_->cancel(pendingRetryTimer_);
    pendingRetryTimer_ = Scheduler::kInvalidTimer;
  }
  timers_.clear();

  setApState(ApState::Disabled);

  iface_.clear();
  infos_.clear();
  clients_.clear();
  notifyClientsOrInfo();
}

void SoftApStateMachine::terminate() {
  transitionTo(state::Stopped{});
  logger_->info(tag(), "soft AP state machine stopped");
  listener_.onStopped();
}

void SoftApStateMachine::releaseInterface() {
  if (iface_.empty())
    return;
  disconnectAllClients();
  hardware_->teardownInterface(iface_);
  logger_->debug(tag(), "interface torn down");
  iface_.clear();
}

void SoftApStateMachine::disconnectAllClients() {
  for (const auto& client : clients_.admissionOrder()) {
    if (!hardware_->forceClientDisconnect(iface_, client.mac, BlockReason::Unspecified))
      logger_->debug(tag(), "disconnect on teardown failed for " + client.mac.toString());
  }
}

//---running: interface and failures----------------------------------------------

void SoftApStateMachine::onUpChanged(bool up) {
  auto* running = std::get_if<state::Running>(&state_);
  if (!running || running->ifaceUp == up)
    return;

  running->ifaceUp = up;
  if (!up) {
    enqueue(cmd::InterfaceDown{});
    return;
  }

  logger_->info(tag(), "soft AP is ready for use");
  setApState(ApState::Enabled);
  listener_.onStarted();
  infos_.clear();
  clients_.clear();
  notifyClientsOrInfo();
}

void SoftApStateMachine::on(const cmd::InterfaceStatusChanged& c) {
  if (c.iface != iface_)
    return;
  onUpChanged(c.up);
}

void SoftApStateMachine::on(const cmd::InterfaceDown&) {
  if (!std::holds_alternative<state::Running>(state_))
    return;
  logger_->warn(tag(), "interface error, stop and report failure");
  errorMonitor_->notifyFailure("[SoftApStateMachine] interface down: " + iface_);
  stopRunning(StopEvent::InterfaceDown, true);
}

void SoftApStateMachine::on(const cmd::InterfaceDestroyed& c) {
  auto* running = std::get_if<state::Running>(&state_);
  if (!running || c.iface != iface_)
    return;
  logger_->info(tag(), "interface was cleanly destroyed");
  running->ifaceDestroyed = true;
  stopRunning(StopEvent::InterfaceDestroyed, false);
}

void SoftApStateMachine::on(const cmd::Failure& c) {
  if (!std::holds_alternative<state::Running>(state_))
    return;

  if (active_->isBridged()) {
    const auto instances = hardware_->getBridgedInstances(iface_);
    if (c.instance) {
      logger_->info(tag(), "instance failure on " + *c.instance);
      removeInstance(*c.instance);
      if (infos_.size() == 1)
        return;
    } else if (infos_.size() == 1 && instances.size() == 1 &&
               infos_.count(instances.front()) == 0) {
      // the driver already dropped the instance we still track
      std::set<std::string> stale;
      for (const auto& [name, info] : infos_)
        stale.insert(name);
      for (const auto& name : stale)
        removeInstance(name);
      return;
    }
  }

  logger_->warn(tag(), "hostapd failure, stop and report failure");
  errorMonitor_->notifyFailure("[SoftApStateMachine] hostapd failure on " + iface_);
  stopRunning(StopEvent::HostapdFailure, true);
}

//---running: instances and clients------------------------------------------------

void SoftApStateMachine::on(const cmd::ApInfoChanged& c) {
  if (!std::holds_alternative<state::Running>(state_))
    return;

  InstanceInfo info = c.info;
  if (info.frequencyMhz < 0) {
    logger_->error(tag(), "invalid ap channel frequency: " + std::to_string(info.frequencyMhz));
    return;
  }
  info.autoShutdownTimeout =
      settings().autoShutdownEnabled ? shutdownTimeout() : std::chrono::milliseconds{ 0 };
  updateInstanceInfo(info);
}

void SoftApStateMachine::updateInstanceInfo(const InstanceInfo& info) {
  auto it = infos_.find(info.instance);
  if (it != infos_.end() && it->second == info)
    return;

  clients_.ensureInstance(info.instance);
  if (clients_.countOn(info.instance) != 0)
    logger_->warn(tag(), "info of " + info.instance + " changed while clients are connected");

  infos_[info.instance] = info;
  notifyClientsOrInfo();

  // first info for a key creates its timer slot
  bool needSchedule = timers_.registerKey(iface_);
  if (active_->isBridged() && timers_.registerKey(info.instance))
    needSchedule = true;
  if (needSchedule)
    rescheduleTimers(iface_);
}

void SoftApStateMachine::removeInstance(const std::string& instance) {
  auto it = infos_.find(instance);
  if (instance.empty() || it == infos_.end())
    return;

  logger_->info(tag(), "remove instance " + instance + " (" +
                           std::to_string(it->second.frequencyMhz) + ") from bridged iface");
  if (!hardware_->removeInstanceFromBridgedInterface(iface_, instance))
    logger_->warn(tag(), "driver failed to remove instance " + instance);

  infos_.erase(it);
  timers_.remove(instance);
  clients_.removeInstance(instance);
  // the survivor keeps serving without an opportunistic timer
  if (infos_.size() < 2) {
    for (const auto& [name, info] : infos_)
      timers_.cancel(name);
  }
  notifyClientsOrInfo();
}

void SoftApStateMachine::on(const cmd::ClientChanged& c) {
  if (!std::holds_alternative<state::Running>(state_))
    return;

  const ConnectedClient& client = c.client;
  if (pending_.removeMac(client.mac) != 0)
    logger_->debug(tag(), "remove client " + client.mac.toString() + " from pending list");

  if (clients_.contains(client) == c.connected) {
    logger_->debug(tag(), "drop client event for " + client.mac.toString() +
                              ", duplicate event or client is blocked");
    return;
  }

  if (c.connected) {
    const AdmissionDecision decision =
        admission_.admit(client.mac, settings(), capability_, clients_.size());
    if (!decision.allowed) {
      logger_->info(tag(), "force disconnect for client " + client.mac.toString() +
                               (decision.reason == BlockReason::NoMoreStations
                                    ? ": no more room"
                                    : ": blocked by user"));
      forceDisconnect(client, decision.reason);
      listener_.onBlockedClientConnecting(client, decision.reason);
      return;
    }
    clients_.add(client);
  } else {
    clients_.remove(client);
  }

  logger_->debug(tag(), "connected stations changed, count " + std::to_string(clients_.size()));
  notifyClientsOrInfo();
  rescheduleTimers(client.instance);
}

void SoftApStateMachine::updateClientConnection() {
  const auto evictions =
      admission_.planEvictions(clients_.admissionOrder(), settings(), capability_);
  if (evictions.empty())
    return;

  for (const auto& eviction : evictions) {
    logger_->info(tag(), "force disconnect for client " + eviction.client.mac.toString() +
                             (eviction.reason == BlockReason::NoMoreStations
                                  ? " due to no more room"
                                  : ", not allowed"));
    clients_.remove(eviction.client);
    forceDisconnect(eviction.client, eviction.reason);
  }
  notifyClientsOrInfo();
  rescheduleTimers(iface_);
}

void SoftApStateMachine::forceDisconnect(const ConnectedClient& client, BlockReason reason) {
  if (hardware_->forceClientDisconnect(iface_, client.mac, reason))
    return;
  logger_->debug(tag(), "fail to disconnect client " + client.mac.toString() +
                            ", add it into pending list");
  pending_.add(client, reason);
  schedulePendingRetry();
}

void SoftApStateMachine::schedulePendingRetry() {
  if (pendingRetryTimer_ != Scheduler::kInvalidTimer)
    return;
  pendingRetryTimer_ = scheduler_->postDelayed(
      [this] { enqueue(cmd::ForceDisconnectPending{}); }, PendingDisconnectList::kRetryInterval);
}

void SoftApStateMachine::on(const cmd::ForceDisconnectPending&) {
  pendingRetryTimer_ = Scheduler::kInvalidTimer;
  if (!std::holds_alternative<state::Running>(state_) || pending_.empty())
    return;

  logger_->debug(tag(), "disconnect pending list is not empty, retrying");
  for (const auto& [client, reason] : pending_.entries()) {
    if (!hardware_->forceClientDisconnect(iface_, client.mac, reason))
      logger_->debug(tag(), "retry disconnect failed for " + client.mac.toString());
  }
  schedulePendingRetry();
}

void SoftApStateMachine::notifyClientsOrInfo() {
  listener_.onConnectedClientsOrInfoChanged(infos_, clients_.byInstance(),
                                            active_ && active_->isBridgeRequired());
}

//---running: timers------------------------------------------------------------------

TimerContext SoftApStateMachine::timerContext() const {
  TimerContext ctx;
  ctx.iface = iface_;
  ctx.bridged = active_ && active_->isBridged();
  for (const auto& [name, info] : infos_) {
    ctx.instanceFrequencies[name] = info.frequencyMhz;
    ctx.instanceClients[name] = clients_.countOn(name);
  }
  ctx.totalClients = clients_.size();
  ctx.shutdownEnabled = settings().autoShutdownEnabled;
  ctx.shutdownTimeout = shutdownTimeout();
  ctx.instanceShutdownEnabled = instanceShutdownEnabled();
  ctx.instanceShutdownTimeout = instanceShutdownTimeout();
  return ctx;
}

void SoftApStateMachine::rescheduleTimers(const std::string& changedKey) {
  if (iface_.empty())
    return;
  timers_.reconcile(changedKey, timerContext());
}

void SoftApStateMachine::on(const cmd::IdleTimeout& c) {
  if (!std::holds_alternative<state::Running>(state_) || c.key != iface_)
    return;
  if (!settings().autoShutdownEnabled) {
    logger_->info(tag(), "timeout received while timeout is disabled, dropping");
    return;
  }
  if (clients_.size() != 0) {
    logger_->info(tag(), "timeout received but has clients, dropping");
    return;
  }
  logger_->info(tag(), "timeout received, stopping soft AP");
  listener_.onShutdownTimeoutExpired();
  stopRunning(StopEvent::NoUsageTimeout, false);
}

void SoftApStateMachine::on(const cmd::InstanceIdleTimeout& c) {
  if (!std::holds_alternative<state::Running>(state_))
    return;
  if (!active_->isBridged() || infos_.size() != 2) {
    logger_->debug(tag(), "ignore bridged mode timeout in single AP state from " + c.instance);
    return;
  }
  if (!instanceShutdownEnabled()) {
    logger_->info(tag(), "bridged mode timeout received while timeout is disabled, dropping");
    return;
  }
  if (clients_.countOn(c.instance) != 0)
    return;
  logger_->debug(tag(), "instance idle timeout on " + c.instance);
  removeInstance(c.instance);
}

void SoftApStateMachine::on(const cmd::PluggedStateChanged& c) {
  if (plugged_ == c.plugged)
    return;
  plugged_ = c.plugged;
  if (std::holds_alternative<state::Running>(state_) && active_->isBridged() &&
      infos_.size() == 2)
    timers_.rescheduleBridgedInstances(timerContext());
}

//---capability, configuration, regulatory----------------------------------------------

void SoftApStateMachine::on(const cmd::UpdateCapability& c) {
  capability_ = c.capability;
  if (std::holds_alternative<state::Running>(state_))
    updateClientConnection();
  recomputeSafeChannels();
}

void SoftApStateMachine::on(const cmd::UpdateConfig& c) {
  if (std::holds_alternative<state::Idle>(state_)) {
    request_.config = c.config;
    logger_->debug(tag(), "configuration changed to ssid " + c.config.ssid);
    return;
  }
  if (!std::holds_alternative<state::Running>(state_))
    return;

  if (model::requiresRestart(request_.config, c.config)) {
    logger_->info(tag(), "ignore the config update since it requires restart");
    return;
  }

  const DesiredConfiguration& next = c.config;
  DesiredConfiguration& current = active_->settings;
  const bool needReschedule =
      current.shutdownTimeout != next.shutdownTimeout ||
      current.autoShutdownEnabled != next.autoShutdownEnabled ||
      current.bridgedOpportunisticShutdownEnabled != next.bridgedOpportunisticShutdownEnabled ||
      current.bridgedOpportunisticShutdownTimeout != next.bridgedOpportunisticShutdownTimeout;

  request_.config = next;
  current.maxClients = next.maxClients;
  current.allowedClients = next.allowedClients;
  current.blockedClients = next.blockedClients;
  current.clientControlByUser = next.clientControlByUser;
  current.autoShutdownEnabled = next.autoShutdownEnabled;
  current.shutdownTimeout = next.shutdownTimeout;
  current.bridgedOpportunisticShutdownEnabled = next.bridgedOpportunisticShutdownEnabled;
  current.bridgedOpportunisticShutdownTimeout = next.bridgedOpportunisticShutdownTimeout;

  updateClientConnection();

  if (needReschedule) {
    timers_.cancelAll();
    rescheduleTimers(iface_);
    const auto advertised =
        current.autoShutdownEnabled ? shutdownTimeout() : std::chrono::milliseconds{ 0 };
    const auto snapshot = infos_;
    for (auto [name, info] : snapshot) {
      info.autoShutdownTimeout = advertised;
      updateInstanceInfo(info);
    }
  }
}

void SoftApStateMachine::on(const cmd::UpdateCountryCode& c) {
  if (!overlay_.dynamicCountryCodeSupported || !capability_.hasFeature(Feature::AcsOffload)) {
    logger_->info(tag(), "dynamic country code update not supported, ignoring " + c.code);
    return;
  }
  if (c.code.empty())
    return;

  if (std::holds_alternative<state::Idle>(state_)) {
    countryCode_ = c.code;
    return;
  }
  if (!std::holds_alternative<state::Running>(state_) || sameCountryCode(c.code, countryCode_))
    return;

  if (!hardware_->setCountryCode(iface_, upper(c.code))) {
    logger_->warn(tag(), "failed to update country code to " + c.code);
    return;
  }
  logger_->info(tag(), "update country code when soft AP enabled from " + countryCode_ + " to " +
                           c.code);
  countryCode_ = c.code;
}

void SoftApStateMachine::on(const cmd::SafeChannelsChanged& c) {
  coexUnsafe_ = c.unsafeFrequencies;
  coexRestrictsSoftAp_ = c.restrictsSoftAp;
  recomputeSafeChannels();

  if (!std::holds_alternative<state::Running>(state_))
    return;
  if (!active_->isBridged() || infos_.size() != 2) {
    logger_->debug(tag(), "ignore safe channel change in single AP state");
    return;
  }

  std::set<std::string> unavailable;
  for (const auto& [name, info] : infos_) {
    if (safeChannels_.count(info.frequencyMhz) != 0)
      continue;
    const Band band = model::frequencyToBand(info.frequencyMhz);
    if (!ChannelResolver::isBandAvailable(band, capability_, safeChannels_))
      unavailable.insert(name);
  }
  removeInstance(highestFrequencyInstance(unavailable));
}

void SoftApStateMachine::on(const cmd::StationConnected& c) {
  if (!std::holds_alternative<state::Running>(state_))
    return;
  if (!active_->isBridgeRequired() || infos_.size() != 2) {
    logger_->debug(tag(), "ignore station connected in single AP state");
    return;
  }
  if (c.frequencyMhz <= 0 || safeChannels_.count(c.frequencyMhz) != 0)
    return;

  logger_->info(tag(), "station connected to freq " + std::to_string(c.frequencyMhz) +
                           " which is unavailable for soft AP");
  const Band stationBand = model::frequencyToBand(c.frequencyMhz);
  std::string target;
  for (const auto& [name, info] : infos_) {
    if (model::frequencyToBand(info.frequencyMhz) == stationBand) {
      target = name;
      break;
    }
  }
  if (target.empty()) {
    std::set<std::string> all;
    for (const auto& [name, info] : infos_)
      all.insert(name);
    target = highestFrequencyInstance(all);
  }
  removeInstance(target);
}

//---misc----------------------------------------------------------------------------------

void SoftApStateMachine::setApState(ApState next, FailureReason reason) {
  const ApState previous = apState_;
  apState_ = next;
  logger_->info(tag(), std::string("ap state ") + model::toString(previous) + " -> " +
                           model::toString(next));
  listener_.onStateChanged(next, previous, reason);
}

void SoftApStateMachine::reportStartResult(StartResult result) {
  if (startResultReported_)
    return;
  startResultReported_ = true;
  listener_.onStartResult(result);
}

void SoftApStateMachine::reportStopEvent(StopEvent event) {
  if (stopEventReported_)
    return;
  stopEventReported_ = true;
  logger_->info(tag(), std::string("stop event ") + model::toString(event));
  listener_.onStopEvent(event);
}

void SoftApStateMachine::recomputeSafeChannels() {
  safeChannels_ = ChannelResolver::computeSafeChannels(request_.config.bandUnion(), capability_,
                                                       coexUnsafe_, coexRestrictsSoftAp_);
}

const DesiredConfiguration& SoftApStateMachine::settings() const {
  return active_ ? active_->settings : request_.config;
}

std::chrono::milliseconds SoftApStateMachine::shutdownTimeout() const {
  const auto configured = settings().shutdownTimeout;
  return configured.count() > 0 ? configured : overlay_.defaultShutdownTimeout;
}

std::chrono::milliseconds SoftApStateMachine::instanceShutdownTimeout() const {
  const auto configured = settings().bridgedOpportunisticShutdownTimeout;
  return configured.count() > 0 ? configured : overlay_.defaultBridgedInstanceShutdownTimeout;
}

bool SoftApStateMachine::instanceShutdownEnabled() const {
  return settings().bridgedOpportunisticShutdownEnabled &&
         !(plugged_ && overlay_.disableBridgedIdleShutdownWhenPlugged);
}

std::string SoftApStateMachine::highestFrequencyInstance(
    const std::set<std::string>& instances) const {
  std::string best;
  int bestFreq = -1;
  for (const auto& name : instances) {
    auto it = infos_.find(name);
    if (it != infos_.end() && it->second.frequencyMhz > bestFreq) {
      bestFreq = it->second.frequencyMhz;
      best = name;
    }
  }
  return best;
}

std::string SoftApStateMachine::tag() const {
  return "SoftApStateMachine[" + (iface_.empty() ? std::string("-") : iface_) + "]";
}
