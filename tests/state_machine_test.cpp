// apctl-Prod headers
#include "core/Logger.hpp"
#include "core/SoftApStateMachine.hpp"

// apctl-Fake headers
#include "fakes/FakeApHardware.hpp"
#include "fakes/FakeScheduler.hpp"
#include "fakes/MockSoftApListener.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <vector>

namespace apctl::test {

  using apctl::core::DeviceOverlay;
  using apctl::core::ErrorMonitor;
  using apctl::core::LifecycleState;
  using apctl::core::Logger;
  using apctl::core::SoftApStateMachine;
  using apctl::core::StartRequest;
  using namespace apctl::model;
  using namespace std::chrono_literals;
  using ::testing::_;
  using ::testing::HasSubstr;
  using ::testing::NiceMock;

  namespace {
    const MacAddress kClientA = *MacAddress::parse("aa:bb:cc:dd:ee:ff");
    const MacAddress kClientB = *MacAddress::parse("00:11:22:33:44:01");
    const MacAddress kClientC = *MacAddress::parse("00:11:22:33:44:02");

    InstanceInfo info(const std::string& instance, int frequencyMhz) {
      InstanceInfo out;
      out.instance = instance;
      out.frequencyMhz = frequencyMhz;
      out.bandwidth = Bandwidth::Mhz20;
      out.standard = WifiStandard::Ax11;
      return out;
    }
  } // namespace

  class SoftApStateMachineTest : public ::testing::Test {
  protected:
    void SetUp() override {
      hardware = std::make_shared<FakeApHardware>();
      scheduler = std::make_shared<FakeScheduler>();
      errorMonitor = std::make_shared<NiceMock<MockErrorMonitor>>();
      logger = std::make_shared<Logger>();

      capability.maxSupportedClients = 8;
      capability.countryCode = "US";
      capability.setFeature(Feature::Band24GSupported, true);
      capability.setFeature(Feature::Band5GSupported, true);
      capability.setFeature(Feature::ClientForceDisconnect, true);
      capability.supportedChannels[Band::Ghz2] = { 1, 6, 11 };
      capability.supportedChannels[Band::Ghz5] = { 36, 149 };

      config.ssid = "Test";
      config.bands = { BandRequest{ Band::Ghz2 | Band::Ghz5, 0 } };

      ON_CALL(listener, onStateChanged(_, _, _))
          .WillByDefault([this](ApState next, ApState, FailureReason) { states.push_back(next); });
      ON_CALL(listener, onStartResult(_)).WillByDefault([this](StartResult r) {
        startResults.push_back(r);
      });
      ON_CALL(listener, onStopEvent(_)).WillByDefault([this](StopEvent e) {
        stopEvents.push_back(e);
      });
    }

    void build() {
      machine = std::make_unique<SoftApStateMachine>(
          hardware, scheduler, listener, std::static_pointer_cast<ErrorMonitor>(errorMonitor),
          logger, overlay);
    }

    StartRequest request(const std::string& countryCode = "US") const {
      StartRequest out;
      out.config = config;
      out.capability = capability;
      out.countryCode = countryCode;
      out.requestor = "test";
      return out;
    }

    /// Single AP on wlan1, up, with its ap-info delivered.
    void startSingle() {
      build();
      machine->start(request());
      scheduler->runPending();
      ASSERT_EQ(machine->lifecycleState(), LifecycleState::Running);
      machine->onInfoChanged(info("wlan1", 2412));
      scheduler->runPending();
    }

    /// Bridged 2.4 + 5 GHz AP with both instances reported.
    void startBridged() {
      config.bands = { BandRequest{ Band::Ghz2, 0 }, BandRequest{ Band::Ghz5, 0 } };
      build();
      machine->start(request());
      scheduler->runPending();
      ASSERT_EQ(machine->lifecycleState(), LifecycleState::Running);
      ASSERT_TRUE(machine->activeConfiguration()->isBridged());
      machine->onInfoChanged(info("wlan1_0", 2412));
      machine->onInfoChanged(info("wlan1_1", 5180));
      scheduler->runPending();
    }

    void connect(const MacAddress& mac, const std::string& instance = "wlan1") {
      machine->onConnectedClientsChanged(instance, mac, true);
      scheduler->runPending();
    }

    std::shared_ptr<FakeApHardware> hardware;
    std::shared_ptr<FakeScheduler> scheduler;
    std::shared_ptr<NiceMock<MockErrorMonitor>> errorMonitor;
    std::shared_ptr<Logger> logger;
    NiceMock<MockSoftApListener> listener;
    DeviceOverlay overlay;
    CapabilitySnapshot capability;
    DesiredConfiguration config;

    std::vector<ApState> states;
    std::vector<StartResult> startResults;
    std::vector<StopEvent> stopEvents;

    std::unique_ptr<SoftApStateMachine> machine;
  };

  //---construction---------------------------------------------------------------

  TEST_F(SoftApStateMachineTest, ctor_NullCollaboratorThrows) {
    EXPECT_THROW(SoftApStateMachine(nullptr, scheduler, listener, errorMonitor, logger),
                 std::invalid_argument);
    EXPECT_THROW(SoftApStateMachine(hardware, nullptr, listener, errorMonitor, logger),
                 std::invalid_argument);
    EXPECT_THROW(SoftApStateMachine(hardware, scheduler, listener, nullptr, logger),
                 std::invalid_argument);
    EXPECT_THROW(SoftApStateMachine(hardware, scheduler, listener, errorMonitor, nullptr),
                 std::invalid_argument);
  }

  TEST_F(SoftApStateMachineTest, start_OnlyPostsUntilSchedulerRuns) {
    build();
    machine->start(request());
    EXPECT_EQ(machine->lifecycleState(), LifecycleState::Idle);
    EXPECT_EQ(hardware->bringUpCalls, 0);
    EXPECT_EQ(scheduler->readyCount(), 1u);
  }

  //---start sequence------------------------------------------------------------

  TEST_F(SoftApStateMachineTest, start_ReachesEnabledWithNoClients) {
    build();
    EXPECT_CALL(listener, onStarted()).Times(1);

    machine->start(request());
    scheduler->runPending();

    EXPECT_EQ(states, (std::vector<ApState>{ ApState::Enabling, ApState::Enabled }));
    EXPECT_EQ(startResults, (std::vector<StartResult>{ StartResult::Success }));
    EXPECT_EQ(machine->connectedClientCount(), 0u);
    EXPECT_EQ(machine->interfaceName(), "wlan1");
    EXPECT_EQ(hardware->countryCodes, (std::vector<std::string>{ "US" }));
    EXPECT_EQ(hardware->startApCalls, 1);
    EXPECT_FALSE(hardware->lastBringUpBridged);
  }

  TEST_F(SoftApStateMachineTest, start_WaitsForInterfaceUpBeforeEnabled) {
    hardware->ifaceUp = false;
    build();
    machine->start(request());
    scheduler->runPending();
    EXPECT_EQ(states, (std::vector<ApState>{ ApState::Enabling }));
    EXPECT_EQ(machine->lifecycleState(), LifecycleState::Running);

    machine->onInterfaceUp("wlan1");
    scheduler->runPending();
    EXPECT_EQ(states, (std::vector<ApState>{ ApState::Enabling, ApState::Enabled }));
    EXPECT_EQ(startResults.size(), 1u);
  }

  TEST_F(SoftApStateMachineTest, start_EmptySsidFailsGeneral) {
    config.ssid.clear();
    build();
    EXPECT_CALL(listener, onStartFailure(StartResult::FailureGeneral)).Times(1);

    machine->start(request());
    scheduler->runPending();

    EXPECT_EQ(startResults, (std::vector<StartResult>{ StartResult::FailureGeneral }));
    EXPECT_EQ(states, (std::vector<ApState>{ ApState::Failed }));
    EXPECT_EQ(hardware->bringUpCalls, 0);
    EXPECT_EQ(machine->lifecycleState(), LifecycleState::Idle);
  }

  TEST_F(SoftApStateMachineTest, start_UserRejectedConflict) {
    hardware->conflictDecision = hal::ConflictDecision::UserRejected;
    build();
    EXPECT_CALL(listener, onStateChanged(ApState::Failed, _, FailureReason::UserRejected));

    machine->start(request());
    scheduler->runPending();

    EXPECT_EQ(startResults,
              (std::vector<StartResult>{ StartResult::FailureInterfaceConflictUserRejected }));
  }

  TEST_F(SoftApStateMachineTest, start_InterfaceCreationFailures) {
    hardware->apCreationPossible = false;
    build();
    machine->start(request());
    scheduler->runPending();
    EXPECT_EQ(startResults, (std::vector<StartResult>{ StartResult::FailureInterfaceConflict }));

    hardware->apCreationPossible = true;
    hardware->ifaceName.reset();
    startResults.clear();
    build();
    machine->start(request());
    scheduler->runPending();
    EXPECT_EQ(startResults, (std::vector<StartResult>{ StartResult::FailureCreateInterface }));
  }

  TEST_F(SoftApStateMachineTest, start_HostapdFailureTearsDownInterface) {
    hardware->startResult = StartResult::FailureStartHostapd;
    build();
    EXPECT_CALL(*errorMonitor, notifyFailure(HasSubstr("FAILURE_START_HOSTAPD"))).Times(1);

    machine->start(request());
    scheduler->runPending();

    EXPECT_EQ(startResults, (std::vector<StartResult>{ StartResult::FailureStartHostapd }));
    EXPECT_EQ(states, (std::vector<ApState>{ ApState::Enabling, ApState::Failed }));
    EXPECT_EQ(hardware->teardowns, (std::vector<std::string>{ "wlan1" }));
    EXPECT_TRUE(machine->interfaceName().empty());
    EXPECT_EQ(machine->lifecycleState(), LifecycleState::Idle);
  }

  TEST_F(SoftApStateMachineTest, start_CountryCodeMandatoryFor5GhzOnly) {
    config.bands = { BandRequest{ Band::Ghz5, 0 } };
    hardware->setCountryCodeOk = false;
    build();
    machine->start(request());
    scheduler->runPending();
    EXPECT_EQ(startResults, (std::vector<StartResult>{ StartResult::FailureSetCountryCode }));
  }

  TEST_F(SoftApStateMachineTest, start_AcsOffloadUnsupportedBandFailsNoChannel) {
    capability.setFeature(Feature::AcsOffload, true);
    capability.setFeature(Feature::Band5GSupported, false);
    config.bands = { BandRequest{ Band::Ghz5, 0 } };
    build();
    EXPECT_CALL(listener, onStateChanged(ApState::Failed, _, FailureReason::NoChannel));

    machine->start(request());
    scheduler->runPending();

    EXPECT_EQ(startResults, (std::vector<StartResult>{ StartResult::FailureNoChannel }));
    EXPECT_EQ(hardware->bringUpCalls, 0);
    EXPECT_EQ(hardware->startApCalls, 0);
    EXPECT_EQ(machine->lifecycleState(), LifecycleState::Idle);
  }

  TEST_F(SoftApStateMachineTest, start_CountryCodeFailureToleratedOnDualBandLeg) {
    hardware->setCountryCodeOk = false;
    build();
    machine->start(request());
    scheduler->runPending();
    EXPECT_EQ(startResults, (std::vector<StartResult>{ StartResult::Success }));
  }

  TEST_F(SoftApStateMachineTest, start_MacAddressHandling) {
    config.bssid = kClientB;
    hardware->setMacSupported = false;
    build();
    machine->start(request());
    scheduler->runPending();
    EXPECT_EQ(startResults, (std::vector<StartResult>{ StartResult::FailureUnsupportedConfig }));

    hardware->setMacSupported = true;
    hardware->setMacOk = false;
    startResults.clear();
    build();
    machine->start(request());
    scheduler->runPending();
    EXPECT_EQ(startResults, (std::vector<StartResult>{ StartResult::FailureSetMacAddress }));

    hardware->setMacOk = true;
    startResults.clear();
    build();
    machine->start(request());
    scheduler->runPending();
    EXPECT_EQ(startResults, (std::vector<StartResult>{ StartResult::Success }));
    EXPECT_EQ(hardware->macSet, kClientB);
  }

  TEST_F(SoftApStateMachineTest, start_FactoryMacResetFailureIsNotFatal) {
    hardware->resetMacOk = false;
    build();
    machine->start(request());
    scheduler->runPending();
    EXPECT_EQ(startResults, (std::vector<StartResult>{ StartResult::Success }));
  }

  TEST_F(SoftApStateMachineTest, start_BridgedBringsUpBridgeInterface) {
    startBridged();
    EXPECT_TRUE(hardware->lastBringUpBridged);
    EXPECT_EQ(hardware->lastBringUpBand, Band::Ghz2 | Band::Ghz5);
    EXPECT_EQ(machine->instanceInfos().size(), 2u);
  }

  //---country code wait -----------------------------------------------------------

  TEST_F(SoftApStateMachineTest, countryCodeWait_TimeoutFallsBackToRequestedCode) {
    capability.countryCode = "YY";
    build();
    machine->start(request("XX"));
    scheduler->runPending();

    EXPECT_EQ(machine->lifecycleState(), LifecycleState::NegotiatingStart);
    EXPECT_EQ(hardware->startApCalls, 0);
    EXPECT_EQ(hardware->countryCodes, (std::vector<std::string>{ "XX" }));

    scheduler->advance(SoftApStateMachine::kCountryCodeWaitTimeout - 1ms);
    EXPECT_EQ(machine->lifecycleState(), LifecycleState::NegotiatingStart);

    scheduler->advance(1ms);
    EXPECT_EQ(machine->lifecycleState(), LifecycleState::Running);
    EXPECT_EQ(hardware->startApCalls, 1);
    EXPECT_EQ(machine->countryCode(), "XX");
    EXPECT_EQ(startResults, (std::vector<StartResult>{ StartResult::Success }));
  }

  TEST_F(SoftApStateMachineTest, countryCodeWait_DriverConfirmationResumesStart) {
    capability.countryCode = "YY";
    build();
    machine->start(request("XX"));
    scheduler->runPending();

    machine->onDriverCountryCodeChanged("ZZ");
    scheduler->runPending();
    EXPECT_EQ(machine->lifecycleState(), LifecycleState::NegotiatingStart);

    machine->onDriverCountryCodeChanged("xx");
    scheduler->runPending();
    EXPECT_EQ(machine->lifecycleState(), LifecycleState::Running);
    EXPECT_EQ(machine->capability().countryCode, "xx");

    // the cancelled wait timer never fires a second start
    scheduler->advance(10s);
    EXPECT_EQ(hardware->startApCalls, 1);
  }

  TEST_F(SoftApStateMachineTest, countryCodeWait_ReplaysDeferredCommandsInOrder) {
    capability.countryCode = "YY";
    build();
    machine->start(request("XX"));
    scheduler->runPending();

    auto first = config;
    first.maxClients = 3;
    auto second = config;
    second.maxClients = 5;
    machine->updateConfiguration(first);
    machine->updateConfiguration(second);
    scheduler->runPending();
    EXPECT_EQ(machine->deferredCommandCount(), 2u);

    machine->onDriverCountryCodeChanged("XX");
    scheduler->runPending();

    EXPECT_EQ(machine->deferredCommandCount(), 0u);
    ASSERT_TRUE(machine->activeConfiguration());
    EXPECT_EQ(machine->activeConfiguration()->settings.maxClients, 5);
  }

  TEST_F(SoftApStateMachineTest, countryCodeWait_StopEndsImmediatelyWithoutStartResult) {
    capability.countryCode = "YY";
    build();
    EXPECT_CALL(listener, onStopped()).Times(1);
    machine->start(request("XX"));
    machine->updatePluggedState(true);
    scheduler->runPending();

    machine->stop();
    scheduler->runPending();

    EXPECT_EQ(machine->lifecycleState(), LifecycleState::Stopped);
    EXPECT_EQ(stopEvents, (std::vector<StopEvent>{ StopEvent::Stopped }));
    EXPECT_TRUE(startResults.empty());
    EXPECT_EQ(states,
              (std::vector<ApState>{ ApState::Enabling, ApState::Disabling, ApState::Disabled }));
    EXPECT_EQ(hardware->teardowns, (std::vector<std::string>{ "wlan1" }));

    scheduler->advance(10s);
    EXPECT_EQ(hardware->startApCalls, 0);
  }

  TEST_F(SoftApStateMachineTest, countryCodeWait_WorldModeBridgedRequestStartsSingle) {
    config.bands = { BandRequest{ Band::Ghz2, 0 }, BandRequest{ Band::Ghz5, 0 } };
    build();
    machine->start(request("00"));
    scheduler->runPending();
    ASSERT_EQ(machine->lifecycleState(), LifecycleState::NegotiatingStart);
    EXPECT_FALSE(hardware->lastBringUpBridged);
    EXPECT_TRUE(machine->activeConfiguration()->fellBackToSingle);
  }

  //---clients---------------------------------------------------------------------

  TEST_F(SoftApStateMachineTest, client_BlockedClientIsDisconnected) {
    config.blockedClients.insert(kClientA);
    startSingle();
    EXPECT_CALL(listener, onBlockedClientConnecting(_, BlockReason::BlockedByUser)).Times(1);

    connect(kClientA);

    ASSERT_EQ(hardware->disconnects.size(), 1u);
    EXPECT_EQ(hardware->disconnects[0].first, kClientA);
    EXPECT_EQ(hardware->disconnects[0].second, BlockReason::BlockedByUser);
    EXPECT_EQ(machine->connectedClientCount(), 0u);
  }

  TEST_F(SoftApStateMachineTest, client_DuplicateEventIgnored) {
    startSingle();
    connect(kClientB);
    connect(kClientB);
    EXPECT_EQ(machine->connectedClientCount(), 1u);

    machine->onConnectedClientsChanged("wlan1", kClientB, false);
    scheduler->runPending();
    EXPECT_EQ(machine->connectedClientCount(), 0u);
  }

  TEST_F(SoftApStateMachineTest, client_CapacityNeverExceeded) {
    capability.maxSupportedClients = 2;
    startSingle();
    EXPECT_CALL(listener, onBlockedClientConnecting(_, BlockReason::NoMoreStations)).Times(1);

    for (const auto& mac : { kClientA, kClientB, kClientC }) {
      connect(mac);
      EXPECT_LE(machine->connectedClientCount(), 2u);
    }
    EXPECT_EQ(machine->connectedClientCount(), 2u);
    EXPECT_EQ(hardware->disconnects.back().second, BlockReason::NoMoreStations);
  }

  TEST_F(SoftApStateMachineTest, client_ShrinkingCapabilityEvictsNewest) {
    startSingle();
    connect(kClientB);
    connect(kClientC);

    auto smaller = capability;
    smaller.maxSupportedClients = 1;
    machine->updateCapability(smaller);
    scheduler->runPending();

    ASSERT_EQ(hardware->disconnects.size(), 1u);
    EXPECT_EQ(hardware->disconnects[0].first, kClientC);
    EXPECT_EQ(machine->connectedClientCount(), 1u);
  }

  TEST_F(SoftApStateMachineTest, client_FailedDisconnectRetriedUntilClientLeaves) {
    config.blockedClients.insert(kClientA);
    hardware->disconnectOk = false;
    startSingle();

    connect(kClientA);
    EXPECT_TRUE(machine->pendingDisconnects().containsMac(kClientA));
    EXPECT_EQ(machine->connectedClientCount(), 0u);
    EXPECT_EQ(hardware->disconnects.size(), 1u);

    scheduler->advance(1s);
    EXPECT_EQ(hardware->disconnects.size(), 2u);
    EXPECT_TRUE(machine->pendingDisconnects().containsMac(kClientA));

    machine->onConnectedClientsChanged("wlan1", kClientA, false);
    scheduler->runPending();
    EXPECT_TRUE(machine->pendingDisconnects().empty());

    scheduler->advance(3s);
    EXPECT_EQ(hardware->disconnects.size(), 2u);
  }

  TEST_F(SoftApStateMachineTest, client_PendingClientReconnectingIsNotDoubleCounted) {
    config.blockedClients.insert(kClientA);
    hardware->disconnectOk = false;
    startSingle();

    connect(kClientA);
    connect(kClientA);

    EXPECT_FALSE(machine->pendingDisconnects().empty());
    EXPECT_EQ(machine->connectedClientCount(), 0u);
  }

  //---configuration updates----------------------------------------------------------

  TEST_F(SoftApStateMachineTest, updateConfiguration_RestartRequiredIsIgnored) {
    startSingle();
    auto next = config;
    next.ssid = "Other";
    next.maxClients = 1;

    machine->updateConfiguration(next);
    scheduler->runPending();

    EXPECT_EQ(machine->activeConfiguration()->settings.ssid, "Test");
    EXPECT_EQ(machine->activeConfiguration()->settings.maxClients, 0);
  }

  TEST_F(SoftApStateMachineTest, updateConfiguration_BlockListAppliedInPlace) {
    startSingle();
    connect(kClientB);
    connect(kClientC);

    auto next = config;
    next.blockedClients.insert(kClientB);
    machine->updateConfiguration(next);
    scheduler->runPending();

    ASSERT_EQ(hardware->disconnects.size(), 1u);
    EXPECT_EQ(hardware->disconnects[0].first, kClientB);
    EXPECT_EQ(hardware->disconnects[0].second, BlockReason::BlockedByUser);
    EXPECT_EQ(machine->connectedClientCount(), 1u);
    EXPECT_EQ(hardware->startApCalls, 1);
  }

  TEST_F(SoftApStateMachineTest, updateConfiguration_TimeoutChangeReschedules) {
    config.shutdownTimeout = 60s;
    startSingle();
    EXPECT_EQ(machine->instanceInfos().at("wlan1").autoShutdownTimeout, 60s);

    auto next = config;
    next.shutdownTimeout = 2s;
    machine->updateConfiguration(next);
    scheduler->runPending();

    EXPECT_EQ(machine->instanceInfos().at("wlan1").autoShutdownTimeout, 2s);
    scheduler->advance(2s);
    EXPECT_EQ(stopEvents, (std::vector<StopEvent>{ StopEvent::NoUsageTimeout }));
  }

  TEST_F(SoftApStateMachineTest, updateConfiguration_IdleStoresForNextStart) {
    build();
    auto next = config;
    next.ssid = "Later";
    machine->updateConfiguration(next);
    scheduler->runPending();
    EXPECT_EQ(machine->lifecycleState(), LifecycleState::Idle);
  }

  //---idle shutdown-------------------------------------------------------------------

  TEST_F(SoftApStateMachineTest, idleTimeout_StopsWithNoUsageEvent) {
    config.shutdownTimeout = 1s;
    startSingle();
    EXPECT_CALL(listener, onShutdownTimeoutExpired()).Times(1);
    ASSERT_TRUE(machine->timers().isArmed("wlan1"));

    scheduler->advance(1s);

    EXPECT_EQ(stopEvents, (std::vector<StopEvent>{ StopEvent::NoUsageTimeout }));
    EXPECT_EQ(machine->lifecycleState(), LifecycleState::Stopped);
    EXPECT_EQ(hardware->teardowns, (std::vector<std::string>{ "wlan1" }));
    EXPECT_EQ(states.back(), ApState::Disabled);
  }

  TEST_F(SoftApStateMachineTest, idleTimeout_ConnectedClientDisarmsTimer) {
    config.shutdownTimeout = 1s;
    startSingle();
    connect(kClientB);
    EXPECT_FALSE(machine->timers().isArmed("wlan1"));

    scheduler->advance(5s);
    EXPECT_EQ(machine->lifecycleState(), LifecycleState::Running);

    machine->onConnectedClientsChanged("wlan1", kClientB, false);
    scheduler->runPending();
    EXPECT_TRUE(machine->timers().isArmed("wlan1"));
  }

  TEST_F(SoftApStateMachineTest, idleTimeout_DisabledNeverArms) {
    config.autoShutdownEnabled = false;
    startSingle();
    EXPECT_FALSE(machine->timers().isArmed("wlan1"));
    EXPECT_EQ(machine->instanceInfos().at("wlan1").autoShutdownTimeout, 0ms);
  }

  TEST_F(SoftApStateMachineTest, idleTimeout_HigherBandInstanceRemovedFirst) {
    config.shutdownTimeout = 60s;
    config.bridgedOpportunisticShutdownTimeout = 1s;
    startBridged();

    scheduler->advance(1s);
    EXPECT_EQ(hardware->removedInstances, (std::vector<std::string>{ "wlan1_1" }));
    EXPECT_EQ(machine->instanceInfos().size(), 1u);

    scheduler->advance(1s);
    EXPECT_EQ(hardware->removedInstances.size(), 1u);
    EXPECT_FALSE(machine->timers().isArmed("wlan1_0"));
    EXPECT_EQ(machine->lifecycleState(), LifecycleState::Running);
  }

  TEST_F(SoftApStateMachineTest, idleTimeout_SimultaneousDisconnectsRemoveHigherBandFirst) {
    config.shutdownTimeout = 60s;
    config.bridgedOpportunisticShutdownTimeout = 1s;
    startBridged();
    connect(kClientA, "wlan1_0");
    connect(kClientB, "wlan1_1");
    ASSERT_FALSE(machine->timers().isArmed("wlan1_0"));
    ASSERT_FALSE(machine->timers().isArmed("wlan1_1"));

    machine->onConnectedClientsChanged("wlan1_0", kClientA, false);
    machine->onConnectedClientsChanged("wlan1_1", kClientB, false);
    scheduler->runPending();

    scheduler->advance(1s);
    EXPECT_EQ(hardware->removedInstances, (std::vector<std::string>{ "wlan1_1" }));
    scheduler->advance(1s);
    EXPECT_EQ(hardware->removedInstances.size(), 1u);
  }

  TEST_F(SoftApStateMachineTest, idleTimeout_PluggedExemptsBridgedInstances) {
    overlay.disableBridgedIdleShutdownWhenPlugged = true;
    config.shutdownTimeout = 60s;
    config.bridgedOpportunisticShutdownTimeout = 1s;
    startBridged();

    machine->updatePluggedState(true);
    scheduler->runPending();
    EXPECT_FALSE(machine->timers().isArmed("wlan1_0"));
    EXPECT_FALSE(machine->timers().isArmed("wlan1_1"));

    scheduler->advance(2s);
    EXPECT_TRUE(hardware->removedInstances.empty());

    machine->updatePluggedState(false);
    scheduler->advance(2s);
    EXPECT_EQ(hardware->removedInstances, (std::vector<std::string>{ "wlan1_1" }));
  }

  //---stop and failures------------------------------------------------------------------

  TEST_F(SoftApStateMachineTest, stop_RunningTearsDownOnce) {
    startSingle();
    connect(kClientB);
    EXPECT_CALL(listener, onStopped()).Times(1);

    machine->stop();
    machine->stop();
    scheduler->runPending();

    EXPECT_EQ(stopEvents, (std::vector<StopEvent>{ StopEvent::Stopped }));
    EXPECT_EQ(hardware->teardowns, (std::vector<std::string>{ "wlan1" }));
    EXPECT_EQ(machine->connectedClientCount(), 0u);
    EXPECT_TRUE(machine->interfaceName().empty());
  }

  TEST_F(SoftApStateMachineTest, stop_IdleTerminatesWithoutHardware) {
    build();
    machine->stop();
    scheduler->runPending();
    EXPECT_EQ(machine->lifecycleState(), LifecycleState::Stopped);
    EXPECT_TRUE(hardware->teardowns.empty());

    machine->start(request());
    scheduler->runPending();
    EXPECT_EQ(hardware->bringUpCalls, 0);
  }

  TEST_F(SoftApStateMachineTest, failure_InterfaceDownStopsWithFailure) {
    startSingle();
    EXPECT_CALL(*errorMonitor, notifyFailure(HasSubstr("interface down"))).Times(1);

    machine->onInterfaceDown("wlan1");
    scheduler->runPending();

    EXPECT_EQ(stopEvents, (std::vector<StopEvent>{ StopEvent::InterfaceDown }));
    const std::vector<ApState> tail(states.end() - 3, states.end());
    EXPECT_EQ(tail, (std::vector<ApState>{ ApState::Failed, ApState::Disabling, ApState::Disabled }));
  }

  TEST_F(SoftApStateMachineTest, failure_DestroyedInterfaceIsNotTornDownAgain) {
    startSingle();
    machine->onInterfaceDown("other0");
    machine->onInterfaceDestroyed("wlan1");
    scheduler->runPending();

    EXPECT_EQ(stopEvents, (std::vector<StopEvent>{ StopEvent::InterfaceDestroyed }));
    EXPECT_TRUE(hardware->teardowns.empty());
  }

  TEST_F(SoftApStateMachineTest, failure_SingleApHostapdFailure) {
    startSingle();
    machine->onFailure();
    scheduler->runPending();
    EXPECT_EQ(stopEvents, (std::vector<StopEvent>{ StopEvent::HostapdFailure }));
    EXPECT_EQ(machine->lifecycleState(), LifecycleState::Stopped);
  }

  TEST_F(SoftApStateMachineTest, failure_BridgedInstanceFailureKeepsSurvivor) {
    startBridged();
    hardware->bridgedInstances = { "wlan1_0" };

    machine->onInstanceFailure("wlan1_1");
    scheduler->runPending();

    EXPECT_EQ(machine->lifecycleState(), LifecycleState::Running);
    EXPECT_EQ(hardware->removedInstances, (std::vector<std::string>{ "wlan1_1" }));
    EXPECT_EQ(machine->instanceInfos().count("wlan1_0"), 1u);
    EXPECT_TRUE(stopEvents.empty());

    machine->onFailure();
    scheduler->runPending();
    EXPECT_EQ(stopEvents, (std::vector<StopEvent>{ StopEvent::HostapdFailure }));
  }

  TEST_F(SoftApStateMachineTest, failure_StaleBridgedInstanceIsDropped) {
    startBridged();
    machine->onInstanceFailure("wlan1_1");
    scheduler->runPending();
    ASSERT_EQ(machine->instanceInfos().size(), 1u);

    hardware->bridgedInstances = { "wlan1_9" };
    machine->onFailure();
    scheduler->runPending();

    EXPECT_EQ(machine->lifecycleState(), LifecycleState::Running);
    EXPECT_TRUE(machine->instanceInfos().empty());
  }

  //---coexistence and regulatory---------------------------------------------------------

  TEST_F(SoftApStateMachineTest, coexistence_UnavailableBandInstanceRemoved) {
    startBridged();

    machine->onSafeChannelsChanged({ 5180 }, true);
    scheduler->runPending();
    EXPECT_TRUE(hardware->removedInstances.empty()); // 5745 still usable

    machine->onSafeChannelsChanged({ 5180, 5745 }, true);
    scheduler->runPending();
    EXPECT_EQ(hardware->removedInstances, (std::vector<std::string>{ "wlan1_1" }));
    EXPECT_EQ(machine->safeChannels().count(5180), 0u);
  }

  TEST_F(SoftApStateMachineTest, coexistence_IgnoredWhenNotRestrictingSoftAp) {
    startBridged();
    machine->onSafeChannelsChanged({ 5180, 5745 }, false);
    scheduler->runPending();
    EXPECT_TRUE(hardware->removedInstances.empty());
  }

  TEST_F(SoftApStateMachineTest, stationConnected_RemovesInstanceOnSameBand) {
    startBridged();

    machine->onStationConnected(5745); // safe, no conflict
    scheduler->runPending();
    EXPECT_TRUE(hardware->removedInstances.empty());

    machine->onStationConnected(2417);
    scheduler->runPending();
    EXPECT_EQ(hardware->removedInstances, (std::vector<std::string>{ "wlan1_0" }));
  }

  TEST_F(SoftApStateMachineTest, updateCountryCode_AppliedOnlyWhenSupported) {
    startSingle();
    machine->updateCountryCode("de");
    scheduler->runPending();
    EXPECT_EQ(machine->countryCode(), "US");

    overlay.dynamicCountryCodeSupported = true;
    capability.setFeature(Feature::AcsOffload, true);
    hardware->countryCodes.clear();
    startSingle();
    machine->updateCountryCode("de");
    scheduler->runPending();
    EXPECT_EQ(machine->countryCode(), "de");
    EXPECT_EQ(hardware->countryCodes.back(), "DE");
  }

} // namespace apctl::test
