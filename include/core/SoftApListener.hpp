#pragma once
/** @file  SoftApListener.hpp
 *  @brief Callbacks the state machine delivers to its owner.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include "model/ApTypes.hpp"

namespace apctl::core {

  /**
 * @class SoftApListener
 * @brief Owner-side observer.
 *
 *  * Called on the state machine's queue; never re-entered.
 *  * `onStarted`, `onStopped`, `onStartFailure` and `onStartResult` fire at most
 *    once per start attempt; `onStopEvent` at most once per machine.
 */
  class SoftApListener {
  public:
    virtual ~SoftApListener() = default;

    virtual void onStateChanged(model::ApState newState, model::ApState previousState,
                                model::FailureReason reason) = 0;
    virtual void onConnectedClientsOrInfoChanged(const model::InstanceInfoMap& infos,
                                                 const model::ClientMap& clients,
                                                 bool bridged) = 0;
    virtual void onBlockedClientConnecting(const model::ConnectedClient& client,
                                           model::BlockReason reason) = 0;

    //---attribution / metrics hooks-----------------------------------------
    virtual void onStarted() = 0;
    virtual void onStopped() = 0;
    virtual void onStartFailure(model::StartResult result) = 0;
    virtual void onStartResult(model::StartResult result) = 0;
    virtual void onStopEvent(model::StopEvent event) = 0;

    /// Whole-radio idle timer expired (the stop follows).
    virtual void onShutdownTimeoutExpired() {}
  };

} // namespace apctl::core
