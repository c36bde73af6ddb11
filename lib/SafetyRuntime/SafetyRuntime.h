/*
 * =================================================================================
 * Project:   RV Safety Core - PIN Authorization & Safety Interlock Supervisor
 * File:      lib/SafetyRuntime/SafetyRuntime.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Single owner of the SafetyService. One actor thread drains a FIFO of
 * messages; the health loop and watchdog loop threads post ticks and wait for
 * each iteration to finish. API callers post commands through execute().
 *
 * DESIGN NOTES:
 * 1. The loops keep running after a safe-state entry. Ticks are no-ops until
 *    monitoring is re-armed (clearSafeStateWithPin), so no restart is needed.
 * 2. The health loop thread runs the feature-health query itself and posts
 *    only the evaluation, so a blocking feature manager never stalls the
 *    actor. The watchdog thread latches the expiry with tripWatchdog()
 *    (atomics) and posts the timeout without waiting for it.
 * 3. stop() wakes both loops, lets the in-flight iteration complete, drains
 *    the queued commands, then joins. Calls made afterwards run inline.
 * 4. execute() must not be called from inside an executed function.
 * 5. stop() joins the health loop, so it waits for a blocked query to return.
 * =================================================================================
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>

#include "SafetyService.h"
#include "SafetyContext.h"

class SafetyRuntime {
public:
    typedef std::function<void(SafetyService&)> Command;

    SafetyRuntime(ISafetyContext& ctx, SafetyService& service);
    ~SafetyRuntime();

    // Arms monitoring and starts the actor and both loops.
    bool start();
    void stop();
    bool isRunning() const { return _running.load(); }

    // Runs fn on the actor thread and waits for it.
    void execute(const Command& fn);

    // --- Convenience wrappers ---
    SafetyStatus getSafetyStatus();
    void updateSystemState(const SystemStateUpdate& update);

    // --- Counters ---
    uint64_t getHealthTicks() const { return _healthTicks.load(); }
    uint32_t getWatchdogTimeouts() const { return _watchdogTimeouts.load(); }

private:
    enum MessageType : uint8_t { MSG_HEALTH_TICK, MSG_WATCHDOG_TIMEOUT, MSG_COMMAND, MSG_STOP };

    struct Message {
        MessageType type;
        Command fn;
        std::shared_ptr<std::promise<bool> > done;
    };

    // --- Dependencies ---
    ISafetyContext& _ctx;
    SafetyService& _service;

    // --- Threads ---
    std::thread _actorThread;
    std::thread _healthThread;
    std::thread _watchdogThread;

    // --- Message Queue ---
    std::mutex _queueMutex;
    std::condition_variable _queueCv;
    std::deque<Message> _queue;
    bool _accepting;

    // --- Loop Sleep / Cancellation ---
    std::mutex _sleepMutex;
    std::condition_variable _sleepCv;
    bool _stopRequested;

    // Held while any code touches the service.
    std::mutex _serviceMutex;

    std::atomic<bool> _running;
    std::atomic<uint64_t> _healthTicks;
    std::atomic<uint32_t> _watchdogTimeouts;

    // =========================================================================
    // SECTION: THREAD BODIES
    // =========================================================================

    void actorLoop();
    void healthLoop();
    void watchdogLoop();

    bool post(MessageType type, const Command& fn, std::shared_ptr<std::promise<bool> > done);
    bool postAndWait(MessageType type, const Command& fn, bool& result);
    bool sleepFor(uint32_t ms); // false once stop was requested

    void logKeyValue(const char* key, const char* value);
};
