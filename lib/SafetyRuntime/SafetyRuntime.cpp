/*
 * =================================================================================
 * Project:   RV Safety Core - PIN Authorization & Safety Interlock Supervisor
 * File:      lib/SafetyRuntime/SafetyRuntime.cpp
 * =================================================================================
 */
#include <stdio.h>
#include <chrono>

#include "SafetyRuntime.h"

SafetyRuntime::SafetyRuntime(ISafetyContext& ctx, SafetyService& service)
    : _ctx(ctx),
      _service(service),
      _accepting(false),
      _stopRequested(false),
      _running(false),
      _healthTicks(0),
      _watchdogTimeouts(0)
{
}

SafetyRuntime::~SafetyRuntime() {
    stop();
}

void SafetyRuntime::logKeyValue(const char* key, const char* value) {
    char tempBuf[160];
    snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
    _ctx.log(tempBuf);
}

// =================================================================================
// SECTION: LIFECYCLE
// =================================================================================

bool SafetyRuntime::start() {
    if (_running.load()) return false;

    {
        std::lock_guard<std::mutex> lock(_serviceMutex);
        _service.startMonitoring();
    }

    {
        std::lock_guard<std::mutex> lock(_sleepMutex);
        _stopRequested = false;
    }
    {
        std::lock_guard<std::mutex> lock(_queueMutex);
        _accepting = true;
    }

    _running = true;
    _actorThread = std::thread(&SafetyRuntime::actorLoop, this);
    _healthThread = std::thread(&SafetyRuntime::healthLoop, this);
    _watchdogThread = std::thread(&SafetyRuntime::watchdogLoop, this);

    logKeyValue("Runtime", "Safety actor, health loop and watchdog loop started");
    return true;
}

void SafetyRuntime::stop() {
    if (!_running.load()) return;

    // 1. Wake the loops; an in-flight tick still completes on the actor
    {
        std::lock_guard<std::mutex> lock(_sleepMutex);
        _stopRequested = true;
    }
    _sleepCv.notify_all();
    if (_healthThread.joinable()) _healthThread.join();
    if (_watchdogThread.joinable()) _watchdogThread.join();

    // 2. Queue the stop marker behind any pending commands
    {
        std::lock_guard<std::mutex> lock(_queueMutex);
        Message msg;
        msg.type = MSG_STOP;
        _queue.push_back(msg);
        _accepting = false;
    }
    _queueCv.notify_one();
    if (_actorThread.joinable()) _actorThread.join();

    _running = false;
    logKeyValue("Runtime", "Safety runtime stopped");
}

// =================================================================================
// SECTION: MESSAGING
// =================================================================================

bool SafetyRuntime::post(MessageType type, const Command& fn, std::shared_ptr<std::promise<bool> > done) {
    {
        std::lock_guard<std::mutex> lock(_queueMutex);
        if (!_accepting) return false;
        Message msg;
        msg.type = type;
        msg.fn = fn;
        msg.done = done;
        _queue.push_back(msg);
    }
    _queueCv.notify_one();
    return true;
}

bool SafetyRuntime::postAndWait(MessageType type, const Command& fn, bool& result) {
    std::shared_ptr<std::promise<bool> > done(new std::promise<bool>());
    std::future<bool> future = done->get_future();
    if (!post(type, fn, done)) return false;
    result = future.get();
    return true;
}

void SafetyRuntime::execute(const Command& fn) {
    bool result = false;
    if (postAndWait(MSG_COMMAND, fn, result)) return;

    // Not running: the caller owns the service for the duration of the call
    std::lock_guard<std::mutex> lock(_serviceMutex);
    fn(_service);
}

SafetyStatus SafetyRuntime::getSafetyStatus() {
    SafetyStatus status;
    execute([&status](SafetyService& s) { status = s.getSafetyStatus(); });
    return status;
}

void SafetyRuntime::updateSystemState(const SystemStateUpdate& update) {
    execute([&update](SafetyService& s) { s.updateSystemState(update); });
}

// =================================================================================
// SECTION: THREAD BODIES
// =================================================================================

void SafetyRuntime::actorLoop() {
    while (true) {
        Message msg;
        {
            std::unique_lock<std::mutex> lock(_queueMutex);
            _queueCv.wait(lock, [this] { return !_queue.empty(); });
            msg = _queue.front();
            _queue.pop_front();
        }

        if (msg.type == MSG_STOP) break;

        bool result = true;
        {
            std::lock_guard<std::mutex> lock(_serviceMutex);
            switch (msg.type) {
            case MSG_HEALTH_TICK:
                if (msg.fn) msg.fn(_service);
                _healthTicks++;
                break;
            case MSG_WATCHDOG_TIMEOUT:
                // Expiry is latched; a kick since detection does not cancel it
                result = _service.checkWatchdog();
                break;
            case MSG_COMMAND:
                if (msg.fn) msg.fn(_service);
                break;
            default:
                break;
            }
        }
        if (msg.done) msg.done->set_value(result);
    }
}

bool SafetyRuntime::sleepFor(uint32_t ms) {
    std::unique_lock<std::mutex> lock(_sleepMutex);
    return !_sleepCv.wait_for(lock, std::chrono::milliseconds(ms), [this] { return _stopRequested; });
}

void SafetyRuntime::healthLoop() {
    uint32_t interval = _service.getConfig().healthCheckIntervalMs;
    bool wasActive = true;

    while (sleepFor(interval)) {
        // Query off the actor; a hung feature manager blocks only this thread
        HealthReport report;
        bool available = true;
        if (_service.isMonitoringActive()) available = _service.queryFeatureHealth(report);

        bool active = false;
        bool done = false;
        Command apply = [available, &report, &active](SafetyService& s) {
            active = s.applyHealthCheck(available, report);
        };
        if (!postAndWait(MSG_HEALTH_TICK, apply, done)) break;

        if (wasActive && !active) logKeyValue("Runtime", "Health loop idle (monitoring halted)");
        else if (!wasActive && active) logKeyValue("Runtime", "Health loop resumed");
        wasActive = active;
    }
}

void SafetyRuntime::watchdogLoop() {
    uint32_t poll = _service.getConfig().watchdogPollMs;

    while (sleepFor(poll)) {
        if (!_service.tripWatchdog()) continue;

        _watchdogTimeouts++;
        logKeyValue("Runtime", "Watchdog expired, safe state requested");
        if (!post(MSG_WATCHDOG_TIMEOUT, Command(), std::shared_ptr<std::promise<bool> >())) break;
    }
}
