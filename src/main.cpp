/*
 * =================================================================================
 * Project:   RV Safety Core - PIN Authorization & Safety Interlock Supervisor
 * File:      main.cpp
 * Description: Daemon entry point. Composition root for the safety supervisor.
 * Usage:       rvsafetyd [config.json] [--provision <user>]
 * =================================================================================
 */

#include <signal.h>
#include <stdio.h>
#include <string.h>
#include <chrono>
#include <map>
#include <string>
#include <thread>

// --- Module Includes ---
#include "Config.h"
#include "HostSafetyContext.h"
#include "Logger.h"
#include "SettingsManager.h"

// --- Library Includes ---
#include "FeatureRegistry.h"
#include "FilePinStore.h"
#include "PinManager.h"
#include "SafetyRuntime.h"
#include "SafetyService.h"
#include "SecurityAuditLog.h"

static volatile sig_atomic_t g_shutdownRequested = 0;

static void handleSignal(int) { g_shutdownRequested = 1; }

/**
 * Prints high-level daemon identity and build information.
 */
static void printFirmwareDiagnostics(ISafetyContext &ctx, const std::string &configPath) {
  char logBuf[192];

  ctx.log(LOG_SEP_MAJOR);
  ctx.log("                       DAEMON IDENTITY                                    ");
  ctx.log(LOG_SEP_MAJOR);

  // -------------------------------------------------------------------------
  // SECTION: IDENTITY
  // -------------------------------------------------------------------------
  ctx.log("[ VERSION INFO ]");

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Device Name", DEVICE_NAME);
  ctx.log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Version", DEVICE_VERSION);
  ctx.log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Config File", configPath.c_str());
  ctx.log(logBuf);

  // -------------------------------------------------------------------------
  // SECTION: BUILD METADATA
  // -------------------------------------------------------------------------
  ctx.log("");
  ctx.log("[ BUILD DETAILS ]");

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Build Date", __DATE__);
  ctx.log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Build Time", __TIME__);
  ctx.log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %ld", "C++ Standard", (long)__cplusplus);
  ctx.log(logBuf);

  ctx.log(LOG_SEP_MAJOR);
}

static void printUsage(const char *argv0) {
  fprintf(stderr, "Usage: %s [config.json] [--provision <user>]\n", argv0);
}

// =================================================================
// --- Core Application Setup & Loop ---
// =================================================================

int main(int argc, char **argv) {
  std::string configPath = DEFAULT_CONFIG_PATH;
  std::string provisionUser;

  for (int i = 1; i < argc; i++) {
    if (strcmp(argv[i], "--provision") == 0) {
      if (i + 1 >= argc) {
        printUsage(argv[0]);
        return 2;
      }
      provisionUser = argv[++i];
    } else if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
      printUsage(argv[0]);
      return 0;
    } else {
      configPath = argv[i];
    }
  }

  HostSafetyContext ctx;
  printFirmwareDiagnostics(ctx, configPath);

  // 1. Configuration
  AppConfig config;
  std::string errorMsg;
  if (!SettingsManager::loadConfig(configPath, config, errorMsg)) {
    logKeyValue("System", errorMsg.c_str());
    flushLogQueue();
    return 1;
  }

  // 2. PIN storage (fail closed if the snapshot is unreadable)
  if (!SettingsManager::ensureParentDirectory(config.pinStorePath)) {
    flushLogQueue();
    return 1;
  }
  FilePinStore pinStore(ctx, config.pinStorePath);
  if (!pinStore.load()) {
    logKeyValue("System", "PIN store could not be loaded. Refusing to start.");
    flushLogQueue();
    return 1;
  }

  // 3. Services
  PinManager pinManager(ctx, pinStore, config.pin);
  FeatureRegistry features(ctx);
  SettingsManager::applyFeatures(config, features);
  SecurityAuditLog securityAudit(ctx, config.rateLimits);
  SafetyService safety(ctx, features, config.safety, &pinManager, &securityAudit);
  SafetyRuntime runtime(ctx, safety);

  // 4. Optional provisioning. PINs go to stdout only, never to the log.
  if (!provisionUser.empty()) {
    std::map<PinType, std::string> generated;
    AuthOutcome outcome = pinManager.initializeDefaultPins(provisionUser, generated);
    if (outcome != AUTH_OK) {
      logKeyValue("System", "PIN provisioning failed.");
      flushLogQueue();
      return 1;
    }
    if (generated.empty()) {
      logKeyValue("System", "User already has PINs; nothing provisioned.");
    } else {
      printf("Provisioned PINs for %s (shown once):\n", provisionUser.c_str());
      for (std::map<PinType, std::string>::const_iterator it = generated.begin(); it != generated.end(); ++it) {
        printf("  %-12s %s\n", pinTypeToString(it->first), it->second.c_str());
      }
      fflush(stdout);
    }
  }

  // 5. Diagnostics
  pinManager.printStartupDiagnostics();
  safety.printStartupDiagnostics();
  ctx.log(LOG_SEP_MAJOR);
  flushLogQueue();

  // 6. Start monitoring
  signal(SIGINT, handleSignal);
  signal(SIGTERM, handleSignal);
  runtime.start();

  unsigned long lastSweep = ctx.getMillis();
  while (!g_shutdownRequested) {
    processLogQueue();

    if (ctx.getMillis() - lastSweep >= SESSION_SWEEP_INTERVAL_MS) {
      pinManager.cleanupExpiredSessions();
      lastSweep = ctx.getMillis();
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(MAIN_LOOP_INTERVAL_MS));
  }

  // 7. Graceful shutdown
  logKeyValue("System", "Shutdown requested.");
  runtime.stop();
  flushLogQueue();
  return 0;
}
