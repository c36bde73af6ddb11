/*
 * =================================================================================
 * File:      include/SettingsManager.h
 * Description:
 * Central controller for daemon configuration.
 * - Reads the JSON configuration file and validates it (ConfigValidators).
 * - Writes a default file when none exists.
 * - Applies the feature list to the registry.
 * =================================================================================
 */
#pragma once
#include <string>

#include <ArduinoJson.h>

#include "ConfigValidators.h"
#include "FeatureRegistry.h"

class SettingsManager {
public:
  // --- Configuration File ---
  // Fills 'config' with defaults, then overlays the file. A missing file is
  // replaced by a default one. Returns false if the file is invalid.
  static bool loadConfig(const std::string &path, AppConfig &config, std::string &errorMsg);
  static bool writeDefaultConfig(const std::string &path, const AppConfig &config);
  static void serializeConfig(const AppConfig &config, JsonObject out);

  // --- Application ---
  static void applyFeatures(const AppConfig &config, FeatureRegistry &registry);

  // --- Filesystem ---
  static bool ensureParentDirectory(const std::string &path);

private:
  static void log(const char *key, const char *value);
};
