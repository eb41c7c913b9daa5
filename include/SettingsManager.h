/*
 * =================================================================================
 * File:      include/SettingsManager.h
 * Description:
 * Central controller for display preferences.
 * - Loads the JSON settings file.
 * - Falls back to defaults (with a log line) on any invalid value.
 * =================================================================================
 */
#pragma once
#include "Types.h"
#include <stdint.h>

class SettingsManager {
public:
  // Loads preferences from a JSON file on top of DEFAULT_DISPLAY_SETTINGS.
  // Returns false (and leaves the defaults in place) if the file is missing or invalid.
  static bool loadDisplaySettings(const char *path, DisplaySettings &settings);

  // Same, from an in-memory JSON document.
  static bool parseDisplaySettings(const char *json, DisplaySettings &settings);

  static void printDisplaySettings(const DisplaySettings &settings);

  // 0xRRGGBBAA -> "#RRGGBB" (alpha omitted when opaque)
  static void formatColor(uint32_t color, char *buf, size_t size);

private:
  static void log(const char *key, const char *value);
};
