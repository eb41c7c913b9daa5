/*
 * =================================================================================
 * File:      src/SettingsManager.cpp
 * Description: Loading and validation of display preferences.
 * =================================================================================
 */
#include "SettingsManager.h"
#include "Config.h"
#include "HostTimerHAL.h" // For logging
#include "ReplayCodec.h"
#include <ArduinoJson.h>
#include <fstream>
#include <stdio.h>
#include <string>

// Helper for logging via HAL
void SettingsManager::log(const char *key, const char *val) { HostTimerHAL::getInstance().logKeyValue(key, val); }

// =================================================================================
// SECTION: LOADING
// =================================================================================

bool SettingsManager::loadDisplaySettings(const char *path, DisplaySettings &settings) {
  settings = DEFAULT_DISPLAY_SETTINGS;

  std::ifstream file(path);
  if (!file.is_open()) {
    std::string msg = std::string("Cannot open ") + path + ". Using defaults.";
    log("Settings", msg.c_str());
    return false;
  }

  JsonDocument doc;
  DeserializationError error = deserializeJson(doc, file);
  if (error) {
    std::string msg = std::string("Invalid JSON (") + error.c_str() + "). Using defaults.";
    log("Settings", msg.c_str());
    return false;
  }

  std::string errorMsg;
  if (!ReplayCodec::parseDisplaySettings(doc.as<JsonVariantConst>(), settings, errorMsg)) {
    errorMsg += " Using defaults.";
    log("Settings", errorMsg.c_str());
    return false;
  }

  log("Settings", "Display preferences loaded.");
  return true;
}

bool SettingsManager::parseDisplaySettings(const char *json, DisplaySettings &settings) {
  settings = DEFAULT_DISPLAY_SETTINGS;

  JsonDocument doc;
  DeserializationError error = deserializeJson(doc, json);
  if (error) {
    std::string msg = std::string("Invalid JSON (") + error.c_str() + "). Using defaults.";
    log("Settings", msg.c_str());
    return false;
  }

  std::string errorMsg;
  if (!ReplayCodec::parseDisplaySettings(doc.as<JsonVariantConst>(), settings, errorMsg)) {
    errorMsg += " Using defaults.";
    log("Settings", errorMsg.c_str());
    return false;
  }
  return true;
}

// =================================================================================
// SECTION: DIAGNOSTICS
// =================================================================================

void SettingsManager::formatColor(uint32_t color, char *buf, size_t size) {
  if ((color & 0xFF) == 0xFF) {
    snprintf(buf, size, "#%06X", (unsigned int)(color >> 8));
  } else {
    snprintf(buf, size, "#%08X", (unsigned int)color);
  }
}

void SettingsManager::printDisplaySettings(const DisplaySettings &settings) {
  HostTimerHAL &hal = HostTimerHAL::getInstance();
  char logBuf[MAX_LOG_LENGTH];
  char colorBuf[16];
  const char *boolStr[] = {"NO", "YES"};

  hal.log("[ DISPLAY PREFERENCES ]");

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s (%s)", "Regen InfoBox", boolStr[settings.showInfoBox],
           formatToString(settings.displayFormat));
  hal.log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Circular Overlay", boolStr[settings.showCircularOverlay]);
  hal.log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s (%s)", "Surge InfoBox", boolStr[settings.showSurgeInfoBox],
           formatToString(settings.surgeDisplayFormat));
  hal.log(logBuf);

  struct {
    const char *label;
    uint32_t color;
  } colors[] = {
      {"Active Color", settings.activeColor},
      {"Circle Color", settings.circleColor},
      {"Surge Color", settings.surgeColor},
      {"Surge Paused Color", settings.surgePausedColor},
  };
  for (size_t i = 0; i < sizeof(colors) / sizeof(colors[0]); i++) {
    formatColor(colors[i].color, colorBuf, sizeof(colorBuf));
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", colors[i].label, colorBuf);
    hal.log(logBuf);
  }
}
