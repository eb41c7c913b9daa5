/*
 * =================================================================================
 * Project:   Special Attack Timers - Regen & Surge Cooldown Tracker
 * File:      main.cpp
 * Description: Application entry point.
 * Replays a recorded JSON-lines event stream through the timer engine and
 * prints the InfoBox text after every game tick.
 *
 * Usage: spec_timers_replay <events.jsonl> [settings.json]
 * =================================================================================
 */

#include <ArduinoJson.h>
#include <fstream>
#include <stdio.h>
#include <string>

// --- Module Includes ---
#include "Config.h"
#include "HostTimerHAL.h"
#include "Logger.h"
#include "SettingsManager.h"

// --- Timer Engine Includes ---
#include "ReplayCodec.h"
#include "TimeUtils.h"
#include "TimerEngine.h"

// --- Exit Codes ---
#define EXIT_OK 0
#define EXIT_USAGE 1
#define EXIT_NO_INPUT 2

// --- Dependencies ---
HostTimerHAL &hal = HostTimerHAL::getInstance();

static void flushLogs() {
  while (processLogQueue() > 0) {
  }
}

/**
 * Prints application identity and build information.
 */
void printAppDiagnostics() {
  char logBuf[128];

  hal.log(LOG_SEP_MAJOR);
  hal.log("                       APPLICATION IDENTITY                               ");
  hal.log(LOG_SEP_MAJOR);

  // -------------------------------------------------------------------------
  // SECTION: IDENTITY
  // -------------------------------------------------------------------------
  hal.log("[ VERSION INFO ]");

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Application", APP_NAME);
  hal.log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Version", APP_VERSION);
  hal.log(logBuf);

  // -------------------------------------------------------------------------
  // SECTION: BUILD METADATA
  // -------------------------------------------------------------------------
  hal.log("");
  hal.log("[ BUILD DETAILS ]");

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Build Date", __DATE__);
  hal.log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Build Time", __TIME__);
  hal.log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %ld", "C++ Standard", __cplusplus);
  hal.log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "ArduinoJson", ARDUINOJSON_VERSION);
  hal.log(logBuf);

  hal.log(LOG_SEP_MAJOR);
}

/**
 * One status line per tick, built from what the InfoBoxes would show.
 * e.g. "[tick 120] regen 8 | circle 84% | surge 4:29 (PAUSED, #FFA500)"
 */
static void logTickStatus(const TimerEngine &engine, const DisplaySettings &settings, int32_t tickIndex) {
  char logBuf[MAX_LOG_LENGTH];
  char textBuf[32];
  char colorBuf[16];
  int len = snprintf(logBuf, sizeof(logBuf), "[tick %d]", (int)tickIndex);

  bool regenVisible = TimeUtils::isRegenVisible(engine.isSpecFull(), engine.isEncounterPaused());

  if (settings.showInfoBox && regenVisible) {
    TimeUtils::formatRegen(engine.getTicksUntilRegen(), engine.getMaxRegenTicks(), settings.displayFormat, textBuf,
                           sizeof(textBuf));
    SettingsManager::formatColor(settings.activeColor, colorBuf, sizeof(colorBuf));
    len += snprintf(logBuf + len, sizeof(logBuf) - len, " regen %s%s (%s)", textBuf,
                    engine.isAccelerated() ? " LB" : "", colorBuf);
  }

  if (settings.showCircularOverlay && regenVisible && len < (int)sizeof(logBuf)) {
    len += snprintf(logBuf + len, sizeof(logBuf) - len, " | circle %d%%", (int)(engine.getRegenProgress() * 100));
  }

  uint32_t cooldownMs = engine.getCooldownRemainingMs();
  if (settings.showSurgeInfoBox && TimeUtils::isCooldownVisible(cooldownMs) && len < (int)sizeof(logBuf)) {
    bool paused = engine.isCooldownPaused();
    TimeUtils::formatCooldown(cooldownMs, settings.surgeDisplayFormat, textBuf, sizeof(textBuf));
    SettingsManager::formatColor(paused ? settings.surgePausedColor : settings.surgeColor, colorBuf, sizeof(colorBuf));
    snprintf(logBuf + len, sizeof(logBuf) - len, " | surge %s (%s%s)", textBuf, paused ? "PAUSED, " : "", colorBuf);
  }

  hal.log(logBuf);
}

// =================================================================
// --- Core Application Setup & Loop ---
// =================================================================

int main(int argc, char **argv) {
  if (argc < 2 || argc > 3) {
    fprintf(stderr, "Usage: %s <events.jsonl> [settings.json]\n", argv[0]);
    return EXIT_USAGE;
  }

  // 1. Identity
  printAppDiagnostics();
  flushLogs();

  // 2. Load Display Preferences
  DisplaySettings settings = DEFAULT_DISPLAY_SETTINGS;
  if (argc == 3) {
    if (!SettingsManager::loadDisplaySettings(argv[2], settings)) {
      settings = DEFAULT_DISPLAY_SETTINGS;
    }
  } else {
    hal.logKeyValue("Settings", "No settings file. Using defaults.");
  }
  SettingsManager::printDisplaySettings(settings);
  flushLogs();

  // 3. Initialize Engine
  TimerEngine engine(hal, DEFAULT_TIMER_DEFS);
  engine.printStartupDiagnostics();
  hal.log(LOG_SEP_MAJOR);
  flushLogs();

  // 4. Open Event Stream
  std::ifstream input(argv[1]);
  if (!input.is_open()) {
    std::string msg = std::string("Cannot open event stream: ") + argv[1];
    hal.logKeyValue("Replay", msg.c_str());
    flushLogs();
    return EXIT_NO_INPUT;
  }

  // 5. Replay Loop
  std::string line;
  int lineNumber = 0;
  int applied = 0;
  int ignored = 0;
  int rejected = 0;
  int malformed = 0;

  while (std::getline(input, line)) {
    lineNumber++;

    // Blank lines and '#' comments are allowed in hand-written streams
    size_t first = line.find_first_not_of(" \t\r");
    if (first == std::string::npos || line[first] == '#') continue;

    JsonDocument doc;
    DeserializationError error = deserializeJson(doc, line);

    TimerEvent event;
    std::string errorMsg;
    bool valid = false;
    if (error) {
      errorMsg = std::string("Invalid JSON: ") + error.c_str();
    } else {
      valid = ReplayCodec::parseEvent(doc.as<JsonVariantConst>(), event, errorMsg);
    }

    if (!valid) {
      char logBuf[MAX_LOG_LENGTH];
      snprintf(logBuf, sizeof(logBuf), "Line %d skipped. %s", lineNumber, errorMsg.c_str());
      hal.logKeyValue("Replay", logBuf);
      malformed++;
      flushLogs();
      continue;
    }

    unsigned long timestamp = 0;
    if (ReplayCodec::readTimestamp(doc.as<JsonVariantConst>(), timestamp)) {
      hal.setReplayClock(timestamp);
    }

    EventResult result = engine.applyEvent(event);
    switch (result) {
    case EVENT_APPLIED:
      applied++;
      break;
    case EVENT_IGNORED:
      ignored++;
      break;
    case EVENT_REJECTED: {
      char logBuf[MAX_LOG_LENGTH];
      snprintf(logBuf, sizeof(logBuf), "Line %d: %s %s.", lineNumber, eventTypeToString(event.type),
               resultToString(result));
      hal.logKeyValue("Replay", logBuf);
      rejected++;
      break;
    }
    }

    if (event.type == EVT_TICK && result == EVENT_APPLIED) {
      logTickStatus(engine, settings, event.tickIndex);
    }

    flushLogs();
  }

  // 6. Summary
  char logBuf[MAX_LOG_LENGTH];
  hal.log(LOG_SEP_MINOR);
  snprintf(logBuf, sizeof(logBuf), "%d lines: %d applied, %d ignored, %d rejected, %d malformed.", lineNumber, applied,
           ignored, rejected, malformed);
  hal.logKeyValue("Replay", logBuf);
  flushLogs();

  return EXIT_OK;
}
