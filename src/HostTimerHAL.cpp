/*
 * =================================================================================
 * Project:   Special Attack Timers - Regen & Surge Cooldown Tracker
 * File:      src/HostTimerHAL.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Desktop hardware abstraction layer. Logging and the millisecond clock.
 * =================================================================================
 */
#include "HostTimerHAL.h"

#include <stdio.h>

#include "Logger.h"

// =================================================================================
// SECTION: CLASS IMPLEMENTATION
// =================================================================================

HostTimerHAL::HostTimerHAL()
    : _startTime(std::chrono::steady_clock::now()), _replayClockActive(false), _replayMillis(0) {}

HostTimerHAL &HostTimerHAL::getInstance() {
  static HostTimerHAL instance;
  return instance;
}

// =================================================================================
// SECTION: LOGGING
// =================================================================================

void HostTimerHAL::log(const char *message) { logMessage(message); }

void HostTimerHAL::logKeyValue(const char *key, const char *value) {
  char tempBuf[MAX_LOG_LENGTH];
  snprintf(tempBuf, MAX_LOG_LENGTH, " %-8s : %s", key, value);
  log(tempBuf);
}

// =================================================================================
// SECTION: CLOCK
// =================================================================================

unsigned long HostTimerHAL::getMillis() {
  if (_replayClockActive) {
    return _replayMillis;
  }
  std::chrono::steady_clock::duration elapsed = std::chrono::steady_clock::now() - _startTime;
  return (unsigned long)std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
}

void HostTimerHAL::setReplayClock(unsigned long millis) {
  if (_replayClockActive && millis < _replayMillis) {
    char logBuf[96];
    snprintf(logBuf, sizeof(logBuf), "Timestamp %lu is older than %lu. Clock held.", millis, _replayMillis);
    logKeyValue("Clock", logBuf);
    return;
  }
  _replayClockActive = true;
  _replayMillis = millis;
}

void HostTimerHAL::clearReplayClock() {
  _replayClockActive = false;
  _replayMillis = 0;
}
