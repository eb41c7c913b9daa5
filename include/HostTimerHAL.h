/*
 * =================================================================================
 * Project:   Special Attack Timers - Regen & Surge Cooldown Tracker
 * File:      include/HostTimerHAL.h
 * Description: Header for the desktop implementation of ITimerHAL.
 * Routes logging into the Logger and supplies either a replay clock or the
 * host's monotonic clock.
 * =================================================================================
 */
#pragma once

#include "TimerContext.h"
#include "Types.h"
#include <chrono>

class HostTimerHAL : public ITimerHAL {
private:
  HostTimerHAL();

  std::chrono::steady_clock::time_point _startTime;

  // --- Replay Clock ---
  bool _replayClockActive;
  unsigned long _replayMillis;

public:
  static HostTimerHAL &getInstance();

  // --- Logging API ---
  void log(const char *message) override;
  void logKeyValue(const char *key, const char *value);

  // --- Clock ---
  unsigned long getMillis() override;

  // Pins getMillis() to recorded timestamps. Time never runs backwards.
  void setReplayClock(unsigned long millis);
  void clearReplayClock();
  bool isReplayClockActive() const { return _replayClockActive; }
};
