/*
 * =================================================================================
 * Project:   Special Attack Timers - Regen & Surge Cooldown Tracker
 * File:      lib/TimerEngine/RegenTimer.h
 *
 * Description:
 * Tick countdown until the next special attack regeneration.
 * Operates on a TimerState owned by the caller (normally the TimerEngine's
 * SessionState), so the countdown can be exercised in isolation by tests.
 * =================================================================================
 */
#pragma once
#include "Types.h"

class RegenTimer {
public:
    RegenTimer(TimerState& state, const TimerDefaults& defaults);

    // Restores the session-start defaults (normal cadence, no sample, no window).
    void reset();

    /**
     * Called once per game tick.
     * @param specEnergy Current special attack energy (clamped to 0..maxEnergy).
     * @param tickIndex  Monotonic game tick counter.
     * @param paused     True while between encounter segments.
     * @return true if a natural regeneration was detected (timer re-synced).
     */
    bool onPeriodicTick(int32_t specEnergy, int32_t tickIndex, bool paused);

    // Equipment flag transition (Lightbearer on/off).
    void onCadenceFlagChanged(bool accelerated);

    // Opens the grace window for a known out-of-band restore.
    // NO_TICK defers the window start to the next periodic tick.
    void onExternalRestoreDetected(int32_t tickIndex, int32_t expectedDelta);

    // Sets the countdown directly, clamped into [0, cadence].
    void reseed(int32_t ticks);

    // Primes lastObservedEnergy without evaluating a regen (login sample).
    void observeEnergy(int32_t specEnergy);

    // --- Accessors ---
    int32_t getTicksUntilRegen() const { return _state.ticksUntilRegen; }
    int32_t getMaxRegenTicks() const { return _state.regenCadence; }
    bool isAccelerated() const { return _state.accelerated; }
    double getSecondsUntilRegen() const { return _state.ticksUntilRegen * (TICK_DURATION_MS / 1000.0); }
    bool isSpecFull() const;
    bool isIgnoreWindowActive() const { return _state.ignoreWindowActive; }

    int32_t clampEnergy(int32_t specEnergy) const;

private:
    TimerState& _state;
    const TimerDefaults& _defaults;

    int32_t cadenceFor(bool accelerated) const;
};
