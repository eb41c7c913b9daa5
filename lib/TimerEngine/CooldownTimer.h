/*
 * =================================================================================
 * Project:   Special Attack Timers - Regen & Surge Cooldown Tracker
 * File:      lib/TimerEngine/CooldownTimer.h
 *
 * Description:
 * Wall-clock countdown for the surge potion cooldown.
 * While running only the end timestamp is kept; while paused only the
 * remaining duration is kept. Both cleared means no cooldown.
 * =================================================================================
 */
#pragma once
#include "Types.h"
#include "TimerContext.h"

class CooldownTimer {
public:
    CooldownTimer(CooldownState& state, ITimerHAL& hal);

    // Starts (or overwrites) a cooldown. No stacking.
    void start(uint32_t durationMs, bool pausedAtStart);

    // Ends the cooldown immediately. Idempotent.
    void clear();

    /**
     * Applies the pause condition after a phase mutation.
     * running -> paused snapshots the remaining time, paused -> running
     * re-anchors the end timestamp. Any other combination is a no-op.
     */
    void syncPauseState(bool shouldBePaused);

    // --- Accessors (pure) ---
    uint32_t remainingMs() const;
    uint32_t remainingTicks() const { return remainingMs() / TICK_DURATION_MS; }
    bool isPaused() const { return _state.paused; }
    bool isActive() const { return _state.running || _state.paused; }

private:
    CooldownState& _state;
    ITimerHAL& _hal;

    uint32_t remainingAt(unsigned long now) const;
};
