/*
 * =================================================================================
 * Project:   Special Attack Timers - Regen & Surge Cooldown Tracker
 * File:      lib/TimerEngine/CooldownTimer.cpp
 * =================================================================================
 */
#include "CooldownTimer.h"

CooldownTimer::CooldownTimer(CooldownState& state, ITimerHAL& hal)
    : _state(state), _hal(hal)
{
    clear();
}

uint32_t CooldownTimer::remainingAt(unsigned long now) const {
    // Signed difference keeps this correct across millis() wrap-around
    long delta = (long)(_state.endMillis - now);
    return delta > 0 ? (uint32_t)delta : 0;
}

void CooldownTimer::start(uint32_t durationMs, bool pausedAtStart) {
    if (pausedAtStart) {
        _state.paused = true;
        _state.pausedRemainingMs = durationMs;
        _state.running = false;
        _state.endMillis = 0;
    } else {
        _state.running = true;
        _state.endMillis = _hal.getMillis() + durationMs;
        _state.paused = false;
        _state.pausedRemainingMs = 0;
    }
}

void CooldownTimer::clear() {
    _state.running = false;
    _state.endMillis = 0;
    _state.paused = false;
    _state.pausedRemainingMs = 0;
}

void CooldownTimer::syncPauseState(bool shouldBePaused) {
    if (shouldBePaused && !_state.paused && _state.running) {
        // Freeze: keep only what was left
        _state.pausedRemainingMs = remainingAt(_hal.getMillis());
        _state.paused = true;
        _state.running = false;
        _state.endMillis = 0;
    } else if (!shouldBePaused && _state.paused) {
        // Resume: re-anchor against the current clock
        _state.endMillis = _hal.getMillis() + _state.pausedRemainingMs;
        _state.running = true;
        _state.paused = false;
        _state.pausedRemainingMs = 0;
    }
}

uint32_t CooldownTimer::remainingMs() const {
    if (_state.paused) return _state.pausedRemainingMs;
    if (_state.running) return remainingAt(_hal.getMillis());
    return 0;
}
