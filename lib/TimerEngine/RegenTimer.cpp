/*
 * =================================================================================
 * Project:   Special Attack Timers - Regen & Surge Cooldown Tracker
 * File:      lib/TimerEngine/RegenTimer.cpp
 *
 * Description:
 * Regen countdown logic.
 * - Counts down once per tick unless spec is full or the encounter is paused.
 * - Re-syncs to the cadence whenever spec energy actually increases, except
 *   inside a short grace window opened for surge potions / Death Charge.
 * =================================================================================
 */
#include "RegenTimer.h"

RegenTimer::RegenTimer(TimerState& state, const TimerDefaults& defaults)
    : _state(state), _defaults(defaults)
{
    reset();
}

void RegenTimer::reset() {
    _state.accelerated = false;
    _state.regenCadence = cadenceFor(false);
    _state.ticksUntilRegen = _state.regenCadence;
    _state.lastObservedEnergy = NO_ENERGY;
    _state.ignoreWindowActive = false;
    _state.ignoreUntilTick = 0;
    _state.expectedDelta = 0;
}

int32_t RegenTimer::cadenceFor(bool accelerated) const {
    return (int32_t)(accelerated ? _defaults.acceleratedRegenTicks : _defaults.regenTicks);
}

int32_t RegenTimer::clampEnergy(int32_t specEnergy) const {
    if (specEnergy < 0) return 0;
    if (specEnergy > (int32_t)_defaults.maxEnergy) return (int32_t)_defaults.maxEnergy;
    return specEnergy;
}

bool RegenTimer::isSpecFull() const {
    return _state.lastObservedEnergy >= (int32_t)_defaults.maxEnergy;
}

void RegenTimer::observeEnergy(int32_t specEnergy) {
    _state.lastObservedEnergy = clampEnergy(specEnergy);
}

// =================================================================================
// SECTION: MAIN TICK
// =================================================================================

bool RegenTimer::onPeriodicTick(int32_t specEnergy, int32_t tickIndex, bool paused) {
    const int32_t current = clampEnergy(specEnergy);
    const int32_t maxEnergy = (int32_t)_defaults.maxEnergy;
    bool regenDetected = false;

    // 0. A restore reported before any tick is anchored on the first one
    if (_state.ignoreWindowActive && _state.ignoreUntilTick == NO_TICK) {
        _state.ignoreUntilTick = tickIndex + (int32_t)_defaults.restoreGraceTicks;
    }

    // 1. Detect an actual increase and decide whether it was natural regen
    if (_state.lastObservedEnergy != NO_ENERGY && current > _state.lastObservedEnergy) {
        int32_t actualIncrease = current - _state.lastObservedEnergy;
        int32_t maxPossibleIncrease = maxEnergy - _state.lastObservedEnergy;
        bool inGracePeriod = _state.ignoreWindowActive && tickIndex <= _state.ignoreUntilTick;

        // Natural regen layered on top of the effect pushes the increase past
        // the expected amount (unless the effect itself was capped at max).
        bool naturalRegenAlsoOccurred = inGracePeriod
            && actualIncrease > _state.expectedDelta
            && actualIncrease <= maxPossibleIncrease;

        if (!inGracePeriod || naturalRegenAlsoOccurred) {
            _state.ticksUntilRegen = _state.regenCadence;
            regenDetected = true;
        }
    }

    _state.lastObservedEnergy = current;

    // 2. Expire the grace window once its last tick has been evaluated
    if (_state.ignoreWindowActive && tickIndex >= _state.ignoreUntilTick) {
        _state.ignoreWindowActive = false;
        _state.expectedDelta = 0;
    }

    // 3. Countdown
    if (current >= maxEnergy) {
        // Nothing to regenerate
        _state.ticksUntilRegen = _state.regenCadence;
    } else if (paused) {
        // Stopped between segments
    } else {
        _state.ticksUntilRegen--;
        if (_state.ticksUntilRegen <= 0) {
            // Regen lands next tick; the next cycle starts from full cadence
            _state.ticksUntilRegen = _state.regenCadence;
        }
    }

    return regenDetected;
}

// =================================================================================
// SECTION: CADENCE & RESEED
// =================================================================================

void RegenTimer::onCadenceFlagChanged(bool accelerated) {
    if (accelerated == _state.accelerated) return;

    _state.accelerated = accelerated;
    _state.regenCadence = cadenceFor(accelerated);

    if (accelerated) {
        // Keep progress if already closer than one accelerated cycle
        if (_state.ticksUntilRegen > _state.regenCadence) {
            _state.ticksUntilRegen = _state.regenCadence;
        }
    } else {
        _state.ticksUntilRegen = _state.regenCadence;
    }
}

void RegenTimer::onExternalRestoreDetected(int32_t tickIndex, int32_t expectedDelta) {
    _state.ignoreWindowActive = true;
    _state.ignoreUntilTick = tickIndex == NO_TICK ? NO_TICK : tickIndex + (int32_t)_defaults.restoreGraceTicks;
    _state.expectedDelta = expectedDelta;
}

void RegenTimer::reseed(int32_t ticks) {
    if (ticks < 0) ticks = 0;
    if (ticks > _state.regenCadence) ticks = _state.regenCadence;
    _state.ticksUntilRegen = ticks;
}
