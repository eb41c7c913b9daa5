/*
 * =================================================================================
 * Project:   Special Attack Timers - Regen & Surge Cooldown Tracker
 * File:      lib/TimerEngine/PhaseTracker.h
 *
 * Description:
 * Encounter phase state shared by both timers.
 * - encounterPaused     : Colosseum waves and Doom delves. Stops the regen countdown and the
 *                         surge cooldown.
 * - secondaryZonePaused : Theatre of Blood rooms. Stops the surge cooldown only.
 * Every mutation is followed by a cooldown pause sync.
 * =================================================================================
 */
#pragma once
#include "Types.h"
#include "TimerContext.h"
#include "RegenTimer.h"
#include "CooldownTimer.h"

class EncounterPhaseTracker {
public:
    EncounterPhaseTracker(PhaseState& state,
                          RegenTimer& regen,
                          CooldownTimer& cooldown,
                          ITimerHAL& hal,
                          const TimerDefaults& defaults);

    void reset();

    // --- Inputs ---

    // Phase-bearing text signal (SIG_WAVE_* / SIG_DELVE_* / SIG_ROOM_* / SIG_RUN_*).
    // @return false if the signal carries no phase meaning.
    bool applyTextSignal(const TextSignal& signal);

    // Per-tick zone/position sample. Runs after the regen step.
    void onLocationSample(const Location& location);

    void onNpcSpawned(const char* name, int32_t npcId);
    void onMenuOption(const char* option);

    // Theatre of Blood status (transition detected here).
    void onEncounterStatus(int32_t status);

    // --- Accessors ---
    bool isEncounterPaused() const { return _state.encounterPaused; }
    bool isSecondaryZonePaused() const { return _state.secondaryZonePaused; }
    bool isEncounterModeActive() const { return _state.encounterModeActive; }
    bool isCooldownPauseRequired() const { return _state.encounterPaused || _state.secondaryZonePaused; }
    int32_t getCurrentZoneId() const { return _state.currentZoneId; }
    bool isSegmentEntryArmed() const { return _state.segmentEntryArmed; }

private:
    PhaseState& _state;
    RegenTimer& _regen;
    CooldownTimer& _cooldown;
    ITimerHAL& _hal;
    const TimerDefaults& _defaults;

    void setEncounterPaused(bool paused, const char* reason);
    void setSecondaryZonePaused(bool paused, const char* reason);
    void enterBossRoom(const char* reason);
    void syncCooldown();

    void logKeyValue(const char* key, const char* value);
};
