/*
 * =================================================================================
 * Project:   Special Attack Timers - Regen & Surge Cooldown Tracker
 * File:      lib/TimerEngine/PhaseTracker.cpp
 *
 * Description:
 * Encounter phase transitions.
 * - Colosseum:  "Wave N completed!" pauses, "Wave: N" resumes with a full reseed,
 *               the reward chest message resumes without a reseed.
 * - Doom:       "Delve level: N duration:" pauses, the boss spawn resumes with
 *               a reseed two ticks short of a full cycle.
 * - ToB:        room completion pauses the surge cooldown until the next boss
 *               room is entered (region, barrier tiles, NPC or dialogue).
 * =================================================================================
 */
#include <stdio.h>
#include <string.h>

#include "PhaseTracker.h"
#include "EncounterGrammars.h"

EncounterPhaseTracker::EncounterPhaseTracker(PhaseState& state,
                                             RegenTimer& regen,
                                             CooldownTimer& cooldown,
                                             ITimerHAL& hal,
                                             const TimerDefaults& defaults)
    : _state(state),
      _regen(regen),
      _cooldown(cooldown),
      _hal(hal),
      _defaults(defaults)
{
    reset();
}

void EncounterPhaseTracker::reset() {
    _state.encounterPaused = false;
    _state.secondaryZonePaused = false;
    _state.encounterModeActive = false;
    _state.currentZoneId = NO_REGION;
    _state.segmentEntryArmed = true;
    _state.roomCheckPending = false;
}

void EncounterPhaseTracker::logKeyValue(const char* key, const char* value) {
    char tempBuf[MAX_LOG_LENGTH];
    snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
    _hal.log(tempBuf);
}

// =================================================================================
// SECTION: PHASE MUTATIONS (all paths end in syncCooldown)
// =================================================================================

void EncounterPhaseTracker::syncCooldown() {
    _cooldown.syncPauseState(isCooldownPauseRequired());
}

void EncounterPhaseTracker::setEncounterPaused(bool paused, const char* reason) {
    if (_state.encounterPaused != paused) {
        char logBuf[MAX_LOG_LENGTH];
        snprintf(logBuf, sizeof(logBuf), ">>> PHASE CHANGE: %s (%s)", paused ? "PAUSED" : "RUNNING", reason);
        logKeyValue("Phase", logBuf);
    }
    _state.encounterPaused = paused;
    syncCooldown();
}

void EncounterPhaseTracker::setSecondaryZonePaused(bool paused, const char* reason) {
    if (_state.secondaryZonePaused != paused) {
        char logBuf[MAX_LOG_LENGTH];
        snprintf(logBuf, sizeof(logBuf), ">>> ROOM CHANGE: %s (%s)", paused ? "BETWEEN ROOMS" : "IN ROOM", reason);
        logKeyValue("Phase", logBuf);
    }
    _state.secondaryZonePaused = paused;
    syncCooldown();
}

void EncounterPhaseTracker::enterBossRoom(const char* reason) {
    _state.segmentEntryArmed = false;
    setSecondaryZonePaused(false, reason);
}

// =================================================================================
// SECTION: TEXT SIGNALS
// =================================================================================

bool EncounterPhaseTracker::applyTextSignal(const TextSignal& signal) {
    char reason[48];

    switch (signal.kind) {
    case SIG_WAVE_COMPLETED:
        snprintf(reason, sizeof(reason), "Wave %d completed", (int)signal.segment);
        setEncounterPaused(true, reason);
        return true;

    case SIG_WAVE_STARTED:
        snprintf(reason, sizeof(reason), "Wave %d started", (int)signal.segment);
        _regen.reseed(_regen.getMaxRegenTicks());
        setEncounterPaused(false, reason);
        return true;

    case SIG_REWARD_CLAIMED:
        setEncounterPaused(false, "Rewards claimed");
        return true;

    case SIG_DELVE_COMPLETED:
        snprintf(reason, sizeof(reason), "Delve %d completed", (int)signal.segment);
        setEncounterPaused(true, reason);
        return true;

    case SIG_ROOM_COMPLETED:
        // A room message proves we are inside even if the status update was missed
        _state.encounterModeActive = true;
        _state.roomCheckPending = false;
        setSecondaryZonePaused(true, "Room completed");
        return true;

    case SIG_RUN_COMPLETED:
        setSecondaryZonePaused(false, "Run completed");
        return true;

    default:
        return false;
    }
}

// =================================================================================
// SECTION: ZONE / ENTITY / DIALOGUE INPUTS
// =================================================================================

void EncounterPhaseTracker::onLocationSample(const Location& location) {
    // Unknown position: keep the last known phase
    if (!location.valid || location.regionId == NO_REGION) return;

    const BossRoom* room = EncounterGrammars::findBossRoom(location.regionId);

    // 0. Entered the Theatre before the first sample: settle the boss-room check now
    if (_state.roomCheckPending) {
        _state.roomCheckPending = false;
        if (room != nullptr) {
            setSecondaryZonePaused(false, "Rejoined in boss room");
        }
    }

    // 1. New zone observed: re-arm, and enter immediately for region-only rooms
    if (location.regionId != _state.currentZoneId) {
        _state.segmentEntryArmed = true;

        if (_state.secondaryZonePaused && room != nullptr && room->strategy == ZONE_ENTRY_REGION) {
            char reason[48];
            snprintf(reason, sizeof(reason), "Entered %s", room->name);
            enterBossRoom(reason);
        }
        _state.currentZoneId = location.regionId;
    }

    // 2. Hallway rooms: wait for the barrier tiles
    if (_state.secondaryZonePaused && _state.segmentEntryArmed && room != nullptr
        && EncounterGrammars::isBarrierCrossed(*room, location.x, location.y)) {
        char reason[48];
        snprintf(reason, sizeof(reason), "Crossed %s barrier", room->name);
        enterBossRoom(reason);
    }
}

void EncounterPhaseTracker::onNpcSpawned(const char* name, int32_t npcId) {
    // Doom boss spawn resumes regen; the game's timer started 2 ticks earlier
    if (EncounterGrammars::isDoomSpawn(name)) {
        int32_t offset = (int32_t)_defaults.delveReseedOffset;
        _regen.reseed(_regen.getMaxRegenTicks() - offset);
        setEncounterPaused(false, "Doom spawned");
    }

    // Verzik fight start
    if (npcId == VERZIK_FIGHT_START_NPC_ID && _state.secondaryZonePaused && _state.segmentEntryArmed) {
        enterBossRoom("Verzik fight started");
    }
}

void EncounterPhaseTracker::onMenuOption(const char* option) {
    if (!_state.encounterModeActive) return;
    if (!_state.secondaryZonePaused || option == nullptr) return;

    // Barrier rooms: "Pass" then "Yes, let's begin."
    if (strstr(option, BARRIER_CONFIRM_OPTION) != nullptr) {
        setSecondaryZonePaused(false, "Barrier confirmed");
        return;
    }

    // Verzik: "Continue" after her opening dialogue
    if (strcmp(option, VERZIK_CONFIRM_OPTION) == 0 && _state.currentZoneId == TOB_VERZIK_REGION) {
        setSecondaryZonePaused(false, "Verzik dialogue");
    }
}

void EncounterPhaseTracker::onEncounterStatus(int32_t status) {
    bool inside = EncounterGrammars::isInsideStatus(status);
    if (inside == _state.encounterModeActive) return;

    _state.encounterModeActive = inside;
    _state.roomCheckPending = false;

    if (inside) {
        // Joining mid-raid inside a boss room must not pause the cooldown.
        // Right after login no zone is known yet; the first sample decides.
        if (_state.currentZoneId == NO_REGION) {
            _state.roomCheckPending = true;
            setSecondaryZonePaused(true, "Entered Theatre of Blood");
            return;
        }
        bool inBossRoom = EncounterGrammars::findBossRoom(_state.currentZoneId) != nullptr;
        setSecondaryZonePaused(!inBossRoom, "Entered Theatre of Blood");
    } else {
        setSecondaryZonePaused(false, "Left Theatre of Blood");
    }
}
