/*
 * =================================================================================
 * Project:   Special Attack Timers - Regen & Surge Cooldown Tracker
 * File:      lib/TimerEngine/TimerEngine.cpp
 *
 * Description:
 * Signal ingestion.
 * - Classifies each inbound event and routes it to the regen timer, the
 *   phase tracker and the surge cooldown.
 * - Ignores gameplay events while logged out.
 * - Resets everything on session end (logout / hop).
 * =================================================================================
 */
#include <stdio.h>
#include <string.h>

#include "TimerEngine.h"
#include "EncounterGrammars.h"
#include "LogicUtils.h"

// =================================================================================
// SECTION: CONSTRUCTOR & INIT
// =================================================================================

TimerEngine::TimerEngine(ITimerHAL& hal, const TimerDefaults& defaults)
    : _hal(hal),
      _defaults(defaults),
      _session(),
      _regen(_session.regen, _defaults),
      _cooldown(_session.cooldown, hal),
      _phase(_session.phase, _regen, _cooldown, hal, _defaults)
{
    _session.loggedIn = false;
    _session.lastTickIndex = NO_TICK;
}

// =================================================================================
// SECTION: INTERNAL HELPERS (Logging & Utils)
// =================================================================================

void TimerEngine::logKeyValue(const char *key, const char *value) {
    char tempBuf[MAX_LOG_LENGTH];
    // Format: " Key : Value"
    snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
    _hal.log(tempBuf);
}

/**
 * Validates the timing constants.
 * A cadence of 0 would make the countdown wrap forever, and an accelerated
 * cadence above the normal one would break the clamp on equip.
 */
bool TimerEngine::validateDefaults(const TimerDefaults& defaults) const {
    if (defaults.regenTicks == 0) return false;
    if (defaults.acceleratedRegenTicks == 0) return false;
    if (defaults.acceleratedRegenTicks > defaults.regenTicks) return false;
    if (defaults.maxEnergy == 0) return false;
    if (defaults.delveReseedOffset >= defaults.acceleratedRegenTicks) return false;
    if (defaults.surgeCooldownMs == 0) return false;
    return true;
}

double TimerEngine::getRegenProgress() const {
    int32_t cadence = _regen.getMaxRegenTicks();
    if (cadence <= 0) return 0.0;
    return 1.0 - ((double)_regen.getTicksUntilRegen() / cadence);
}

int32_t TimerEngine::getSpecPercent() const {
    int32_t energy = _session.regen.lastObservedEnergy;
    if (energy == NO_ENERGY) return 0;
    return energy * 100 / (int32_t)_defaults.maxEnergy;
}

void TimerEngine::printStartupDiagnostics() {
    char logBuf[MAX_LOG_LENGTH];
    const char* boolStr[] = { "NO", "YES" };

    _hal.log("==========================================================================");
    _hal.log("                         TIMER ENGINE DIAGNOSTICS                         ");
    _hal.log("==========================================================================");

    // -------------------------------------------------------------------------
    // SECTION: CONFIGURATION STATUS
    // -------------------------------------------------------------------------
    _hal.log("[ CONFIGURATION STATUS ]");

    bool configValid = validateDefaults(_defaults);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Self-Check", configValid ? "PASS" : "FAIL (INVALID DEFAULTS)");
    _hal.log(logBuf);

    if (!configValid) {
        _hal.log(" WARNING: Session starts will be rejected until the defaults are fixed.");
    }

    // -------------------------------------------------------------------------
    // SECTION: TIMING CONSTANTS
    // -------------------------------------------------------------------------
    _hal.log("");
    _hal.log("[ TIMING CONSTANTS ]");

    snprintf(logBuf, sizeof(logBuf), " %-25s : %u ticks", "Regen Cadence", _defaults.regenTicks);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u ticks", "Lightbearer Cadence", _defaults.acceleratedRegenTicks);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u", "Max Spec Energy", _defaults.maxEnergy);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u ticks", "Restore Grace Window", _defaults.restoreGraceTicks);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : -%u ticks", "Delve Reseed Offset", _defaults.delveReseedOffset);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u ms", "Surge Cooldown", _defaults.surgeCooldownMs);
    _hal.log(logBuf);

    // -------------------------------------------------------------------------
    // SECTION: CURRENT STATE
    // -------------------------------------------------------------------------
    _hal.log("");
    _hal.log("[ ENGINE STATE ]");

    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Logged In", boolStr[_session.loggedIn]);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %d / %d", "Ticks Until Regen",
             (int)_regen.getTicksUntilRegen(), (int)_regen.getMaxRegenTicks());
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Encounter Paused", boolStr[_phase.isEncounterPaused()]);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Between Rooms", boolStr[_phase.isSecondaryZonePaused()]);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u ms%s", "Surge Cooldown Left",
             _cooldown.remainingMs(), _cooldown.isPaused() ? " (PAUSED)" : "");
    _hal.log(logBuf);
}

// =================================================================================
// SECTION: SESSION LIFECYCLE
// =================================================================================

void TimerEngine::resetSession() {
    _regen.reset();
    _phase.reset();
    _cooldown.clear();
    _session.loggedIn = false;
    _session.lastTickIndex = NO_TICK;
}

EventResult TimerEngine::handleSessionStart(const TimerEvent& event) {
    if (!validateDefaults(_defaults)) {
        logKeyValue("Session", "Start Failed: Invalid timing defaults.");
        return EVENT_REJECTED;
    }

    // A repeated start (e.g. after a loading screen) only re-samples energy
    if (!_session.loggedIn) {
        resetSession();
        _session.loggedIn = true;
        logKeyValue("Session", ">>> STATE CHANGE: LOGGED_IN");
    }

    _regen.observeEnergy(event.specEnergy);
    return EVENT_APPLIED;
}

EventResult TimerEngine::handleSessionEnd() {
    if (_session.loggedIn) {
        logKeyValue("Session", ">>> STATE CHANGE: LOGGED_OUT (state discarded)");
    }
    resetSession();
    return EVENT_APPLIED;
}

// =================================================================================
// SECTION: GAMEPLAY SIGNALS
// =================================================================================

/**
 * Main per-tick logic.
 * Regen first (it reads the current pause state), then zone entry detection
 * for the position sampled on the same tick.
 */
EventResult TimerEngine::handleTick(const TimerEvent& event) {
    _session.lastTickIndex = event.tickIndex;

    bool regenDetected = _regen.onPeriodicTick(event.specEnergy, event.tickIndex, _phase.isEncounterPaused());
    if (regenDetected) {
        char logBuf[64];
        snprintf(logBuf, sizeof(logBuf), "Regen observed at tick %d. Re-synced.", (int)event.tickIndex);
        logKeyValue("Regen", logBuf);
    }

    _phase.onLocationSample(event.location);
    return EVENT_APPLIED;
}

EventResult TimerEngine::handleChatMessage(const TimerEvent& event) {
    // Wave/room announcements are GAME messages, surge messages are SPAM
    if (event.channel != CHAT_GAME && event.channel != CHAT_SPAM) {
        return EVENT_IGNORED;
    }

    char stripped[MAX_EVENT_TEXT + 1];
    LogicUtils::stripTags(event.text, stripped, sizeof(stripped));

    TextSignal signal;
    if (!EncounterGrammars::classify(stripped, signal)) {
        return EVENT_IGNORED;
    }

    // The restore may be reported before or after the tick that applied it.
    // Before the first tick of a session this is NO_TICK.
    int32_t tickIndex = event.tickIndex >= 0 ? event.tickIndex : _session.lastTickIndex;
    char logBuf[96];

    switch (signal.kind) {
    case SIG_SURGE_RESTORE:
        _regen.onExternalRestoreDetected(tickIndex, signal.expectedDelta);
        _cooldown.start(_defaults.surgeCooldownMs, _phase.isCooldownPauseRequired());
        snprintf(logBuf, sizeof(logBuf), "Surge potion at tick %d. Cooldown started%s.",
                 (int)tickIndex, _cooldown.isPaused() ? " (PAUSED)" : "");
        logKeyValue("Restore", logBuf);
        return EVENT_APPLIED;

    case SIG_DEATH_CHARGE_RESTORE:
        _regen.onExternalRestoreDetected(tickIndex, signal.expectedDelta);
        snprintf(logBuf, sizeof(logBuf), "Death Charge at tick %d.", (int)tickIndex);
        logKeyValue("Restore", logBuf);
        return EVENT_APPLIED;

    case SIG_COOLDOWN_EXPIRED:
        _cooldown.clear();
        logKeyValue("Restore", "Surge cooldown expired.");
        return EVENT_APPLIED;

    default:
        snprintf(logBuf, sizeof(logBuf), "Matched %s at tick %d.", signalKindToString(signal.kind), (int)tickIndex);
        logKeyValue("Chat", logBuf);
        return _phase.applyTextSignal(signal) ? EVENT_APPLIED : EVENT_IGNORED;
    }
}

EventResult TimerEngine::handleEquipmentChanged(const TimerEvent& event) {
    if (event.accelerated == _regen.isAccelerated()) {
        return EVENT_IGNORED;
    }

    _regen.onCadenceFlagChanged(event.accelerated);

    char logBuf[64];
    snprintf(logBuf, sizeof(logBuf), "Lightbearer %s. Cadence %d, %d ticks left.",
             event.accelerated ? "equipped" : "removed",
             (int)_regen.getMaxRegenTicks(), (int)_regen.getTicksUntilRegen());
    logKeyValue("Regen", logBuf);
    return EVENT_APPLIED;
}

// =================================================================================
// SECTION: DISPATCH
// =================================================================================

EventResult TimerEngine::applyEvent(const TimerEvent& event) {
    switch (event.type) {
    case EVT_SESSION_START:
        return handleSessionStart(event);
    case EVT_SESSION_END:
        return handleSessionEnd();
    default:
        break;
    }

    // Everything below needs a live session
    if (!_session.loggedIn) {
        return EVENT_IGNORED;
    }

    switch (event.type) {
    case EVT_TICK:
        return handleTick(event);

    case EVT_CHAT_MESSAGE:
        return handleChatMessage(event);

    case EVT_EQUIPMENT_CHANGED:
        return handleEquipmentChanged(event);

    case EVT_NPC_SPAWNED:
        _phase.onNpcSpawned(event.text, event.npcId);
        return EVENT_APPLIED;

    case EVT_MENU_OPTION:
        _phase.onMenuOption(event.text);
        return EVENT_APPLIED;

    case EVT_ENCOUNTER_STATUS:
        _phase.onEncounterStatus(event.status);
        return EVENT_APPLIED;

    default:
        logKeyValue("Session", "Rejected event with unknown type.");
        return EVENT_REJECTED;
    }
}
