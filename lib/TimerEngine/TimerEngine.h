/*
 * =================================================================================
 * Project:   Special Attack Timers - Regen & Surge Cooldown Tracker
 * File:      lib/TimerEngine/TimerEngine.h
 *
 * Description:
 * Header for the TimerEngine class (signal ingestion).
 *
 * NOTES:
 * 1. Decoupled from the game client and the clock via ITimerHAL.
 * 2. All state lives in one SessionState owned by the engine.
 * 3. applyEvent() is the single entry point; events are applied in arrival
 *    order so a recorded stream replays deterministically.
 * =================================================================================
 */
#pragma once
#include "Types.h"
#include "TimerContext.h"
#include "RegenTimer.h"
#include "CooldownTimer.h"
#include "PhaseTracker.h"

class TimerEngine {
public:
    TimerEngine(ITimerHAL& hal, const TimerDefaults& defaults);

    // --- Event Reducer ---
    EventResult applyEvent(const TimerEvent& event);

    // Discards all timer and phase state. Idempotent.
    void resetSession();

    // --- State Accessors (Read-Only) ---
    bool isLoggedIn() const { return _session.loggedIn; }

    int32_t getTicksUntilRegen() const { return _regen.getTicksUntilRegen(); }
    int32_t getMaxRegenTicks() const { return _regen.getMaxRegenTicks(); }
    double getSecondsUntilRegen() const { return _regen.getSecondsUntilRegen(); }
    double getRegenProgress() const;
    bool isAccelerated() const { return _regen.isAccelerated(); }
    bool isSpecFull() const { return _regen.isSpecFull(); }
    int32_t getSpecPercent() const;

    bool isEncounterPaused() const { return _phase.isEncounterPaused(); }
    bool isSecondaryZonePaused() const { return _phase.isSecondaryZonePaused(); }

    uint32_t getCooldownRemainingMs() const { return _cooldown.remainingMs(); }
    uint32_t getCooldownTicks() const { return _cooldown.remainingTicks(); }
    bool isCooldownPaused() const { return _cooldown.isPaused(); }
    bool isCooldownActive() const { return _cooldown.isActive(); }

    void printStartupDiagnostics();
    bool validateDefaults(const TimerDefaults& defaults) const;

private:
    // --- Dependencies ---
    ITimerHAL& _hal;

    // --- Configuration ---
    TimerDefaults _defaults;

    // --- Dynamic State ---
    SessionState _session;

    // --- Components (operate on _session) ---
    RegenTimer _regen;
    CooldownTimer _cooldown;
    EncounterPhaseTracker _phase;

    // =========================================================================
    // SECTION: EVENT HANDLERS
    // =========================================================================

    EventResult handleSessionStart(const TimerEvent& event);
    EventResult handleSessionEnd();
    EventResult handleTick(const TimerEvent& event);
    EventResult handleChatMessage(const TimerEvent& event);
    EventResult handleEquipmentChanged(const TimerEvent& event);

    void logKeyValue(const char* key, const char* value);
};
