/*
 * =================================================================================
 * Project:   Special Attack Timers - Regen & Surge Cooldown Tracker
 * File:      include/Config.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Central configuration file. Defines application identity, log buffer sizes,
 * the default timing constants and the default display preferences.
 * =================================================================================
 */
#pragma once
#include "Types.h"

// --- Application Identity ---
#define APP_NAME "spec_timers_replay"
#define APP_VERSION "1.0.0"

// =================================================================================
// SECTION: LOGGING
// =================================================================================

#define LOG_BUFFER_SIZE 150   // RAM ring buffer lines
#define CONSOLE_QUEUE_SIZE 50 // Pending console lines
#define CONSOLE_DRAIN_BATCH 10

// =================================================================================
// SECTION: TIMING DEFAULTS
// =================================================================================

static const TimerDefaults DEFAULT_TIMER_DEFS = {
    SPEC_REGEN_TICKS,                       // regenTicks
    LIGHTBEARER_REGEN_TICKS,                // acceleratedRegenTicks
    MAX_SPEC_ENERGY,                        // maxEnergy
    RESTORE_GRACE_TICKS,                    // restoreGraceTicks
    DELVE_RESEED_OFFSET,                    // delveReseedOffset
    SURGE_COOLDOWN_TICKS * TICK_DURATION_MS // surgeCooldownMs (5 minutes)
};

// =================================================================================
// SECTION: DISPLAY DEFAULTS
// =================================================================================

static const DisplaySettings DEFAULT_DISPLAY_SETTINGS = {
    true,            // showInfoBox
    FORMAT_TICKS,    // displayFormat
    true,            // showCircularOverlay
    true,            // showSurgeInfoBox
    FORMAT_SECONDS,  // surgeDisplayFormat
    0xFFFFFFFF,      // activeColor (white)
    0x00FFFFFF,      // circleColor (cyan)
    0xFFFFFFFF,      // surgeColor (white)
    0xFFA500FF       // surgePausedColor (orange)
};
