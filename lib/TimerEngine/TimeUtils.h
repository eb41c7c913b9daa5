/*
 * =================================================================================
 * Project:   Special Attack Timers - Regen & Surge Cooldown Tracker
 * File:      lib/TimerEngine/TimeUtils.h
 *
 * Description:
 * Static utility class for turning timer state into display text.
 * Regen:    "12" (ticks), "8" (whole seconds, rounded up), "7.2s" (decimals).
 * Cooldown: "449" (ticks), "4:29" (m:ss), "4:29.4" (m:ss.s).
 * Also holds the visibility rules used by any front end.
 * =================================================================================
 */
#pragma once
#include <stddef.h>
#include <stdio.h>
#include <stdint.h>

#include "Types.h"

class TimeUtils {
public:
    /**
     * Formats the regen countdown.
     * A full cycle (ticks == cadence) is shown as 0, since the timer has just
     * been reset and nothing is counting yet.
     */
    static void formatRegen(int32_t ticksUntilRegen, int32_t maxTicks, DisplayFormat format,
                            char *buffer, size_t size) {
        int32_t displayTicks = ticksUntilRegen == maxTicks ? 0 : ticksUntilRegen;
        if (displayTicks < 0) displayTicks = 0;

        // One tick = 6 tenths of a second
        int32_t tenths = displayTicks * (TICK_DURATION_MS / 100);

        switch (format) {
        case FORMAT_SECONDS:
            // Round up so the number reaches 0 when the regen lands
            snprintf(buffer, size, "%d", (int)((tenths + 9) / 10));
            break;
        case FORMAT_DECIMALS:
            snprintf(buffer, size, "%d.%ds", (int)(tenths / 10), (int)(tenths % 10));
            break;
        case FORMAT_TICKS:
        default:
            snprintf(buffer, size, "%d", (int)displayTicks);
            break;
        }
    }

    /**
     * Formats the surge cooldown.
     * Whole seconds are truncated, matching how the game's own timers count down.
     * Tenths are rounded to the nearest.
     */
    static void formatCooldown(uint32_t remainingMs, DisplayFormat format, char *buffer, size_t size) {
        switch (format) {
        case FORMAT_SECONDS: {
            unsigned long totalSeconds = remainingMs / 1000;
            snprintf(buffer, size, "%lu:%02lu", totalSeconds / 60, totalSeconds % 60);
            break;
        }
        case FORMAT_DECIMALS: {
            unsigned long tenths = ((unsigned long)remainingMs + 50) / 100;
            unsigned long minutes = tenths / 600;
            unsigned long secTenths = tenths % 600;
            snprintf(buffer, size, "%lu:%02lu.%lu", minutes, secTenths / 10, secTenths % 10);
            break;
        }
        case FORMAT_TICKS:
        default:
            snprintf(buffer, size, "%lu", (unsigned long)(remainingMs / TICK_DURATION_MS));
            break;
        }
    }

    // Regen is hidden while spec is full or while the encounter is paused.
    static bool isRegenVisible(bool specFull, bool encounterPaused) {
        return !specFull && !encounterPaused;
    }

    static bool isCooldownVisible(uint32_t remainingMs) {
        return remainingMs > 0;
    }
};
