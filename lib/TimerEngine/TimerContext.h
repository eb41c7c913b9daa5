/*
 * =================================================================================
 * File:      lib/TimerEngine/TimerContext.h
 * Description: Abstraction layer (HAL) for the wall clock and Logging.
 * =================================================================================
 */
#pragma once
#include "Types.h"

class ITimerHAL {
public:
    virtual ~ITimerHAL() {}

    // --- Logging ---
    virtual void log(const char* message) = 0;

    // --- Clock ---
    // Monotonic wall-clock milliseconds. Only the surge cooldown reads it;
    // regen timing is driven purely by tick events.
    virtual unsigned long getMillis() = 0;
};
