/*
 * File: test/MockTimerHAL.h
 * Description: A "Spy" implementation of the HAL for Native Unit Tests.
 */
#pragma once
#include "TimerContext.h"
#include <string>
#include <vector>
#include <stdio.h>
#include <cstring>

class MockTimerHAL : public ITimerHAL {
public:
    // Simulation Variables
    unsigned long currentMillis = 1000;
    std::vector<std::string> logs;

    // --- Helpers for Test Control ---

    void advanceTime(unsigned long ms) {
        currentMillis += ms;
    }

    // Advances the clock by whole game ticks (600 ms each).
    void advanceTicks(unsigned long ticks) {
        currentMillis += ticks * TICK_DURATION_MS;
    }

    bool hasLogContaining(const char* fragment) const {
        for (size_t i = 0; i < logs.size(); i++) {
            if (logs[i].find(fragment) != std::string::npos) return true;
        }
        return false;
    }

    // --- ITimerHAL Implementation ---

    void log(const char* message) override {
        logs.push_back(std::string(message));
    }

    unsigned long getMillis() override {
        return currentMillis;
    }
};
