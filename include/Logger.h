/*
 * =================================================================================
 * Project:   Special Attack Timers - Regen & Surge Cooldown Tracker
 * File:      Logger.h / Logger.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Logging system. Keeps a ring buffer of recent lines in memory and a console
 * queue that the main loop drains to stdout.
 * =================================================================================
 */
#ifndef LOGGER_H
#define LOGGER_H

// =================================================================================
// SECTION: LOGGING CONSTANTS & MACROS
// =================================================================================
#define LOG_SEP_MAJOR "=========================================================================="
#define LOG_SEP_MINOR "--------------------------------------------------------------------------"

// =================================================================================
// SECTION: CORE LOGGING FUNCTIONS
// =================================================================================
void logMessage(const char *message);
int processLogQueue();

// Oldest-first access to the ring buffer (index 0 = oldest kept line).
int getLogLineCount();
const char *getLogLine(int index);
void clearLogs();

#endif
