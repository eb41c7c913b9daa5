#include "Logger.h"
#include "Config.h"
#include <stdio.h>
#include <string.h>

// --- Logging System ---
// Ring buffer for storing logs in memory.
static char logBuffer[LOG_BUFFER_SIZE][MAX_LOG_LENGTH];
static int logBufferIndex = 0;
static bool logBufferFull = false;

// Console Log Queue
static char consoleLogQueue[CONSOLE_QUEUE_SIZE][MAX_LOG_LENGTH];
static int consoleQueueHead = 0;
static int consoleQueueTail = 0;

/**
 * Adds a message to the in-memory log buffer and pushes it to the console
 * queue. No console IO in this function.
 */
void logMessage(const char *message) {
  // Update RAM ring buffer
  snprintf(logBuffer[logBufferIndex], MAX_LOG_LENGTH, "%s", message);
  logBufferIndex++;
  if (logBufferIndex >= LOG_BUFFER_SIZE) {
    logBufferIndex = 0;
    logBufferFull = true;
  }

  // Push to Console Queue
  int nextHead = (consoleQueueHead + 1) % CONSOLE_QUEUE_SIZE;

  if (nextHead != consoleQueueTail) {
    snprintf(consoleLogQueue[consoleQueueHead], MAX_LOG_LENGTH, "%s", message);
    consoleQueueHead = nextHead;
  } else {
    // Queue full: the line is still kept in the ring buffer
  }
}

/**
 * Called in main loop to drain the console queue.
 * Drains up to CONSOLE_DRAIN_BATCH messages per call. Returns lines printed.
 */
int processLogQueue() {
  int printed = 0;

  while (printed < CONSOLE_DRAIN_BATCH && consoleQueueHead != consoleQueueTail) {
    puts(consoleLogQueue[consoleQueueTail]);
    consoleQueueTail = (consoleQueueTail + 1) % CONSOLE_QUEUE_SIZE;
    printed++;
  }

  if (printed > 0) fflush(stdout);
  return printed;
}

int getLogLineCount() { return logBufferFull ? LOG_BUFFER_SIZE : logBufferIndex; }

const char *getLogLine(int index) {
  int count = getLogLineCount();
  if (index < 0 || index >= count) return "";

  int start = logBufferFull ? logBufferIndex : 0;
  return logBuffer[(start + index) % LOG_BUFFER_SIZE];
}

void clearLogs() {
  logBufferIndex = 0;
  logBufferFull = false;
  consoleQueueHead = 0;
  consoleQueueTail = 0;
  for (int i = 0; i < LOG_BUFFER_SIZE; i++)
    logBuffer[i][0] = '\0';
}
