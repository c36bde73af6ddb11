#include "Logger.h"

#include <stdio.h>
#include <string.h>
#include <mutex>

// --- Logging System ---
static const int MAX_LOG_ENTRY_LENGTH = 192;

// Output Queue (To prevent stderr writes inside the lock)
const int OUTPUT_QUEUE_SIZE = 256;
static char outputLogQueue[OUTPUT_QUEUE_SIZE][MAX_LOG_ENTRY_LENGTH];
static int outputQueueHead = 0;
static int outputQueueTail = 0;
static unsigned long droppedLines = 0;

static std::mutex logMutex;

/**
 * Thread-safe logging. NO OUTPUT IO IN THIS FUNCTION.
 * Pushes to the output queue; drops the line if the queue is full.
 */
void logMessage(const char *message) {
  std::lock_guard<std::mutex> lock(logMutex);

  int nextHead = (outputQueueHead + 1) % OUTPUT_QUEUE_SIZE;
  if (nextHead != outputQueueTail) {
    snprintf(outputLogQueue[outputQueueHead], MAX_LOG_ENTRY_LENGTH, "%s", message);
    outputQueueHead = nextHead;
  } else {
    droppedLines++;
  }
}

void logKeyValue(const char *key, const char *value) {
  char tempBuf[MAX_LOG_ENTRY_LENGTH];
  snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
  logMessage(tempBuf);
}

static void drainLogQueue(int maxLinesToProcess);

/**
 * Called in main loop to drain the log queue to stderr.
 * Drains up to 32 messages per call.
 */
void processLogQueue() { drainLogQueue(32); }

void flushLogQueue() { drainLogQueue(OUTPUT_QUEUE_SIZE); }

static void drainLogQueue(int maxLinesToProcess) {
  while (maxLinesToProcess > 0) {
    char msgCopy[MAX_LOG_ENTRY_LENGTH];
    bool hasMessage = false;
    unsigned long dropped = 0;

    // 1. Quick lock to pop a message
    {
      std::lock_guard<std::mutex> lock(logMutex);
      if (outputQueueHead != outputQueueTail) {
        strncpy(msgCopy, outputLogQueue[outputQueueTail], MAX_LOG_ENTRY_LENGTH);
        msgCopy[MAX_LOG_ENTRY_LENGTH - 1] = '\0';
        outputQueueTail = (outputQueueTail + 1) % OUTPUT_QUEUE_SIZE;
        hasMessage = true;
      }
      dropped = droppedLines;
      droppedLines = 0;
    }

    // 2. Print OUTSIDE the lock
    if (dropped > 0) fprintf(stderr, "[log] %lu lines dropped\n", dropped);
    if (!hasMessage) break;

    fprintf(stderr, "%s\n", msgCopy);
    maxLinesToProcess--;
  }
  fflush(stderr);
}
