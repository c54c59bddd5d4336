#pragma once
/**
 * @file LogHub.h
 * @brief Central log queue for asynchronous logging.
 */
#include "Core/Services/ILogger.h"
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>

/**
 * @brief Queue-based log hub for producers and consumers.
 * Producers never block; overflow is counted and reported by the dispatcher.
 */
class LogHub {
public:
    /** @brief Create the log queue. */
    bool init(uint8_t queueLen);

    /** @brief Enqueue a log entry (non-blocking). */
    bool enqueue(const LogEntry& e);
    /** @brief Dequeue a log entry (blocking up to waitTicks). */
    bool dequeue(LogEntry& out, TickType_t waitTicks);

    /** @brief Return and reset the overflow counter. */
    uint32_t takeDropped();

private:
    QueueHandle_t q = nullptr;
    uint32_t dropped = 0;
    portMUX_TYPE droppedMux = portMUX_INITIALIZER_UNLOCKED;
};
