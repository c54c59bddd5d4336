/**
 * @file LogHub.cpp
 * @brief Implementation file.
 */
#include "Core/LogHub.h"

bool LogHub::init(uint8_t queueLen) {
    if (q) return true;
    q = xQueueCreate(queueLen, sizeof(LogEntry));
    return q != nullptr;
}

bool LogHub::enqueue(const LogEntry& e) {
    if (!q) return false;
    if (xQueueSend(q, &e, 0) == pdTRUE) return true;

    portENTER_CRITICAL(&droppedMux);
    ++dropped;
    portEXIT_CRITICAL(&droppedMux);
    return false;
}

bool LogHub::dequeue(LogEntry& out, TickType_t waitTicks) {
    if (!q) return false;
    return xQueueReceive(q, &out, waitTicks) == pdTRUE;
}

uint32_t LogHub::takeDropped() {
    portENTER_CRITICAL(&droppedMux);
    uint32_t n = dropped;
    dropped = 0;
    portEXIT_CRITICAL(&droppedMux);
    return n;
}
