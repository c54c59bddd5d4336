#pragma once
/**
 * @file LogSinkRegistry.h
 * @brief Registry of log sinks.
 */
#include "Core/Services/ILogger.h"

/**
 * @brief Stores and enumerates registered log sinks.
 * Sinks are added during init and never removed.
 */
class LogSinkRegistry {
public:
    /** @brief Add a sink. Rejects sinks without a write callback or already present. */
    bool add(LogSinkService sink);
    int count() const;
    /** @brief Get sink by index (empty sink when out of range). */
    LogSinkService get(int idx) const;

private:
    static constexpr int MAX_SINKS = 3;
    LogSinkService sinks[MAX_SINKS]{};
    int n = 0;
};
