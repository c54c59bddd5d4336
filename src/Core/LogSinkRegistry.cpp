/**
 * @file LogSinkRegistry.cpp
 * @brief Implementation file.
 */
#include "Core/LogSinkRegistry.h"

bool LogSinkRegistry::add(LogSinkService sink) {
    if (!sink.write) return false;
    for (int i = 0; i < n; ++i) {
        if (sinks[i].write == sink.write && sinks[i].ctx == sink.ctx) return false;
    }
    if (n >= MAX_SINKS) return false;
    sinks[n++] = sink;
    return true;
}

int LogSinkRegistry::count() const {
    return n;
}

LogSinkService LogSinkRegistry::get(int idx) const {
    if (idx < 0 || idx >= n) return LogSinkService{};
    return sinks[idx];
}
