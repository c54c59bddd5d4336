#pragma once
/**
 * @file IEventBus.h
 * @brief Event bus service interface.
 */
#include <stddef.h>

#include "Core/EventBus/EventBus.h"

/** @brief Post/subscribe access to the shared event queue. */
struct EventBusService {
    bool (*post)(void* ctx, EventId id, const void* payload, size_t len);
    /// Init time only, like `EventBus::subscribe`.
    bool (*subscribe)(void* ctx, EventId id, EventCallback cb, void* user);
    void* ctx;
};
