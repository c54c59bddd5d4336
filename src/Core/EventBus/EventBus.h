#pragma once
/**
 * @file EventBus.h
 * @brief FreeRTOS queue carrying small events from any task to subscribers.
 */
#include <stdint.h>
#include <stddef.h>

#include "EventId.h"
#include "Core/SystemLimits.h"

#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"

struct Event {
    EventId id;
    const void* payload;  // valid for the duration of the callback only
    size_t len;
};

using EventCallback = void (*)(const Event& e, void* user);

/**
 * @brief Copying event queue with a fixed subscriber table.
 *
 * `post()` copies the payload and never blocks, so callers may hold their own
 * mutexes. Callbacks run on the task that calls `dispatch()`. Subscriptions
 * are taken during module init, before the dispatch task starts.
 */
class EventBus {
public:
    bool init();
    bool subscribe(EventId id, EventCallback cb, void* user);
    bool post(EventId id, const void* payload = nullptr, size_t len = 0);

    /** @brief Deliver up to `maxEvents` queued events. Returns how many were taken. */
    uint16_t dispatch(uint16_t maxEvents);

    /** @brief Posts lost to a full queue since boot. */
    uint32_t droppedCount() const { return _dropped; }

private:
    struct Item {
        EventId id;
        uint8_t len;
        uint8_t data[Limits::EventBus::MaxPayload];
    };

    struct Subscriber {
        EventId id;
        EventCallback cb;
        void* user;
    };

    void deliver(const Item& item);

    Subscriber _subs[Limits::EventBus::MaxSubscribers] = {};
    uint8_t _subCount = 0;

    QueueHandle_t _queue = nullptr;
    portMUX_TYPE _dropMux = portMUX_INITIALIZER_UNLOCKED;
    uint32_t _dropped = 0;
};
