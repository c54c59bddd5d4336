/**
 * @file EventBus.cpp
 * @brief Implementation file.
 */
#include "EventBus.h"
#include <string.h>
#include "Core/Log.h"

#define LOG_TAG_CORE "EventBus"

bool EventBus::init() {
    if (_queue) return true;
    _queue = xQueueCreate(Limits::EventBus::QueueLen, sizeof(Item));
    return _queue != nullptr;
}

bool EventBus::subscribe(EventId id, EventCallback cb, void* user) {
    if (!cb) return false;
    for (uint8_t i = 0; i < _subCount; ++i) {
        const Subscriber& s = _subs[i];
        if (s.id == id && s.cb == cb && s.user == user) return true;
    }
    if (_subCount >= Limits::EventBus::MaxSubscribers) {
        Log::error(LOG_TAG_CORE, "no room for subscriber (event=%u)", (unsigned)id);
        return false;
    }
    _subs[_subCount++] = Subscriber{id, cb, user};
    return true;
}

bool EventBus::post(EventId id, const void* payload, size_t len) {
    if (!_queue || len > Limits::EventBus::MaxPayload) return false;

    Item item;
    item.id = id;
    item.len = payload ? (uint8_t)len : 0;
    if (item.len > 0) memcpy(item.data, payload, item.len);

    if (xQueueSend(_queue, &item, 0) == pdTRUE) return true;

    portENTER_CRITICAL(&_dropMux);
    ++_dropped;
    portEXIT_CRITICAL(&_dropMux);
    return false;
}

uint16_t EventBus::dispatch(uint16_t maxEvents) {
    if (!_queue) return 0;

    uint16_t taken = 0;
    Item item;
    while (taken < maxEvents && xQueueReceive(_queue, &item, 0) == pdTRUE) {
        deliver(item);
        ++taken;
    }
    return taken;
}

void EventBus::deliver(const Item& item) {
    Event e{item.id, item.len ? item.data : nullptr, item.len};
    for (uint8_t i = 0; i < _subCount; ++i) {
        if (_subs[i].id == item.id) _subs[i].cb(e, _subs[i].user);
    }
}
