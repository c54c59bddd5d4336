/**
 * @file EventBusModule.cpp
 * @brief Implementation file.
 */
#include "EventBusModule.h"
#define LOG_TAG "EvtBusMd"
#include "Core/ModuleLog.h"

bool EventBusModule::svcPost_(void* ctx, EventId id, const void* payload, size_t len) {
    EventBus* bus = static_cast<EventBus*>(ctx);
    return bus ? bus->post(id, payload, len) : false;
}

bool EventBusModule::svcSubscribe_(void* ctx, EventId id, EventCallback cb, void* user) {
    EventBus* bus = static_cast<EventBus*>(ctx);
    return bus ? bus->subscribe(id, cb, user) : false;
}

void EventBusModule::init(ConfigStore&, ServiceRegistry& services) {
    if (!_bus.init()) {
        LOGE("event queue allocation failed");
        return;
    }
    if (!services.add("eventbus", &_svc)) {
        LOGE("EventBusService registration failed");
        return;
    }
    LOGI("EventBusService registered");

    /// Queued now, delivered once the dispatch task runs.
    (void)_bus.post(EventId::SystemStarted, nullptr, 0);
}

void EventBusModule::loop() {
    const uint16_t taken = _bus.dispatch(Limits::EventBus::DispatchBatch);

    const uint32_t drops = _bus.droppedCount();
    if (drops != _reportedDrops) {
        LOGW("event queue full, %lu posts dropped so far", (unsigned long)drops);
        _reportedDrops = drops;
    }
    // A full batch means more may be waiting.
    if (taken < Limits::EventBus::DispatchBatch) vTaskDelay(pdMS_TO_TICKS(5));
}
