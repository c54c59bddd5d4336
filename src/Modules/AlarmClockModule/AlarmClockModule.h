#pragma once
/**
 * @file AlarmClockModule.h
 * @brief Virtual alarm clocks: registry, timers, persistence, commands and events.
 */

#include "Core/Module.h"
#include "Core/NvsKeys.h"
#include "Core/SystemLimits.h"
#include "Core/Services/Services.h"
#include "Modules/AlarmClockModule/AlarmClockRegistry.h"

#include <freertos/semphr.h>

struct CommandRequest;

/**
 * @brief Active module hosting up to `Limits::AlarmClock::MaxClocks` alarm clocks.
 *
 * Locking: `registryMutex_` guards slot occupancy, `slotMutex_[i]` guards the
 * clock in slot i. Order is registry then slot. Commands and the timer tick
 * take the same slot lock, so a fire and a cancel never interleave.
 *
 * Persistence: each slot mirrors its clock into `alarmclock/cN` config
 * variables. State changes only mark the slot dirty; the module task writes
 * NVS. External config edits reach the clock through `ConfigChanged`.
 */
class AlarmClockModule : public Module {
public:
    const char* moduleId() const override { return "alarmclock"; }
    const char* taskName() const override { return "alarmclk"; }
    BaseType_t taskCore() const override { return 1; }
    uint16_t taskStackSize() const override { return 4096; }

    uint8_t dependencyCount() const override { return 3; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "eventbus";
        if (i == 2) return "cmd";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

private:
    static constexpr uint8_t kSlots = Limits::AlarmClock::MaxClocks;

    /** @brief Listener context: which slot a clock callback came from. */
    struct SlotCtx {
        AlarmClockModule* self = nullptr;
        uint8_t slot = 0;
    };

    enum class ClockOp : uint8_t { SetAlarm, Enable, Disable, Snooze, Stop, SnoozeMinutes };

    // Locks
    bool lockRegistry_();
    void unlockRegistry_();
    bool lockSlot_(uint8_t slot);
    void unlockSlot_(uint8_t slot);
    AlarmClock* acquireClock_(const char* id, AlarmClockHandle& handle, ErrorCode& err);
    void releaseClock_(const AlarmClockHandle& handle);

    // Operations shared by commands and the service
    bool addClock_(const char* name, char* outId, size_t outIdLen, ErrorCode& err);
    bool removeClock_(const char* id, ErrorCode& err);
    bool runOp_(const char* id, ClockOp op, const char* timeSpec, int32_t minutes, ErrorCode& err);
    bool buildState_(const char* id, char* out, size_t len, ErrorCode& err);
    bool buildList_(char* out, size_t len, ErrorCode& err);
    uint8_t listIds_(AlarmClockIdBuf* out, uint8_t max);

    // Task side
    void applySchedulerState_(bool online);
    void tickSlots_(time_t now);
    void flushDirty_();
    void syncPending_(time_t now);
    bool syncSlotFromConfig_(uint8_t slot, time_t now);
    bool syncSlotLocked_(uint8_t slot, time_t now, bool wanted,
                         const AlarmClockConfig& ccfg, const AlarmClockPersisted& saved);
    bool applyWhileRinging_(AlarmClock* clock, const AlarmClockPersisted& current,
                            const AlarmClockPersisted& saved, time_t now);
    void rearmSlots_(time_t now);
    bool readSlotConfig_(uint8_t slot, AlarmClockConfig& cfgOut, AlarmClockPersisted& savedOut) const;
    void writeSlotConfig_(uint8_t slot);
    void markDirty_(uint8_t slot);
    void markPending_(uint8_t slot);
    void clearPending_(uint8_t slot);
    uint32_t tickMs_() const;
    void applyTz_();

    // Clock listener trampolines
    static void onStateChanged_(void* ctx, const AlarmClockSnapshot& snap);
    static void onTriggered_(void* ctx, const char* id, time_t firedAt);
    static void onRejected_(void* ctx, const char* id, const char* op, ErrorCode code, const char* input);
    AlarmClockListener listenerFor_(uint8_t slot);

    static void onEventStatic_(const Event& e, void* user);
    void onConfigChanged_(const ConfigChangedPayload& p);
    static void onTzChanged_(void* ctx, const char& first);

    // Commands
    static bool cmdAdd_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdRemove_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdSet_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdSnooze_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdStop_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdEnable_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdDisable_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdSnoozeDuration_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdGet_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdList_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    bool handleCmdOp_(const CommandRequest& req, ClockOp op, const char* where, char* reply, size_t replyLen);
    bool replyClockState_(const char* id, const char* where, char* reply, size_t replyLen);

    // Service trampolines
    static bool svcAdd_(void* ctx, const char* name, char* outId, size_t outIdLen, ErrorCode* err);
    static bool svcRemove_(void* ctx, const char* id, ErrorCode* err);
    static bool svcSetAlarm_(void* ctx, const char* id, const char* timeSpec, ErrorCode* err);
    static bool svcEnable_(void* ctx, const char* id, ErrorCode* err);
    static bool svcDisable_(void* ctx, const char* id, ErrorCode* err);
    static bool svcSnooze_(void* ctx, const char* id, ErrorCode* err);
    static bool svcStop_(void* ctx, const char* id, ErrorCode* err);
    static bool svcSetSnoozeMinutes_(void* ctx, const char* id, int32_t minutes, ErrorCode* err);
    static bool svcBuildState_(void* ctx, const char* id, char* out, size_t len);
    static uint8_t svcListIds_(void* ctx, AlarmClockIdBuf* out, uint8_t max);

    AlarmClockService clockSvc_{
        svcAdd_,
        svcRemove_,
        svcSetAlarm_,
        svcEnable_,
        svcDisable_,
        svcSnooze_,
        svcStop_,
        svcSetSnoozeMinutes_,
        svcBuildState_,
        svcListIds_,
        this
    };

    ConfigStore* cfg_ = nullptr;
    const EventBusService* eventBus_ = nullptr;
    const CommandService* cmdSvc_ = nullptr;

    AlarmClockRegistry registry_;
    SemaphoreHandle_t registryMutex_ = nullptr;
    SemaphoreHandle_t slotMutex_[kSlots] = {nullptr};
    SlotCtx slotCtx_[kSlots]{};

    portMUX_TYPE flagsMux_ = portMUX_INITIALIZER_UNLOCKED;
    bool dirty_[kSlots] = {false};
    bool pending_[kSlots] = {false};
    volatile bool rearmPending_ = false;
    bool schedulerOnline_ = false;

    // Module config
    bool enabled_ = true;
    int32_t tickMsCfg_ = (int32_t)Limits::AlarmClock::DefaultTickMs;
    char tz_[Limits::AlarmClock::TzLen] = "UTC0";

    ConfigVariable<bool,0> enabledVar_{
        NVS_KEY(NvsKeys::AlarmClock::Enabled), "enabled", "alarmclock", ConfigType::Bool,
        &enabled_, ConfigPersistence::Persistent, 0
    };
    ConfigVariable<int32_t,0> tickMsVar_{
        NVS_KEY(NvsKeys::AlarmClock::TickMs), "tick_ms", "alarmclock", ConfigType::Int32,
        &tickMsCfg_, ConfigPersistence::Persistent, 0
    };
    ConfigVariable<char,1> tzVar_{
        NVS_KEY(NvsKeys::AlarmClock::Tz), "tz", "alarmclock", ConfigType::CharArray,
        tz_, ConfigPersistence::Persistent, sizeof(tz_)
    };

    // Per-slot persisted mirror
    char slotName_[kSlots][Limits::AlarmClock::NameLen] = {};
    char slotTime_[kSlots][Limits::AlarmClock::TimeTextLen] = {};
    bool slotActive_[kSlots] = {false};
    int32_t slotSnooze_[kSlots] = {
        Limits::AlarmClock::DefaultSnoozeMinutes, Limits::AlarmClock::DefaultSnoozeMinutes,
        Limits::AlarmClock::DefaultSnoozeMinutes, Limits::AlarmClock::DefaultSnoozeMinutes
    };

    ConfigVariable<char,0> slotNameVar_[kSlots]{
        {NVS_KEY(NvsKeys::AlarmClock::C0Name), "name", "alarmclock/c0", ConfigType::CharArray,
         slotName_[0], ConfigPersistence::Persistent, sizeof(slotName_[0])},
        {NVS_KEY(NvsKeys::AlarmClock::C1Name), "name", "alarmclock/c1", ConfigType::CharArray,
         slotName_[1], ConfigPersistence::Persistent, sizeof(slotName_[1])},
        {NVS_KEY(NvsKeys::AlarmClock::C2Name), "name", "alarmclock/c2", ConfigType::CharArray,
         slotName_[2], ConfigPersistence::Persistent, sizeof(slotName_[2])},
        {NVS_KEY(NvsKeys::AlarmClock::C3Name), "name", "alarmclock/c3", ConfigType::CharArray,
         slotName_[3], ConfigPersistence::Persistent, sizeof(slotName_[3])}
    };
    ConfigVariable<char,0> slotTimeVar_[kSlots]{
        {NVS_KEY(NvsKeys::AlarmClock::C0Time), "time", "alarmclock/c0", ConfigType::CharArray,
         slotTime_[0], ConfigPersistence::Persistent, sizeof(slotTime_[0])},
        {NVS_KEY(NvsKeys::AlarmClock::C1Time), "time", "alarmclock/c1", ConfigType::CharArray,
         slotTime_[1], ConfigPersistence::Persistent, sizeof(slotTime_[1])},
        {NVS_KEY(NvsKeys::AlarmClock::C2Time), "time", "alarmclock/c2", ConfigType::CharArray,
         slotTime_[2], ConfigPersistence::Persistent, sizeof(slotTime_[2])},
        {NVS_KEY(NvsKeys::AlarmClock::C3Time), "time", "alarmclock/c3", ConfigType::CharArray,
         slotTime_[3], ConfigPersistence::Persistent, sizeof(slotTime_[3])}
    };
    ConfigVariable<bool,0> slotActiveVar_[kSlots]{
        {NVS_KEY(NvsKeys::AlarmClock::C0Active), "active", "alarmclock/c0", ConfigType::Bool,
         &slotActive_[0], ConfigPersistence::Persistent, 0},
        {NVS_KEY(NvsKeys::AlarmClock::C1Active), "active", "alarmclock/c1", ConfigType::Bool,
         &slotActive_[1], ConfigPersistence::Persistent, 0},
        {NVS_KEY(NvsKeys::AlarmClock::C2Active), "active", "alarmclock/c2", ConfigType::Bool,
         &slotActive_[2], ConfigPersistence::Persistent, 0},
        {NVS_KEY(NvsKeys::AlarmClock::C3Active), "active", "alarmclock/c3", ConfigType::Bool,
         &slotActive_[3], ConfigPersistence::Persistent, 0}
    };
    ConfigVariable<int32_t,0> slotSnoozeVar_[kSlots]{
        {NVS_KEY(NvsKeys::AlarmClock::C0Snooze), "snooze_min", "alarmclock/c0", ConfigType::Int32,
         &slotSnooze_[0], ConfigPersistence::Persistent, 0},
        {NVS_KEY(NvsKeys::AlarmClock::C1Snooze), "snooze_min", "alarmclock/c1", ConfigType::Int32,
         &slotSnooze_[1], ConfigPersistence::Persistent, 0},
        {NVS_KEY(NvsKeys::AlarmClock::C2Snooze), "snooze_min", "alarmclock/c2", ConfigType::Int32,
         &slotSnooze_[2], ConfigPersistence::Persistent, 0},
        {NVS_KEY(NvsKeys::AlarmClock::C3Snooze), "snooze_min", "alarmclock/c3", ConfigType::Int32,
         &slotSnooze_[3], ConfigPersistence::Persistent, 0}
    };
};
