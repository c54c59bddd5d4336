#pragma once
/**
 * @file SerialCommandModule.h
 * @brief Line based command console on the USB serial port.
 */
#include "Core/Module.h"
#include "Core/ErrorCodes.h"
#include "Core/SystemLimits.h"
#include "Core/Services/Services.h"

/**
 * @brief Reads commands from `Serial` and runs them through the command service.
 *
 * Accepted lines:
 * - `{"cmd":"alarmclock.set","args":{"id":"bedroom","time":"07:00"}}`
 * - `alarmclock.set {"id":"bedroom","time":"07:00"}`
 * - `help`
 *
 * Each line gets exactly one JSON reply line.
 */
class SerialCommandModule : public Module {
public:
    const char* moduleId() const override { return "serialcmd"; }
    const char* taskName() const override { return "serialcmd"; }
    uint16_t taskStackSize() const override { return 4096; }

    uint8_t dependencyCount() const override { return 2; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "cmd";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

private:
    void handleLine_(char* line);
    void runJsonLine_(const char* line);
    void runTextLine_(char* line);
    void runCommand_(const char* cmd, const char* json, const char* args);
    void printHelp_();
    void printError_(ErrorCode code, const char* where);

    const CommandService* cmdSvc_ = nullptr;

    char line_[Limits::Console::LineBuf] = {0};
    size_t lineLen_ = 0;
    bool overflow_ = false;
    char reply_[Limits::Console::Reply] = {0};
};
