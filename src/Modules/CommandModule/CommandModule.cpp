/**
 * @file CommandModule.cpp
 * @brief Implementation file.
 */
#include "CommandModule.h"
#define LOG_TAG "CmdModul"
#include "Core/ModuleLog.h"

bool CommandModule::svcRegister(void* ctx, const char* cmd, CommandHandler fn, void* userCtx) {
    return ((CommandRegistry*)ctx)->registerHandler(cmd, fn, userCtx);
}

bool CommandModule::svcExecute(void* ctx, const char* cmd, const char* json, const char* args,
                               char* reply, size_t replyLen) {
    return ((CommandRegistry*)ctx)->execute(cmd, json, args, reply, replyLen);
}

uint8_t CommandModule::svcList(void* ctx, const char** out, uint8_t max) {
    return ((const CommandRegistry*)ctx)->list(out, max);
}

void CommandModule::init(ConfigStore&, ServiceRegistry& services) {
    svc.registerHandler = svcRegister;
    svc.execute = svcExecute;
    svc.list = svcList;
    svc.ctx = &registry;
    if (!services.add("cmd", &svc)) {
        LOGE("CommandService registration failed");
        return;
    }
    LOGI("CommandService registered");
}
