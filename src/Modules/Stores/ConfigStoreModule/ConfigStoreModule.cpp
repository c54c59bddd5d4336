/**
 * @file ConfigStoreModule.cpp
 * @brief Implementation file.
 */
#include "ConfigStoreModule.h"
#include "Core/CommandRegistry.h"
#include "Core/ErrorCodes.h"
#include <ArduinoJson.h>
#include <string.h>
#define LOG_TAG "CfgModul"
#include "Core/ModuleLog.h"

bool ConfigStoreModule::svcApplyJson(void* ctx, const char* json) {
    return ((ConfigStore*)ctx)->applyJson(json);
}

bool ConfigStoreModule::svcToJsonModule(void* ctx, const char* module, char* out, size_t outLen, bool* truncated) {
    return ((ConfigStore*)ctx)->toJsonModule(module, out, outLen, truncated);
}

uint8_t ConfigStoreModule::svcListModules(void* ctx, const char** out, uint8_t max) {
    return ((ConfigStore*)ctx)->listModules(out, max);
}

bool ConfigStoreModule::cmdGet_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen) {
    ConfigStoreModule* self = static_cast<ConfigStoreModule*>(userCtx);

    const char* module = nullptr;
    StaticJsonDocument<128> doc;
    if (req.args && req.args[0] != '\0') {
        if (deserializeJson(doc, req.args) || !doc.is<JsonObjectConst>()) {
            writeErrorJson(reply, replyLen, ErrorCode::BadCmdJson, "config.get");
            return false;
        }
        module = doc["module"] | (const char*)nullptr;
    }

    if (!module) {
        /// no module: list what exists
        const char* mods[12];
        const uint8_t n = self->store->listModules(mods, 12);
        size_t pos = 0;
        int w = snprintf(reply, replyLen, "{\"ok\":true,\"modules\":[");
        if (w <= 0 || (size_t)w >= replyLen) return false;
        pos = (size_t)w;
        for (uint8_t i = 0; i < n; ++i) {
            w = snprintf(reply + pos, replyLen - pos, "%s\"%s\"", i ? "," : "", mods[i]);
            if (w <= 0 || (size_t)w >= replyLen - pos) {
                writeErrorJson(reply, replyLen, ErrorCode::CfgTruncated, "config.get");
                return false;
            }
            pos += (size_t)w;
        }
        w = snprintf(reply + pos, replyLen - pos, "]}");
        return w > 0 && (size_t)w < replyLen - pos;
    }

    char body[Limits::JsonCmdBuf];
    bool truncated = false;
    if (!self->store->toJsonModule(module, body, sizeof(body), &truncated)) {
        writeErrorJsonWithInput(reply, replyLen,
                                truncated ? ErrorCode::CfgTruncated : ErrorCode::NotFound,
                                "config.get", module);
        return false;
    }
    const int w = snprintf(reply, replyLen, "{\"ok\":true,\"module\":\"%s\",\"cfg\":%s}", module, body);
    if (w <= 0 || (size_t)w >= replyLen) {
        writeErrorJson(reply, replyLen, ErrorCode::CfgTruncated, "config.get");
        return false;
    }
    return true;
}

bool ConfigStoreModule::cmdSet_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen) {
    ConfigStoreModule* self = static_cast<ConfigStoreModule*>(userCtx);
    if (!req.args || req.args[0] == '\0') {
        writeErrorJson(reply, replyLen, ErrorCode::MissingArgs, "config.set");
        return false;
    }
    if (!self->store->applyJson(req.args)) {
        writeErrorJson(reply, replyLen, ErrorCode::Failed, "config.set");
        return false;
    }
    snprintf(reply, replyLen, "{\"ok\":true}");
    return true;
}

void ConfigStoreModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    store = &cfg;

    svc.applyJson = svcApplyJson;
    svc.toJsonModule = svcToJsonModule;
    svc.listModules = svcListModules;
    svc.ctx = store;
    if (!services.add("config", &svc)) {
        LOGE("ConfigStoreService registration failed");
        return;
    }

    const CommandService* cmd = services.get<CommandService>("cmd");
    if (!cmd || !cmd->registerHandler) {
        LOGW("command service missing, config commands not registered");
        return;
    }
    if (!cmd->registerHandler(cmd->ctx, "config.get", cmdGet_, this) ||
        !cmd->registerHandler(cmd->ctx, "config.set", cmdSet_, this)) {
        LOGW("config commands registration failed");
    }
    LOGI("ConfigStoreService registered");
}
