/**
 * @file SerialCommandModule.cpp
 * @brief Implementation file.
 */
#include "SerialCommandModule.h"
#include "Core/ErrorCodes.h"
#include <Arduino.h>
#include <ArduinoJson.h>
#include <string.h>

#define LOG_TAG "SerialCmd"
#include "Core/ModuleLog.h"

static char* trim_(char* s)
{
    while (*s == ' ' || *s == '\t') ++s;
    size_t n = strlen(s);
    while (n > 0 && (s[n - 1] == ' ' || s[n - 1] == '\t' || s[n - 1] == '\r')) s[--n] = '\0';
    return s;
}

void SerialCommandModule::init(ConfigStore&, ServiceRegistry& services)
{
    cmdSvc_ = services.get<CommandService>("cmd");
    if (!cmdSvc_ || !cmdSvc_->execute) {
        LOGE("command service missing, console disabled");
        return;
    }
    LOGI("console ready, type help");
}

void SerialCommandModule::loop()
{
    while (Serial.available() > 0) {
        const int c = Serial.read();
        if (c < 0) break;

        if (c == '\n') {
            line_[lineLen_] = '\0';
            if (overflow_) {
                printError_(ErrorCode::ArgsTooLarge, "console");
            } else {
                handleLine_(line_);
            }
            lineLen_ = 0;
            overflow_ = false;
            continue;
        }
        if (c == '\r') continue;
        if (c == 8 || c == 127) {
            if (lineLen_ > 0) --lineLen_;
            continue;
        }
        if (lineLen_ + 1 >= sizeof(line_)) {
            overflow_ = true;
            continue;
        }
        line_[lineLen_++] = (char)c;
    }

    vTaskDelay(pdMS_TO_TICKS(Limits::Console::PollDelayMs));
}

void SerialCommandModule::handleLine_(char* line)
{
    char* s = trim_(line);
    if (s[0] == '\0') return;

    if (!cmdSvc_ || !cmdSvc_->execute) {
        printError_(ErrorCode::CmdServiceUnavailable, "console");
        return;
    }
    if (s[0] == '{') {
        runJsonLine_(s);
        return;
    }
    if (strcmp(s, "help") == 0 || strcmp(s, "?") == 0) {
        printHelp_();
        return;
    }
    runTextLine_(s);
}

void SerialCommandModule::runJsonLine_(const char* line)
{
    static constexpr size_t CMD_DOC_CAPACITY = Limits::JsonCmdBuf;
    static StaticJsonDocument<CMD_DOC_CAPACITY> doc;
    doc.clear();

    const DeserializationError err = deserializeJson(doc, line);
    if (err || !doc.is<JsonObjectConst>()) {
        LOGW("bad cmd json (%s)", err.c_str());
        printError_(ErrorCode::BadCmdJson, "console");
        return;
    }

    JsonObjectConst root = doc.as<JsonObjectConst>();
    const char* cmdVal = root["cmd"] | (const char*)nullptr;
    if (!cmdVal || cmdVal[0] == '\0') {
        printError_(ErrorCode::MissingCmd, "console");
        return;
    }

    char cmd[Limits::Console::CmdName];
    size_t clen = strlen(cmdVal);
    if (clen >= sizeof(cmd)) clen = sizeof(cmd) - 1;
    memcpy(cmd, cmdVal, clen);
    cmd[clen] = '\0';

    const char* argsJson = nullptr;
    char argsBuf[Limits::Console::CmdArgs] = {0};
    JsonVariantConst argsVar = root["args"];
    if (!argsVar.isNull()) {
        const size_t written = serializeJson(argsVar, argsBuf, sizeof(argsBuf));
        if (written == 0 || written >= sizeof(argsBuf)) {
            LOGW("args too large (cmd=%s)", cmd);
            printError_(ErrorCode::ArgsTooLarge, "console");
            return;
        }
        argsJson = argsBuf;
    }

    runCommand_(cmd, line, argsJson);
}

void SerialCommandModule::runTextLine_(char* line)
{
    char* args = line;
    while (*args != '\0' && *args != ' ' && *args != '\t') ++args;
    if (*args != '\0') {
        *args++ = '\0';
        args = trim_(args);
    }

    if (strlen(line) >= Limits::Console::CmdName) {
        printError_(ErrorCode::UnknownCmd, "console");
        return;
    }
    if (args[0] != '\0' && args[0] != '{') {
        printError_(ErrorCode::BadCmdJson, "console");
        return;
    }
    runCommand_(line, nullptr, args[0] != '\0' ? args : nullptr);
}

void SerialCommandModule::runCommand_(const char* cmd, const char* json, const char* args)
{
    reply_[0] = '\0';
    const bool ok = cmdSvc_->execute(cmdSvc_->ctx, cmd, json, args, reply_, sizeof(reply_));
    if (!ok) LOGD("%s failed", cmd);
    if (reply_[0] == '\0') {
        printError_(ok ? ErrorCode::Failed : ErrorCode::CmdHandlerFailed, cmd);
        return;
    }
    Serial.println(reply_);
}

void SerialCommandModule::printHelp_()
{
    const char* names[24] = {nullptr};
    const uint8_t n = cmdSvc_->list ? cmdSvc_->list(cmdSvc_->ctx, names, 24) : 0;

    size_t pos = 0;
    int wrote = snprintf(reply_, sizeof(reply_), "{\"ok\":true,\"commands\":[");
    if (wrote <= 0 || (size_t)wrote >= sizeof(reply_)) return;
    pos = (size_t)wrote;
    for (uint8_t i = 0; i < n; ++i) {
        wrote = snprintf(reply_ + pos, sizeof(reply_) - pos, "%s\"%s\"", i ? "," : "", names[i]);
        if (wrote <= 0 || (size_t)wrote >= sizeof(reply_) - pos) {
            printError_(ErrorCode::CfgTruncated, "help");
            return;
        }
        pos += (size_t)wrote;
    }
    wrote = snprintf(reply_ + pos, sizeof(reply_) - pos, "]}");
    if (wrote <= 0 || (size_t)wrote >= sizeof(reply_) - pos) {
        printError_(ErrorCode::CfgTruncated, "help");
        return;
    }
    Serial.println(reply_);
}

void SerialCommandModule::printError_(ErrorCode code, const char* where)
{
    char buf[160];
    if (!writeErrorJson(buf, sizeof(buf), code, where)) {
        Serial.println("{\"ok\":false}");
        return;
    }
    Serial.println(buf);
}
