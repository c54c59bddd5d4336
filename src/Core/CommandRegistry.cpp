/**
 * @file CommandRegistry.cpp
 * @brief Implementation file.
 */
#include "CommandRegistry.h"
#include "Core/ErrorCodes.h"
#include "Core/Log.h"
#include "Core/SnprintfCheck.h"
#include <cstring>
#include <cstdio>
#define LOG_TAG_CORE "CmdRegst"
#undef snprintf
#define snprintf(OUT, LEN, FMT, ...) \
    WAKE_SNPRINTF_CHECKED(LOG_TAG_CORE, OUT, LEN, FMT, ##__VA_ARGS__)

static bool isJsonObjectReply_(const char* s, size_t len)
{
    if (!s || len == 0) return false;
    for (size_t i = 0; i < len; ++i) {
        const char c = s[i];
        if (c == '\0') return false;
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n') return c == '{';
    }
    return false;
}

static void writeFallback_(char* reply, size_t replyLen, ErrorCode code, const char* where)
{
    if (!reply || replyLen == 0) return;
    if (!writeErrorJson(reply, replyLen, code, where)) {
        snprintf(reply, replyLen, "{\"ok\":false}");
    }
}

bool CommandRegistry::registerHandler(const char* cmd, CommandHandler fn, void* userCtx) {
    if (!cmd || !fn || cmd[0] == '\0') return false;
    if (count >= MAX_COMMANDS) {
        Log::error(LOG_TAG_CORE, "command table full, dropped %s", cmd);
        return false;
    }

    for (uint8_t i = 0; i < count; ++i) {
        if (strcmp(entries[i].cmd, cmd) == 0) {
            Log::warn(LOG_TAG_CORE, "duplicate command %s", cmd);
            return false;
        }
    }

    entries[count++] = {cmd, fn, userCtx};
    return true;
}

bool CommandRegistry::execute(const char* cmd, const char* json, const char* args, char* reply, size_t replyLen) {
    if (reply && replyLen) reply[0] = '\0';
    if (!cmd || cmd[0] == '\0') {
        writeFallback_(reply, replyLen, ErrorCode::MissingCmd, "command");
        return false;
    }

    for (uint8_t i = 0; i < count; ++i) {
        if (strcmp(entries[i].cmd, cmd) != 0) continue;

        CommandRequest req{cmd, json, args};
        const bool ok = entries[i].fn(entries[i].userCtx, req, reply, replyLen);
        if (reply && replyLen && !isJsonObjectReply_(reply, replyLen)) {
            writeFallback_(reply, replyLen, ErrorCode::CmdHandlerFailed, "command.reply");
            return false;
        }
        return ok;
    }

    Log::debug(LOG_TAG_CORE, "unknown command %s", cmd);
    writeFallback_(reply, replyLen, ErrorCode::UnknownCmd, "command");
    return false;
}

uint8_t CommandRegistry::list(const char** out, uint8_t max) const {
    if (!out) return 0;
    uint8_t n = 0;
    for (uint8_t i = 0; i < count && n < max; ++i) out[n++] = entries[i].cmd;
    return n;
}
