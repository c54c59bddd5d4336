#pragma once
/**
 * @file CommandRegistry.h
 * @brief Command registration and execution.
 */
#include <stdint.h>
#include <stddef.h>
#include "Core/Services/ICommand.h"

/** @brief Maximum number of registered commands. */
constexpr uint8_t MAX_COMMANDS = 24;

/** @brief Command invocation context. */
struct CommandRequest {
    const char* cmd;
    const char* json;   // full request line, may be null
    const char* args;   // serialized "args" object, may be null
};

/** @brief Registered command entry. */
struct CommandEntry {
    const char* cmd;
    CommandHandler fn;
    void* userCtx;
};

/**
 * @brief Registry of command handlers.
 * Handlers are registered during init; every reply is a JSON object.
 */
class CommandRegistry {
public:
    /** @brief Register a handler for a command string. Duplicates are refused. */
    bool registerHandler(const char* cmd, CommandHandler fn, void* userCtx);
    /** @brief Execute a command into a reply buffer. */
    bool execute(const char* cmd, const char* json, const char* args, char* reply, size_t replyLen);
    /** @brief Copy registered command names into out. */
    uint8_t list(const char** out, uint8_t max) const;

private:
    CommandEntry entries[MAX_COMMANDS]{};
    uint8_t count = 0;
};
