/**
 * @file main.cpp
 * @brief Firmware entry point and module wiring.
 */
#include <Arduino.h>
#include <Preferences.h>
#include "Core/NvsKeys.h"    ///< Preference needs to be singleton-like global to work

/// Load Core Functions
#include "Core/ConfigMigrations.h"
#include "Core/ConfigStore.h"
#include "Core/ModuleManager.h"
#include "Core/ServiceRegistry.h"

/// Load Modules
// Stores Modules
#include "Modules/Stores/ConfigStoreModule/ConfigStoreModule.h"
// Logs Modules
#include "Modules/Logs/LogHubModule/LogHubModule.h"
#include "Modules/Logs/LogSerialSinkModule/LogSerialSinkModule.h"
#include "Modules/Logs/LogDispatcherModule/LogDispatcherModule.h"

#include "Modules/EventBusModule/EventBusModule.h"
#include "Modules/CommandModule/CommandModule.h"
#include "Modules/AlarmClockModule/AlarmClockModule.h"
#include "Modules/SerialCommandModule/SerialCommandModule.h"

static Preferences preferences;
static ConfigStore registry;

static ModuleManager moduleManager;
static ServiceRegistry services;

static LogHubModule         logHubModule;
static LogDispatcherModule  logDispatcherModule;
static LogSerialSinkModule  logSerialSinkModule;
static EventBusModule       eventBusModule;
static CommandModule        commandModule;
static ConfigStoreModule    configStoreModule;
static AlarmClockModule     alarmClockModule;
static SerialCommandModule  serialCommandModule;

static void requireSetup(bool ok, const char* step)
{
    if (ok) return;
    Serial.printf("Setup failure: %s\n", step ? step : "unknown");
    while (true) delay(1000);
}

void setup() {
    Serial.begin(115200);
    delay(50);
    requireSetup(preferences.begin(NvsKeys::StorageNamespace, false), "open preferences");
    registry.setPreferences(preferences);
    if (!registry.runMigrations(CURRENT_CFG_VERSION, steps, MIGRATION_COUNT)) {
        Serial.println("[boot] config migration failed, defaults in use");
    }

    requireSetup(moduleManager.add(&logHubModule), "add loghub");
    requireSetup(moduleManager.add(&logDispatcherModule), "add log.dispatcher");
    requireSetup(moduleManager.add(&logSerialSinkModule), "add log.sink.serial");
    requireSetup(moduleManager.add(&eventBusModule), "add eventbus");
    requireSetup(moduleManager.add(&commandModule), "add cmd");
    requireSetup(moduleManager.add(&configStoreModule), "add config");
    requireSetup(moduleManager.add(&alarmClockModule), "add alarmclock");
    requireSetup(moduleManager.add(&serialCommandModule), "add serialcmd");

    requireSetup(moduleManager.initAll(registry, services), "module init");

    Serial.print(
        "\x1b[34m"
        " __        __    _          _       \n"
        " \\ \\      / /_ _| | _____  (_) ___  \n"
        "  \\ \\ /\\ / / _` | |/ / _ \\ | |/ _ \\ \n"
        "   \\ V  V / (_| |   <  __/_| | (_) |\n"
        "    \\_/\\_/ \\__,_|_|\\_\\___(_)_|\\___/ \n"
        "\x1b[0m"
        );
}

void loop() {
    delay(1000);
}
