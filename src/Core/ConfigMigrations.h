#pragma once
/**
 * @file ConfigMigrations.h
 * @brief Config migration steps for ConfigStore.
 */
#include <Preferences.h>
#include "Core/ConfigStore.h"
#include "Core/NvsKeys.h"

/** @brief Current configuration schema version. */
constexpr uint32_t CURRENT_CFG_VERSION = 1;

/**
 * @brief 0 -> 1: fresh partition. Seeds slot 0 with a disabled "Alarm" clock
 * at the default wake time so the console has something to act on.
 */
static bool mig_0_to_1(Preferences& prefs, bool clearOnFail)
{
    (void)clearOnFail;
    if (prefs.isKey(NvsKeys::AlarmClock::C0Name)) return true;
    if (prefs.putString(NvsKeys::AlarmClock::C0Name, "Alarm") == 0) return false;
    if (prefs.putString(NvsKeys::AlarmClock::C0Time, "07:00:00") == 0) return false;
    if (prefs.putBool(NvsKeys::AlarmClock::C0Active, false) == 0) return false;
    return prefs.putInt(NvsKeys::AlarmClock::C0Snooze, (int32_t)Limits::AlarmClock::DefaultSnoozeMinutes) > 0;
}

/** @brief Ordered list of migrations. */
static const MigrationStep steps[] = {
    {0, 1, mig_0_to_1}
};

/** @brief Number of migration steps. */
static constexpr size_t MIGRATION_COUNT = sizeof(steps) / sizeof(steps[0]);
