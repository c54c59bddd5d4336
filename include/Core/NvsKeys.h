#pragma once
/**
 * @file NvsKeys.h
 * @brief Centralized NVS key constants used by ConfigStore-registered variables.
 */

#include <stdint.h>

namespace NvsKeys {

/** @brief Preferences namespace opened at boot (`main.cpp`). */
constexpr char StorageNamespace[] = "wakeio"; // Preferences namespace name used at boot to open the firmware NVS partition.
/** @brief Config schema version key read/written by `ConfigStore::runMigrations`. */
constexpr char ConfigVersion[] = "cfg_ver"; // Persistent schema-version marker used to select and run config migrations.

namespace Log {
constexpr char MinLevel[] = "log_lvl"; // Lowest level forwarded to sinks (0=debug .. 3=error).
constexpr char Color[] = "log_color"; // ANSI colors on the serial sink.
}  // namespace Log

namespace AlarmClock {
constexpr char Enabled[] = "ac_en"; // Alarm clock module persisted key for field `ac_en`.
constexpr char TickMs[] = "ac_tick"; // Alarm clock module persisted key for field `ac_tick`.
constexpr char Tz[] = "ac_tz"; // Alarm clock module persisted key for field `ac_tz`.

constexpr char C0Name[] = "ac0_name"; // Alarm clock slot 0 display name.
constexpr char C0Time[] = "ac0_time"; // Alarm clock slot 0 `HH:MM:SS` wake time.
constexpr char C0Active[] = "ac0_act"; // Alarm clock slot 0 on/off switch.
constexpr char C0Snooze[] = "ac0_snz"; // Alarm clock slot 0 snooze minutes.
constexpr char C1Name[] = "ac1_name"; // Alarm clock slot 1 display name.
constexpr char C1Time[] = "ac1_time"; // Alarm clock slot 1 `HH:MM:SS` wake time.
constexpr char C1Active[] = "ac1_act"; // Alarm clock slot 1 on/off switch.
constexpr char C1Snooze[] = "ac1_snz"; // Alarm clock slot 1 snooze minutes.
constexpr char C2Name[] = "ac2_name"; // Alarm clock slot 2 display name.
constexpr char C2Time[] = "ac2_time"; // Alarm clock slot 2 `HH:MM:SS` wake time.
constexpr char C2Active[] = "ac2_act"; // Alarm clock slot 2 on/off switch.
constexpr char C2Snooze[] = "ac2_snz"; // Alarm clock slot 2 snooze minutes.
constexpr char C3Name[] = "ac3_name"; // Alarm clock slot 3 display name.
constexpr char C3Time[] = "ac3_time"; // Alarm clock slot 3 `HH:MM:SS` wake time.
constexpr char C3Active[] = "ac3_act"; // Alarm clock slot 3 on/off switch.
constexpr char C3Snooze[] = "ac3_snz"; // Alarm clock slot 3 snooze minutes.
}  // namespace AlarmClock

}  // namespace NvsKeys
