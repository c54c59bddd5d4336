#pragma once
/**
 * @file Services.h
 * @brief Convenience include for all service interfaces.
 */
#include "ICommand.h"
#include "IConfig.h"
#include "IEventBus.h"
#include "ILogger.h"
#include "IAlarmClock.h"
