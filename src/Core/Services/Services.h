#pragma once
/**
 * @file Services.h
 * @brief Convenience include for all service interfaces.
 */
#include "IDeviceApi.h"
#include "IHA.h"
#include "ILogger.h"
#include "IMqtt.h"
#include "IStateStore.h"
