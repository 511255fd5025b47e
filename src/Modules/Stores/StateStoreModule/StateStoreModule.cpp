/**
 * @file StateStoreModule.cpp
 * @brief Implementation file.
 */
#include "StateStoreModule.h"
#define LOG_TAG "StStorMd"
#include "Core/ModuleLog.h"

void StateStoreModule::init(ConfigStore&, ServiceRegistry& services)
{
    services.add("statestore", &_svc);
}

void StateStoreModule::shutdown()
{
    LOGI("caches: devices=%u attributes=%u discovery=%u",
         (unsigned)_store.deviceCount(), (unsigned)_store.attributeCount(), (unsigned)_store.discoveryCount());
    _store.clear();
}
