#pragma once
/**
 * @file ModulePassive.h
 * @brief Base class for passive (no-thread) modules.
 */
#include "Core/Module.h"

/**
 * @brief Base class for modules that only register services or wiring.
 */
class ModulePassive : public Module {
public:
    /** @brief Passive modules do not create a thread. */
    bool hasTask() const override { return false; }

    /** @brief No thread name for passive modules. */
    const char* taskName() const override { return ""; }

    /** @brief Never called because no thread is created. */
    void loop() override {}
};
