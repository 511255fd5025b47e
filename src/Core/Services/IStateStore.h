#pragma once
/**
 * @file IStateStore.h
 * @brief State store service interface.
 */
#include "Core/StateStore/StateStore.h"

/** @brief Service wrapper for access to the StateStore instance. */
struct StateStoreService {
    StateStore* store;
};
