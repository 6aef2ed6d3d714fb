// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Log classes and priorities
 */

#pragma once

/**
 * Define the possible classes/categories of logging messages
 */
typedef enum {
    AV_NONE        = 0x00000000,

    AV_GENERAL     = 0x00000001,
    AV_ENVIRONMENT = 0x00000002,
    AV_METAR       = 0x00000004,
    AV_TAF         = 0x00000008,
    AV_TIMING      = 0x00000010,
    AV_FORMAT      = 0x00000020,
    AV_UNDEFD      = 0x00000040, // For range checking

    AV_ALL         = 0x0000003F
} avDebugClass;


/**
 * Define the possible logging priorities (and their order).
 *
 * Priorities can be set and accessed via the log levels in
 * logstream::setLogLevels() or the AVGEAR_LOG_LEVEL environment variable.
 */
typedef enum {
    AV_BULK = 1,       // For frequent messages
    AV_DEBUG,          // Less frequent debug type messages
    AV_INFO,           // Informatory messages
    AV_WARN,           // Possible impending problem
    AV_ALERT,          // Very possible impending problem
    AV_POPUP,          // Severe enough to alert using a pop-up window
    // AV_EXIT,        // Problem (no core)
    // AV_ABORT        // Abandon ship (core)
} avDebugPriority;
