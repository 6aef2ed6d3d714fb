// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Stream based logging mechanism.
 *
 * Messages are filtered by class (a bit mask naming the subsystem) and
 * priority, then handed to every registered LogCallback. The stream is
 * safe to use from several threads at once.
 */

#pragma once

#include <memory>
#include <sstream>
#include <string>

#include <avgear/debug/debug_types.h>

namespace avgear {
class LogCallback;
}

/**
 * Class to manage the debug logging stream.
 */
class logstream
{
public:
    ~logstream();

    /**
     * Set the global log class and priority level.
     * @param c debug class
     * @param p priority
     */
    void setLogLevels(avDebugClass c, avDebugPriority p);

    avDebugPriority get_log_priority() const;
    avDebugClass get_log_classes() const;

    bool would_log(avDebugClass c, avDebugPriority p) const;

    /**
     * Dispatch a message to every callback. Normally called through
     * AV_LOG, which skips building the message when would_log() fails.
     */
    void log(avDebugClass c, avDebugPriority p,
             const char* fileName, int line, const char* function,
             const std::string& msg);

    /**
     * Register a callback. The caller keeps ownership and must remove
     * the callback before destroying it.
     */
    void addCallback(avgear::LogCallback* cb);
    void removeCallback(avgear::LogCallback* cb);

    /// enable or disable the built-in stderr output
    void setStderrLogging(bool enable);

    /**
     * Re-read AVGEAR_LOG_LEVEL and AVGEAR_LOG_CLASSES. Called once when
     * the stream is created; unknown names are reported and ignored.
     */
    void configureFromEnvironment();

    /**
     * Convert a priority name ("bulk", "debug", "info", "warn", "alert",
     * "popup") to a priority. Throws av_range_exception for other names.
     */
    static avDebugPriority priorityFromString(const std::string& s);

    /**
     * Convert a class name ("general", "metar", "taf", ... or "all") to
     * a debug class. Throws av_range_exception for other names.
     */
    static avDebugClass classFromString(const std::string& s);

    /// comma separated list of class names, as accepted by AVGEAR_LOG_CLASSES
    static avDebugClass classesFromString(const std::string& s);

    static const char* priorityName(avDebugPriority p);

    friend logstream& avlog();

private:
    logstream();

    class LogStreamPrivate;
    std::unique_ptr<LogStreamPrivate> d;
};

logstream& avlog();

#define AV_FUNCTION_NAME __func__

/**
 * Log a message.
 * @param C debug class
 * @param P priority
 * @param M message, may use the stream insertion operator
 */
#define AV_LOG(C, P, M)                                                    \
    do {                                                                   \
        if (avlog().would_log(C, P)) {                                     \
            std::ostringstream os;                                         \
            os << M;                                                       \
            avlog().log(C, P, __FILE__, __LINE__, AV_FUNCTION_NAME, os.str()); \
        }                                                                  \
    } while (0)
