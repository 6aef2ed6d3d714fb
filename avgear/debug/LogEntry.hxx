// SPDX-License-Identifier: LGPL-2.1-or-later

#pragma once

#include <string>

#include "debug_types.h"

namespace avgear {
/**
 * storage of a single log entry. This is what the log stream hands to
 * each registered callback; it owns a copy of the message so a callback
 * may keep it after the call returns.
 */
class LogEntry final
{
public:
    LogEntry(avDebugClass c, avDebugPriority p,
             const char* file, int line, const char* function,
             const std::string& msg)
    :
    debugClass(c),
    debugPriority(p),
    file(file ? file : ""),
    line(line),
    function(function ? function : ""),
    message(msg)
    {
    }

    LogEntry(const LogEntry& c) = default;
    LogEntry& operator=(const LogEntry& c) = delete;

    /// short name of the source file, without directories
    std::string fileName() const;

    const avDebugClass debugClass;
    const avDebugPriority debugPriority;
    const std::string file;
    const int line;
    const std::string function;
    const std::string message;
};

} // namespace avgear
