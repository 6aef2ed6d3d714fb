// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: 2020 James Turner

/**
 * @file
 * @brief Base class for log callbacks
 */

#pragma once

#include <string>

#include "LogEntry.hxx"
#include "debug_types.h"

namespace avgear {

class LogCallback
{
public:
    virtual ~LogCallback() = default;

    // newer API: return true if you handled the message, otherwise
    // operator() will be called
    virtual bool doProcessEntry(const LogEntry& e);

    // simple API, receives only the essentials
    virtual void operator()(avDebugClass c, avDebugPriority p,
                            const char* file, int line, const std::string& aMessage);

    void setLogLevels(avDebugClass c, avDebugPriority p);

    void processEntry(const LogEntry& e);

protected:
    LogCallback(avDebugClass c, avDebugPriority p);

    bool shouldLog(avDebugClass c, avDebugPriority p) const;
private:
    avDebugClass m_class;
    avDebugPriority m_priority;
};


} // namespace avgear
