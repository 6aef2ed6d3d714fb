// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: 2020 James Turner

/**
 * @file
 * @brief Base class for log callbacks
 */

#include "LogCallback.hxx"

using namespace avgear;

LogCallback::LogCallback(avDebugClass c, avDebugPriority p) : m_class(c),
                                                              m_priority(p)
{
}

void LogCallback::operator()(avDebugClass, avDebugPriority,
                             const char*, int, const std::string&)
{
    // override me
}

bool LogCallback::doProcessEntry(const LogEntry&)
{
    return false;
}

void LogCallback::processEntry(const LogEntry& e)
{
    if (doProcessEntry(e))
        return; // derived class used the new API

    (*this)(e.debugClass, e.debugPriority, e.file.c_str(), e.line, e.message);
}


bool LogCallback::shouldLog(avDebugClass c, avDebugPriority p) const
{
    if (p >= AV_POPUP)
        return true;
    return (c & m_class) != 0 && p >= m_priority;
}

void LogCallback::setLogLevels(avDebugClass c, avDebugPriority p)
{
    m_priority = p;
    m_class = c;
}
