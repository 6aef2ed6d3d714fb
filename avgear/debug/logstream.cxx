// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Stream based logging mechanism.
 */

#include <avgear/debug/logstream.hxx>

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <vector>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <avgear/debug/LogCallback.hxx>
#include <avgear/structure/exception.hxx>

namespace
{

class StderrLogCallback : public avgear::LogCallback
{
public:
    StderrLogCallback(avDebugClass c, avDebugPriority p) :
        avgear::LogCallback(c, p)
    {
    }

    bool doProcessEntry(const avgear::LogEntry& e) override
    {
        if (!shouldLog(e.debugClass, e.debugPriority))
            return true;

        std::cerr << e.fileName() << ":" << e.line << ": "
                  << logstream::priorityName(e.debugPriority) << ": "
                  << e.message << std::endl;
        return true;
    }
};

struct NamedClass {
    const char* name;
    avDebugClass debugClass;
};

const NamedClass classNames[] = {
    { "none",        AV_NONE },
    { "general",     AV_GENERAL },
    { "environment", AV_ENVIRONMENT },
    { "metar",       AV_METAR },
    { "taf",         AV_TAF },
    { "timing",      AV_TIMING },
    { "format",      AV_FORMAT },
    { "all",         AV_ALL },
};

} // anonymous namespace

class logstream::LogStreamPrivate
{
public:
    LogStreamPrivate() :
        m_logClass(AV_ALL),
        m_logPriority(AV_WARN),
        m_stderrCallback(AV_ALL, AV_WARN)
    {
        m_callbacks.push_back(&m_stderrCallback);
    }

    std::mutex m_mutex;
    std::atomic<int> m_logClass;
    std::atomic<int> m_logPriority;
    StderrLogCallback m_stderrCallback;
    bool m_stderrEnabled = true;
    std::vector<avgear::LogCallback*> m_callbacks;
};

logstream::logstream() :
    d(new LogStreamPrivate)
{
    configureFromEnvironment();
}

logstream::~logstream() = default;

void logstream::setLogLevels(avDebugClass c, avDebugPriority p)
{
    d->m_logClass = c;
    d->m_logPriority = p;

    std::lock_guard<std::mutex> g(d->m_mutex);
    d->m_stderrCallback.setLogLevels(c, p);
}

avDebugPriority logstream::get_log_priority() const
{
    return static_cast<avDebugPriority>(d->m_logPriority.load());
}

avDebugClass logstream::get_log_classes() const
{
    return static_cast<avDebugClass>(d->m_logClass.load());
}

bool logstream::would_log(avDebugClass c, avDebugPriority p) const
{
    if (p >= AV_POPUP)
        return true;
    return (c & d->m_logClass) != 0 && p >= d->m_logPriority;
}

void logstream::log(avDebugClass c, avDebugPriority p,
                    const char* fileName, int line, const char* function,
                    const std::string& msg)
{
    const avgear::LogEntry entry(c, p, fileName, line, function, msg);

    // dispatch outside the lock, a callback may log itself
    std::vector<avgear::LogCallback*> callbacks;
    {
        std::lock_guard<std::mutex> g(d->m_mutex);
        callbacks = d->m_callbacks;
    }

    for (auto cb : callbacks) {
        cb->processEntry(entry);
    }
}

void logstream::addCallback(avgear::LogCallback* cb)
{
    if (!cb)
        return;

    std::lock_guard<std::mutex> g(d->m_mutex);
    if (std::find(d->m_callbacks.begin(), d->m_callbacks.end(), cb) == d->m_callbacks.end())
        d->m_callbacks.push_back(cb);
}

void logstream::removeCallback(avgear::LogCallback* cb)
{
    std::lock_guard<std::mutex> g(d->m_mutex);
    auto it = std::find(d->m_callbacks.begin(), d->m_callbacks.end(), cb);
    if (it != d->m_callbacks.end())
        d->m_callbacks.erase(it);
}

void logstream::setStderrLogging(bool enable)
{
    std::lock_guard<std::mutex> g(d->m_mutex);
    if (enable == d->m_stderrEnabled)
        return;

    d->m_stderrEnabled = enable;
    if (enable) {
        d->m_callbacks.push_back(&d->m_stderrCallback);
    } else {
        auto it = std::find(d->m_callbacks.begin(), d->m_callbacks.end(),
                            &d->m_stderrCallback);
        if (it != d->m_callbacks.end())
            d->m_callbacks.erase(it);
    }
}

void logstream::configureFromEnvironment()
{
    avDebugClass c = get_log_classes();
    avDebugPriority p = get_log_priority();

    const char* level = std::getenv("AVGEAR_LOG_LEVEL");
    if (level && *level) {
        try {
            p = priorityFromString(level);
        } catch (av_range_exception& e) {
            std::cerr << "AVGEAR_LOG_LEVEL: " << e.getFormattedMessage() << std::endl;
        }
    }

    const char* classes = std::getenv("AVGEAR_LOG_CLASSES");
    if (classes && *classes) {
        try {
            c = classesFromString(classes);
        } catch (av_range_exception& e) {
            std::cerr << "AVGEAR_LOG_CLASSES: " << e.getFormattedMessage() << std::endl;
        }
    }

    setLogLevels(c, p);
}

avDebugPriority logstream::priorityFromString(const std::string& s)
{
    const std::string name = boost::trim_copy(s);
    if (boost::iequals(name, "bulk")) return AV_BULK;
    if (boost::iequals(name, "debug")) return AV_DEBUG;
    if (boost::iequals(name, "info")) return AV_INFO;
    if (boost::iequals(name, "warn")) return AV_WARN;
    if (boost::iequals(name, "alert")) return AV_ALERT;
    if (boost::iequals(name, "popup")) return AV_POPUP;

    throw av_range_exception("unknown log priority: " + name);
}

avDebugClass logstream::classFromString(const std::string& s)
{
    const std::string name = boost::trim_copy(s);
    for (const auto& entry : classNames) {
        if (boost::iequals(name, entry.name))
            return entry.debugClass;
    }

    throw av_range_exception("unknown log class: " + name);
}

avDebugClass logstream::classesFromString(const std::string& s)
{
    std::vector<std::string> names;
    boost::split(names, s, boost::is_any_of(","), boost::token_compress_on);

    int result = AV_NONE;
    for (const auto& n : names) {
        if (boost::trim_copy(n).empty())
            continue;
        result |= classFromString(n);
    }
    return static_cast<avDebugClass>(result);
}

const char* logstream::priorityName(avDebugPriority p)
{
    switch (p) {
    case AV_BULK:  return "bulk";
    case AV_DEBUG: return "debug";
    case AV_INFO:  return "info";
    case AV_WARN:  return "warn";
    case AV_ALERT: return "alert";
    case AV_POPUP: return "popup";
    }
    return "unknown";
}

logstream& avlog()
{
    // Meyers singleton, construction is thread-safe
    static logstream instance;
    return instance;
}
