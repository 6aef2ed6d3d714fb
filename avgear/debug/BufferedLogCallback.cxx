// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: 2013 James Turner <zakalawe@mac.com>

/**
 * @file
 * @brief Buffer certain log messages for later retrieval and display
 */

#include <avgear/debug/BufferedLogCallback.hxx>

#include <mutex>

namespace avgear
{

class BufferedLogCallback::BufferedLogCallbackPrivate
{
public:
    mutable std::mutex m_mutex;
    std::vector<std::string> m_buffer;
    unsigned int m_stamp = 0;
    unsigned int m_maxLength = 0xffff;
};

BufferedLogCallback::BufferedLogCallback(avDebugClass c, avDebugPriority p) :
    avgear::LogCallback(c, p),
    d(new BufferedLogCallbackPrivate)
{
}

BufferedLogCallback::~BufferedLogCallback() = default;

void BufferedLogCallback::operator()(avDebugClass c, avDebugPriority p,
        const char*, int, const std::string& aMessage)
{
    if (!shouldLog(c, p)) return;

    std::lock_guard<std::mutex> g(d->m_mutex);
    if (aMessage.size() >= d->m_maxLength) {
        d->m_buffer.push_back(aMessage.substr(0, d->m_maxLength - 1));
    } else {
        d->m_buffer.push_back(aMessage);
    }
    d->m_stamp++;
}

unsigned int BufferedLogCallback::stamp() const
{
    std::lock_guard<std::mutex> g(d->m_mutex);
    return d->m_stamp;
}

unsigned int BufferedLogCallback::threadsafeCopy(std::vector<std::string>& aOutput) const
{
    std::lock_guard<std::mutex> g(d->m_mutex);
    aOutput = d->m_buffer;
    return d->m_stamp;
}

void BufferedLogCallback::clear()
{
    std::lock_guard<std::mutex> g(d->m_mutex);
    d->m_buffer.clear();
    d->m_stamp++;
}

void BufferedLogCallback::truncateAt(unsigned int t)
{
    std::lock_guard<std::mutex> g(d->m_mutex);
    d->m_maxLength = t;
}

} // of namespace avgear
