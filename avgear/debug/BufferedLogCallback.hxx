// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: 2013 James Turner <zakalawe@mac.com>

/**
 * @file
 * @brief Buffer certain log messages for later retrieval and display
 */

#ifndef AV_DEBUG_BUFFEREDLOGCALLBACK_HXX
#define AV_DEBUG_BUFFEREDLOGCALLBACK_HXX

#include <memory> // for std::unique_ptr
#include <string>
#include <vector>

#include <avgear/debug/LogCallback.hxx>

namespace avgear
{

class BufferedLogCallback : public LogCallback
{
public:
    BufferedLogCallback(avDebugClass c, avDebugPriority p);
    virtual ~BufferedLogCallback();

    /// truncate messages longer than a certain length.
    void truncateAt(unsigned int);

    void operator()(avDebugClass c, avDebugPriority p,
        const char* file, int line, const std::string& aMessage) override;

    /**
     * read the stamp value associated with the log buffer. This is
     * incremented whenever the log contents change, so can be used
     * to poll for changes.
     */
    unsigned int stamp() const;

    /**
     * copy the buffered log data into the provided output list
     * (which will be replaced). This method is safe to call from
     * any thread.
     *
     * returns the stamp value of the copied data
     */
    unsigned int threadsafeCopy(std::vector<std::string>& aOutput) const;

    /// drop everything buffered so far; the stamp keeps counting
    void clear();
private:
    class BufferedLogCallbackPrivate;
    std::unique_ptr<BufferedLogCallbackPrivate> d;
};


} // of namespace avgear

#endif // of AV_DEBUG_BUFFEREDLOGCALLBACK_HXX
