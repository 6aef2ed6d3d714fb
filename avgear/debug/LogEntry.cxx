// SPDX-License-Identifier: LGPL-2.1-or-later

#include "LogEntry.hxx"

namespace avgear {

std::string LogEntry::fileName() const
{
    const auto slash = file.find_last_of("/\\");
    if (slash == std::string::npos)
        return file;
    return file.substr(slash + 1);
}

} // namespace avgear
