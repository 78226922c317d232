#include "coursesync/version.hpp"

#ifndef COURSESYNC_VERSION
#define COURSESYNC_VERSION "0.0.0"
#endif

namespace coursesync
{

    std::string_view version() noexcept
    {
        return COURSESYNC_VERSION;
    }

} // namespace coursesync
