#pragma once

#include <string_view>

namespace coursesync
{

    std::string_view version() noexcept;

} // namespace coursesync
