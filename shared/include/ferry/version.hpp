#pragma once

#include <string_view>

namespace ferry
{

    constexpr std::string_view version() noexcept
    {
        return "0.3.0";
    }

} // namespace ferry
