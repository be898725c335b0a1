#pragma once

#include <string_view>

namespace envprobe::internal::platform {
    using namespace std::string_view_literals;

    inline constexpr bool is_macos = ENVPROBE_PLATFORM_MACOS != 0;

    inline constexpr auto temp_file_prefix = "envprobe_"sv;

    // procfs link consulted for the default probe on non-macOS hosts
    inline constexpr auto self_exe_link = "/proc/self/exe"sv;

}  // namespace envprobe::internal::platform
