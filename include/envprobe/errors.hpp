#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace envprobe {

    using namespace std::string_view_literals;

    enum class capture_error_kind : uint8_t {
        spawn,
        execution,
        snapshot_parse,
        temp_file,
    };

    inline constexpr std::string_view to_string(capture_error_kind kind) {
        switch (kind) {
            case capture_error_kind::spawn:
                return "spawn"sv;
            case capture_error_kind::execution:
                return "execution"sv;
            case capture_error_kind::snapshot_parse:
                return "snapshot_parse"sv;
            case capture_error_kind::temp_file:
                return "temp_file"sv;
        }
        return "execution"sv;
    }

    /*
     * Raised for every fatal capture failure. Execution failures additionally carry
     * whatever the interpreter wrote before exiting, so callers can surface it.
     */
    class capture_error : public std::runtime_error {
      public:
        capture_error(capture_error_kind kind, const std::string& message)
                : std::runtime_error(message), kind_{kind} {}

        capture_error(
                capture_error_kind kind,
                const std::string& message,
                std::optional<int> exit_code,
                std::string stdout_output,
                std::string stderr_output)
                : std::runtime_error(message),
                  kind_{kind},
                  exit_code_{exit_code},
                  stdout_output_{std::move(stdout_output)},
                  stderr_output_{std::move(stderr_output)} {}

        capture_error_kind kind() const noexcept { return kind_; }
        const std::optional<int>& exit_code() const noexcept { return exit_code_; }
        const std::string& stdout_output() const noexcept { return stdout_output_; }
        const std::string& stderr_output() const noexcept { return stderr_output_; }

      private:
        capture_error_kind kind_;
        std::optional<int> exit_code_{};
        std::string stdout_output_{};
        std::string stderr_output_{};
    };

}  // namespace envprobe
