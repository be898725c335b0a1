#pragma once

#include "errors.hpp"
#include "snapshot.hpp"
#include "utils.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace envprobe {

    using namespace std::string_view_literals;

    enum class shell_dialect : uint8_t { automatic, posix, powershell };

    inline constexpr std::string_view to_string(shell_dialect dialect) {
        switch (dialect) {
            case shell_dialect::automatic:
                return "auto"sv;
            case shell_dialect::posix:
                return "posix"sv;
            case shell_dialect::powershell:
                return "powershell"sv;
        }
        return "auto"sv;
    }

    inline constexpr bool try_parse_shell_dialect(std::string_view text, shell_dialect& out) {
        if (utils::str_case_eq(text, "auto"sv)) {
            out = shell_dialect::automatic;
            return true;
        }
        if (utils::str_case_eq(text, "posix"sv) || utils::str_case_eq(text, "sh"sv)) {
            out = shell_dialect::posix;
            return true;
        }
        if (utils::str_case_eq(text, "powershell"sv) || utils::str_case_eq(text, "pwsh"sv)) {
            out = shell_dialect::powershell;
            return true;
        }
        return false;
    }

    // never returns automatic
    inline constexpr shell_dialect detect_shell_dialect(std::string_view interpreter) {
        auto name = utils::path_stem(interpreter);
        if (utils::str_case_eq(name, "pwsh"sv) || utils::str_case_eq(name, "powershell"sv)) {
            return shell_dialect::powershell;
        }
        return shell_dialect::posix;
    }

    /*
     * Capture strategies
     *
     * - interpreter: executable that runs the composed script.
     * - run: builds the argv that hands a script to the interpreter.
     * - compose: renders a command as source for the interpreter.
     * - preprocess: normalizes caller input before it is embedded.
     * - snapshot: builds the command that writes the environment to a file. The default
     *   runs the probe executable with `--dump-env <file>`.
     * - noop: epilogue appended after everything else, so the last statement the
     *   interpreter executes is the same no matter what the input was.
     * - probe: probe executable; unset means the current executable.
     * - timeout_ms: kill the interpreter after this long; unset waits indefinitely.
     */
    struct capture_options {
        std::string interpreter{"/bin/sh"};
        std::function<command(std::string_view, std::string_view)> run{run_posix};
        std::function<std::string(const command&)> compose{compose_posix};
        std::function<std::string(std::string_view)> preprocess{preprocess_input};
        std::function<command(const std::filesystem::path&)> snapshot{};
        command noop{noop_posix()};
        std::optional<std::filesystem::path> probe{};
        std::optional<int> timeout_ms{};
    };

    capture_options posix_preset(std::string interpreter = "/bin/sh");
    capture_options powershell_preset(std::string interpreter = "pwsh");
    capture_options preset_for(std::string interpreter, shell_dialect dialect = shell_dialect::automatic);

    struct execution_output {
        int exit_code{};
        std::string stdout_output{};
        std::string stderr_output{};
    };

    struct capture_result {
        env_delta changes{};
        execution_output output{};
    };

    // resolved probe path: options.probe, else the running executable
    std::filesystem::path resolve_probe(const capture_options& options);

    std::string build_composite_script(
            std::string_view input,
            const std::filesystem::path& before,
            const std::filesystem::path& after,
            const capture_options& options);

    // runs `script` plus the noop epilogue; throws capture_error on spawn failure or non-zero exit
    execution_output execute_script(std::string_view script, const capture_options& options);

    capture_result capture_env_detailed(std::string_view input, const capture_options& options = {});

    /*
     * Runs `input` in the configured interpreter and returns the variables it added or
     * changed. The caller's own environment is left untouched. Throws capture_error.
     */
    env_delta capture_env(std::string_view input, const capture_options& options = {});

}  // namespace envprobe
