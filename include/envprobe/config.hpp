#pragma once

#include "capture.hpp"
#include "utils.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace envprobe {

    using namespace std::string_view_literals;

    /*
     * envprobe Startup Config Options
     *
     * Input
     * - script: Inline script text (positional argument).
     * - script_file: Read the script from a file instead.
     *
     * Interpreter
     * - shell: Target interpreter executable.
     * - dialect: Strategy preset; auto picks one from the shell name.
     * - probe: Probe executable override (defaults to this binary).
     * - timeout_ms: Optional wall-time budget for the interpreter.
     *
     * Output
     * - output: Result shape (json, table or export statements).
     * - ignore: Variable names dropped from the result.
     * - keep_all: Do not apply the default ignore list.
     * - quiet/verbose: Coarse verbosity knobs for diagnostics on stderr.
     *
     * One-shot actions
     * - config_file: JSON config file loaded before command-line overrides.
     * - print_config: Print resolved config and exit.
     * - dump_env: Probe mode, write the environment to this file and exit.
     */

    enum class output_mode { json, table, exports };

    inline constexpr std::string_view to_string(output_mode mode) {
        switch (mode) {
            case output_mode::json:
                return "json"sv;
            case output_mode::table:
                return "table"sv;
            case output_mode::exports:
                return "exports"sv;
        }
        return "json"sv;
    }

    inline constexpr bool try_parse_output_mode(std::string_view text, output_mode& out) {
        if (utils::str_case_eq(text, "json"sv)) {
            out = output_mode::json;
            return true;
        }
        if (utils::str_case_eq(text, "table"sv)) {
            out = output_mode::table;
            return true;
        }
        if (utils::str_case_eq(text, "exports"sv) || utils::str_case_eq(text, "export"sv)) {
            out = output_mode::exports;
            return true;
        }
        return false;
    }

    // dropped by consumers that apply the result to their own environment
    inline const std::vector<std::string> default_ignored_vars{"PWD", "OLDPWD", "_"};

    struct startup_config {
        std::optional<std::string> script{};
        std::optional<std::filesystem::path> script_file{};

        std::string shell{"/bin/sh"};
        shell_dialect dialect{shell_dialect::automatic};
        std::optional<std::filesystem::path> probe{};
        std::optional<int> timeout_ms{};

        output_mode output{output_mode::json};
        std::vector<std::string> ignore{};
        bool keep_all{false};
        bool quiet{false};
        bool verbose{false};

        std::optional<std::filesystem::path> config_file{};
        bool print_config{false};
        std::optional<std::filesystem::path> dump_env{};
    };

    // default ignore list (unless keep_all) plus the configured names
    std::vector<std::string> effective_ignore_list(const startup_config& cfg);

    env_delta without_ignored(env_delta delta, const std::vector<std::string>& names);

    capture_options make_capture_options(const startup_config& cfg);

}  // namespace envprobe
