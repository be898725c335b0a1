#include "envprobe/capture.hpp"

#include "envprobe/format.hpp"

#include "internal/platform.hpp"
#include "internal/process.hpp"

#include <utility>

using namespace envprobe::literals;

namespace envprobe {

    namespace fs = std::filesystem;

    namespace detail {

        enum class capture_stage : uint8_t { init, composing, executing, parsing, diffing, cleaning_up, done, failed };

        inline constexpr std::string_view to_string(capture_stage stage) {
            switch (stage) {
                case capture_stage::init:
                    return "init"sv;
                case capture_stage::composing:
                    return "composing"sv;
                case capture_stage::executing:
                    return "executing"sv;
                case capture_stage::parsing:
                    return "parsing"sv;
                case capture_stage::diffing:
                    return "diffing"sv;
                case capture_stage::cleaning_up:
                    return "cleaning_up"sv;
                case capture_stage::done:
                    return "done"sv;
                case capture_stage::failed:
                    return "failed"sv;
            }
            return "failed"sv;
        }

        static void enter(capture_stage& current, capture_stage next) {
            debug_log("capture stage ", to_string(current), " -> ", to_string(next));
            current = next;
        }

        static command snapshot_command(const capture_options& options, const fs::path& target) {
            if (options.snapshot) {
                return options.snapshot(target);
            }
            return probe_snapshot_command(resolve_probe(options), target);
        }

    }  // namespace detail

    capture_options posix_preset(std::string interpreter) {
        capture_options options{};
        options.interpreter = std::move(interpreter);
        return options;
    }

    capture_options powershell_preset(std::string interpreter) {
        capture_options options{};
        options.interpreter = std::move(interpreter);
        options.run = run_powershell;
        options.compose = compose_powershell;
        options.noop = noop_powershell();
        return options;
    }

    capture_options preset_for(std::string interpreter, shell_dialect dialect) {
        if (dialect == shell_dialect::automatic) {
            dialect = detect_shell_dialect(interpreter);
        }
        if (dialect == shell_dialect::powershell) {
            return powershell_preset(std::move(interpreter));
        }
        return posix_preset(std::move(interpreter));
    }

    fs::path resolve_probe(const capture_options& options) {
        if (options.probe) {
            return *options.probe;
        }
        return internal::current_executable();
    }

    std::string build_composite_script(
            std::string_view input, const fs::path& before, const fs::path& after, const capture_options& options) {
        std::string script{};
        script += options.compose(detail::snapshot_command(options, before));
        script += options.preprocess(input);
        script += options.compose(detail::snapshot_command(options, after));
        return script;
    }

    execution_output execute_script(std::string_view script, const capture_options& options) {
        std::string full_script{script};
        full_script += options.compose(options.noop);

        auto args = options.run(options.interpreter, full_script);
        debug_log("spawning ", options.interpreter, " with ", full_script.size(), " bytes of script");

        auto result = internal::run_subprocess(args, options.timeout_ms);
        if (result.timed_out) {
            throw capture_error{
                    capture_error_kind::execution,
                    "{} timed out after {} ms"_format(options.interpreter, options.timeout_ms.value_or(0)),
                    std::nullopt,
                    std::move(result.stdout_output),
                    std::move(result.stderr_output)};
        }
        if (result.exit_code != 0) {
            throw capture_error{
                    capture_error_kind::execution,
                    "{} exited with status {}"_format(options.interpreter, result.exit_code),
                    result.exit_code,
                    std::move(result.stdout_output),
                    std::move(result.stderr_output)};
        }

        return {.exit_code = result.exit_code,
                .stdout_output = std::move(result.stdout_output),
                .stderr_output = std::move(result.stderr_output)};
    }

    capture_result capture_env_detailed(std::string_view input, const capture_options& options) {
        auto stage = detail::capture_stage::init;
        capture_result result{};
        try {
            {
                // both files are removed by their destructors on every path out of this scope
                internal::temp_file before{internal::platform::temp_file_prefix};
                internal::temp_file after{internal::platform::temp_file_prefix};

                detail::enter(stage, detail::capture_stage::composing);
                auto script = build_composite_script(input, before.path(), after.path(), options);

                detail::enter(stage, detail::capture_stage::executing);
                result.output = execute_script(script, options);

                detail::enter(stage, detail::capture_stage::parsing);
                auto before_env = read_env_snapshot(before.path());
                auto after_env = read_env_snapshot(after.path());

                detail::enter(stage, detail::capture_stage::diffing);
                result.changes = diff_snapshots(before_env, after_env);

                detail::enter(stage, detail::capture_stage::cleaning_up);
            }
            detail::enter(stage, detail::capture_stage::done);
        } catch (const capture_error& e) {
            debug_log("capture failed (", to_string(e.kind()), "): ", e.what());
            detail::enter(stage, detail::capture_stage::failed);
            throw;
        }
        return result;
    }

    env_delta capture_env(std::string_view input, const capture_options& options) {
        return capture_env_detailed(input, options).changes;
    }

}  // namespace envprobe
