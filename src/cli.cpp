#include "envprobe/cli.hpp"

#include "envprobe/format.hpp"

#include <glaze/glaze.hpp>

#include <CLI/CLI.hpp>

extern "C" {
#include <unistd.h>
}

#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

using namespace envprobe::literals;

namespace envprobe::cli { namespace detail {

    using namespace std::string_view_literals;
    namespace fs = std::filesystem;

    struct persisted_config {
        int schema_version{1};
        std::optional<std::string> shell{};
        std::optional<std::string> dialect{};
        std::optional<std::string> probe{};
        std::optional<int> timeout_ms{};
        std::optional<std::string> output{};
        std::optional<std::vector<std::string>> ignore{};
        std::optional<bool> keep_all{};
    };

}}  // namespace envprobe::cli::detail

namespace glz {

    template <>
    struct meta<envprobe::cli::detail::persisted_config> {
        using T = envprobe::cli::detail::persisted_config;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "shell",
                       &T::shell,
                       "dialect",
                       &T::dialect,
                       "probe",
                       &T::probe,
                       "timeout_ms",
                       &T::timeout_ms,
                       "output",
                       &T::output,
                       "ignore",
                       &T::ignore,
                       "keep_all",
                       &T::keep_all);
    };

}  // namespace glz

namespace envprobe::cli { namespace detail {

    static std::string read_text_file(const fs::path& path) {
        std::ifstream in{path, std::ios::binary};
        if (!in) {
            throw std::runtime_error("failed to open " + path.string());
        }
        std::ostringstream ss{};
        ss << in.rdbuf();
        if (!in.good() && !in.eof()) {
            throw std::runtime_error("failed to read " + path.string());
        }
        return ss.str();
    }

    static void validate_supported_schema_version(int schema_version, const fs::path& path) {
        constexpr int supported_schema_version = 1;
        if (schema_version > supported_schema_version) {
            throw std::runtime_error(
                    "unsupported schema_version in {}: {} > {}"_format(
                            path.string(), schema_version, supported_schema_version));
        }
    }

    static bool is_explicit(const std::vector<std::string>& explicit_keys, std::string_view key) {
        return std::ranges::find(explicit_keys, key) != explicit_keys.end();
    }

    static std::string read_script(const startup_config& cfg) {
        if (cfg.script_file) {
            return read_text_file(*cfg.script_file);
        }
        if (cfg.script && *cfg.script != "-"sv) {
            return *cfg.script;
        }
        if (!cfg.script && ::isatty(STDIN_FILENO) != 0) {
            throw std::runtime_error("no script given (pass it as an argument, with --file, or on stdin)");
        }
        return std::string{std::istreambuf_iterator<char>{std::cin}, std::istreambuf_iterator<char>{}};
    }

    // one table row per variable, whatever the value holds
    static std::string escape_control(std::string_view text) {
        std::string escaped{};
        escaped.reserve(text.size());
        for (auto c : text) {
            switch (c) {
                case '\n':
                    escaped += "\\n";
                    break;
                case '\r':
                    escaped += "\\r";
                    break;
                case '\t':
                    escaped += "\\t";
                    break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20U || c == '\x7f') {
                        escaped += "\\x{:02x}"_format(static_cast<unsigned char>(c));
                    }
                    else {
                        escaped.push_back(c);
                    }
            }
        }
        return escaped;
    }

    static void echo_child_output(const std::string& out, const std::string& err, const startup_config& cfg) {
        if (cfg.quiet) {
            return;
        }
        // stdout stays reserved for the result
        std::cerr << out << err;
        if (cfg.verbose && out.empty() && err.empty()) {
            std::cerr << "(shell produced no output)\n";
        }
    }

}}  // namespace envprobe::cli::detail

namespace envprobe::cli {

    bool is_shell_identifier(std::string_view name) {
        if (name.empty() || (name.front() >= '0' && name.front() <= '9')) {
            return false;
        }
        return std::ranges::all_of(name, [](char c) {
            return c == '_' || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
        });
    }

    std::string quote_posix_word(std::string_view value) {
        std::string quoted{"'"};
        for (auto c : value) {
            if (c == '\'') {
                quoted += "'\\''";
            }
            else {
                quoted.push_back(c);
            }
        }
        quoted.push_back('\'');
        return quoted;
    }

    void print_config(const startup_config& cfg, std::ostream& os) {
        os << "shell=" << cfg.shell << '\n';
        os << "dialect=" << to_string(cfg.dialect) << '\n';
        os << "probe=" << (cfg.probe ? cfg.probe->string() : "<self>") << '\n';
        os << "timeout_ms=" << (cfg.timeout_ms ? std::to_string(*cfg.timeout_ms) : "<none>") << '\n';
        os << "output=" << to_string(cfg.output) << '\n';
        os << "ignore=" << utils::join_with_separator(effective_ignore_list(cfg), ",") << '\n';
    }

    void print_delta(const env_delta& delta, output_mode mode, std::ostream& os) {
        switch (mode) {
            case output_mode::json: {
                std::string json{};
                if (auto ec = glz::write<glz::opts{.prettify = true}>(delta, json)) {
                    throw std::runtime_error("failed to serialize result: {}"_format(glz::format_error(ec, json)));
                }
                os << json << '\n';
                return;
            }
            case output_mode::table: {
                size_t width = 0;
                for (const auto& [name, value] : delta) {
                    auto shown = detail::escape_control(name);
                    width = std::max(width, shown.size());
                }
                for (const auto& [name, value] : delta) {
                    auto shown = detail::escape_control(name);
                    os << shown << std::string(width - shown.size() + 2U, ' ') << detail::escape_control(value)
                       << '\n';
                }
                return;
            }
            case output_mode::exports:
                for (const auto& [name, value] : delta) {
                    if (!is_shell_identifier(name)) {
                        std::cerr << "warning: skipping {}: not a valid shell identifier\n"_format(
                                detail::escape_control(name));
                        continue;
                    }
                    os << "export " << name << '=' << quote_posix_word(value) << '\n';
                }
                return;
        }
    }

    void load_config_file(
            const fs::path& path, startup_config& cfg, const std::vector<std::string>& explicit_keys) {
        detail::persisted_config file{};
        auto json = detail::read_text_file(path);
        if (auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(file, json)) {
            throw std::runtime_error(
                    "failed to parse config file {}: {}"_format(path.string(), glz::format_error(ec, json)));
        }
        detail::validate_supported_schema_version(file.schema_version, path);

        if (file.shell && !detail::is_explicit(explicit_keys, "shell"sv)) {
            cfg.shell = *file.shell;
        }
        if (file.dialect && !detail::is_explicit(explicit_keys, "dialect"sv)) {
            if (!try_parse_shell_dialect(*file.dialect, cfg.dialect)) {
                throw std::runtime_error("invalid dialect in {}: {}"_format(path.string(), *file.dialect));
            }
        }
        if (file.probe && !detail::is_explicit(explicit_keys, "probe"sv)) {
            cfg.probe = fs::path{*file.probe};
        }
        if (file.timeout_ms && !detail::is_explicit(explicit_keys, "timeout_ms"sv)) {
            if (*file.timeout_ms <= 0) {
                throw std::runtime_error("invalid timeout_ms in {}: {}"_format(path.string(), *file.timeout_ms));
            }
            cfg.timeout_ms = *file.timeout_ms;
        }
        if (file.output && !detail::is_explicit(explicit_keys, "output"sv)) {
            if (!try_parse_output_mode(*file.output, cfg.output)) {
                throw std::runtime_error("invalid output in {}: {}"_format(path.string(), *file.output));
            }
        }
        if (file.ignore) {
            // merged rather than replaced, so --ignore adds to the file's list
            cfg.ignore.insert(cfg.ignore.begin(), file.ignore->begin(), file.ignore->end());
        }
        if (file.keep_all && !detail::is_explicit(explicit_keys, "keep_all"sv)) {
            cfg.keep_all = *file.keep_all;
        }
    }

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg) {
        CLI::App app{"envprobe: report the environment changes a script makes inside another shell"};

        bool show_version = false;
        std::string script_arg{};
        std::string file_arg{};
        std::string shell_arg{cfg.shell};
        std::string dialect_arg{std::string{to_string(cfg.dialect)}};
        std::string probe_arg{};
        int timeout_arg{0};
        std::string output_arg{std::string{to_string(cfg.output)}};
        std::vector<std::string> ignore_arg{};
        std::string config_arg{};
        std::string dump_env_arg{};

        app.add_option("script", script_arg, "Script to run in the target shell ('-' reads stdin)");
        app.add_option("-f,--file", file_arg, "Read the script from a file");
        app.add_option("-s,--shell", shell_arg, "Target interpreter")->envname("ENVPROBE_SHELL");
        app.add_option("--dialect", dialect_arg, "Shell dialect: auto|posix|powershell");
        app.add_option("--probe", probe_arg, "Probe executable (defaults to this binary)");
        app.add_option("--timeout-ms", timeout_arg, "Kill the shell after this many milliseconds")
                ->check(CLI::PositiveNumber);
        app.add_option("--output", output_arg, "Output mode: json|table|exports");
        app.add_option("--ignore", ignore_arg, "Drop a variable from the result (repeatable)")
                ->delimiter(',')
                ->allow_extra_args(false);
        app.add_flag("--keep-all", cfg.keep_all, "Keep PWD, OLDPWD and _ in the result");
        app.add_option("--config", config_arg, "JSON config file");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--quiet", cfg.quiet, "Do not echo the shell's output");
        app.add_flag("--verbose", cfg.verbose, "Enable verbose output");
        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option(std::string{dump_env_flag}, dump_env_arg, "Write this process' environment to a file and exit")
                ->group("");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (show_version) {
            std::cout << "envprobe 0.1.0\n";
            return std::optional<int>{0};
        }

        if (!dump_env_arg.empty()) {
            cfg.dump_env = fs::path{dump_env_arg};
            return std::nullopt;
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }
        if (app.count("script") > 0U && app.count("--file") > 0U) {
            std::cerr << "a script argument and --file are mutually exclusive\n";
            return std::optional<int>{2};
        }
        if (!try_parse_shell_dialect(dialect_arg, cfg.dialect)) {
            std::cerr << "invalid --dialect value: " << dialect_arg << " (expected auto|posix|powershell)\n";
            return std::optional<int>{2};
        }
        if (!try_parse_output_mode(output_arg, cfg.output)) {
            std::cerr << "invalid --output value: " << output_arg << " (expected json|table|exports)\n";
            return std::optional<int>{2};
        }

        auto shell = utils::trim_view(shell_arg);
        if (shell.empty()) {
            std::cerr << "--shell must not be empty\n";
            return std::optional<int>{2};
        }
        cfg.shell = std::string{shell};

        if (app.count("script") > 0U) {
            cfg.script = script_arg;
        }
        if (app.count("--file") > 0U) {
            cfg.script_file = fs::path{file_arg};
        }
        if (!probe_arg.empty()) {
            cfg.probe = fs::path{probe_arg};
        }
        if (app.count("--timeout-ms") > 0U) {
            cfg.timeout_ms = timeout_arg;
        }
        cfg.ignore = std::move(ignore_arg);

        if (!config_arg.empty()) {
            std::vector<std::string> explicit_keys{};
            if (app.count("--shell") > 0U) {
                explicit_keys.emplace_back("shell");
            }
            if (app.count("--dialect") > 0U) {
                explicit_keys.emplace_back("dialect");
            }
            if (app.count("--probe") > 0U) {
                explicit_keys.emplace_back("probe");
            }
            if (app.count("--timeout-ms") > 0U) {
                explicit_keys.emplace_back("timeout_ms");
            }
            if (app.count("--output") > 0U) {
                explicit_keys.emplace_back("output");
            }
            if (app.count("--keep-all") > 0U) {
                explicit_keys.emplace_back("keep_all");
            }

            cfg.config_file = fs::path{config_arg};
            try {
                load_config_file(*cfg.config_file, cfg, explicit_keys);
            } catch (const std::runtime_error& e) {
                std::cerr << e.what() << '\n';
                return std::optional<int>{2};
            }
        }

        if (cfg.print_config) {
            print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        return std::nullopt;
    }

    int run(const startup_config& cfg) {
        if (cfg.dump_env) {
            try {
                write_env_snapshot(*cfg.dump_env);
                return 0;
            } catch (const std::runtime_error& e) {
                std::cerr << "envprobe: " << e.what() << '\n';
                return 1;
            }
        }

        std::string script{};
        try {
            script = detail::read_script(cfg);
        } catch (const std::runtime_error& e) {
            std::cerr << e.what() << '\n';
            return 2;
        }

        auto options = make_capture_options(cfg);
        if (cfg.verbose) {
            auto dialect = cfg.dialect == shell_dialect::automatic ? detect_shell_dialect(cfg.shell) : cfg.dialect;
            std::cerr << "running {} bytes of script in {} ({})\n"_format(script.size(), options.interpreter, dialect);
        }

        try {
            auto result = capture_env_detailed(script, options);
            detail::echo_child_output(result.output.stdout_output, result.output.stderr_output, cfg);

            auto changes = without_ignored(std::move(result.changes), effective_ignore_list(cfg));
            if (cfg.verbose) {
                std::cerr << changes.size() << " variable(s) changed\n";
            }
            print_delta(changes, cfg.output, std::cout);
            return 0;
        } catch (const capture_error& e) {
            detail::echo_child_output(e.stdout_output(), e.stderr_output(), cfg);
            std::cerr << "error ({}): {}\n"_format(e.kind(), e.what());
            return 1;
        }
    }

}  // namespace envprobe::cli
