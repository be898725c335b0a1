#include "utils.hpp"

namespace envprobe::test {
    using namespace std::string_view_literals;

    TEST_CASE("005: no-op input changes nothing", "[005][capture]") {
        auto options = detail::sh_options();

        CHECK(capture_env(":"sv, options).empty());
        CHECK(capture_env(""sv, options).empty());
        CHECK(capture_env("# only a comment"sv, options).empty());
        CHECK(capture_env("LOCAL_ONLY=1"sv, options).empty());
    }

    TEST_CASE("005: probing is repeatable", "[005][capture]") {
        auto options = detail::sh_options();

        auto first = capture_env("true"sv, options);
        auto second = capture_env("true"sv, options);
        CHECK(first.empty());
        CHECK(first == second);
    }

    TEST_CASE("005: a single exported variable", "[005][capture]") {
        detail::scoped_env_var unset{"ENVPROBE_005_FOO", std::nullopt};
        auto options = detail::sh_options();

        auto delta = capture_env("export ENVPROBE_005_FOO=bar"sv, options);
        CHECK(delta == env_delta{{"ENVPROBE_005_FOO", "bar"}});

        // the caller's environment is untouched
        CHECK(std::getenv("ENVPROBE_005_FOO") == nullptr);
    }

    TEST_CASE("005: overwrites are reported only when the value changes", "[005][capture]") {
        detail::scoped_env_var existing{"ENVPROBE_005_SAME", "X"};
        auto options = detail::sh_options();

        CHECK(capture_env("export ENVPROBE_005_SAME=X"sv, options).empty());
        CHECK(capture_env("export ENVPROBE_005_SAME=Y"sv, options) == env_delta{{"ENVPROBE_005_SAME", "Y"}});
        CHECK(capture_env("export ENVPROBE_005_SAME="sv, options) == env_delta{{"ENVPROBE_005_SAME", ""}});
    }

    TEST_CASE("005: removed variables are not reported", "[005][capture]") {
        detail::scoped_env_var existing{"ENVPROBE_005_GONE", "present"};
        auto options = detail::sh_options();

        auto delta = capture_env("unset ENVPROBE_005_GONE"sv, options);
        CHECK_FALSE(delta.contains("ENVPROBE_005_GONE"));
        CHECK(delta.empty());
    }

    TEST_CASE("005: multi-line input with awkward values", "[005][capture]") {
        detail::scoped_env_var a{"ENVPROBE_005_A", std::nullopt};
        detail::scoped_env_var b{"ENVPROBE_005_B", std::nullopt};
        detail::scoped_env_var c{"ENVPROBE_005_C", "before"};
        auto options = detail::sh_options();

        auto delta = capture_env(
                "export ENVPROBE_005_A='two\nlines'\n"
                "ENVPROBE_005_B=\"quoted \\\"value\\\" with = signs\"; export ENVPROBE_005_B\n"
                "export ENVPROBE_005_C=\"${ENVPROBE_005_C}:after\" # no trailing newline"sv,
                options);

        CHECK(delta ==
              env_delta{
                      {"ENVPROBE_005_A", "two\nlines"},
                      {"ENVPROBE_005_B", "quoted \"value\" with = signs"},
                      {"ENVPROBE_005_C", "before:after"}});
    }

    TEST_CASE("005: working directory changes surface as PWD", "[005][capture]") {
        detail::temp_dir dir{"envprobe_005_cwd"};
        detail::scoped_env_var pwd{"PWD", std::filesystem::current_path().string()};
        auto options = detail::sh_options();

        auto delta = capture_env("cd " + cli::quote_posix_word(dir.path.string()), options);
        REQUIRE(delta.contains("PWD"));
        CHECK(std::filesystem::equivalent(delta.at("PWD"), dir.path));

        startup_config cfg{};
        CHECK_FALSE(without_ignored(delta, effective_ignore_list(cfg)).contains("PWD"));
    }

    TEST_CASE("005: shell output is captured, not mixed into the result", "[005][capture]") {
        detail::scoped_env_var unset{"ENVPROBE_005_OUT", std::nullopt};
        auto options = detail::sh_options();

        auto result = capture_env_detailed("echo hello\necho oops >&2\nexport ENVPROBE_005_OUT=1"sv, options);
        CHECK(result.changes == env_delta{{"ENVPROBE_005_OUT", "1"}});
        CHECK(result.output.exit_code == 0);
        CHECK(result.output.stdout_output == "hello\n");
        CHECK(result.output.stderr_output == "oops\n");
    }

    TEST_CASE("005: temp files are removed after a successful capture", "[005][capture][cleanup]") {
        detail::temp_dir dir{"envprobe_005_tmp"};
        detail::scoped_env_var tmpdir{"TMPDIR", dir.path.string()};
        auto options = detail::sh_options();

        auto result = capture_env_detailed("export ENVPROBE_005_TMP=1\nls \"$TMPDIR\""sv, options);
        // both snapshot files existed while the script ran
        CHECK(std::ranges::count(result.output.stdout_output, '\n') == 2);
        CHECK(detail::count_entries(dir.path) == 0U);
    }

    TEST_CASE("005: snapshot strategy can be replaced", "[005][capture]") {
        detail::scoped_env_var unset{"ENVPROBE_005_CUSTOM", std::nullopt};
        auto options = detail::sh_options();
        options.snapshot = [](const std::filesystem::path& target) {
            return command{"env", std::string{detail::probe_path}, "--dump-env", target.string()};
        };

        CHECK(capture_env("export ENVPROBE_005_CUSTOM=ok"sv, options) == env_delta{{"ENVPROBE_005_CUSTOM", "ok"}});
    }

    TEST_CASE("005: other posix shells", "[005][capture][shells]") {
        detail::scoped_env_var unset{"ENVPROBE_005_SHELL", std::nullopt};

        SECTION("bash") {
            auto bash = detail::find_on_path("bash");
            if (!bash) {
                SKIP("bash not installed");
            }
            auto options = preset_for(bash->string());
            options.probe = std::filesystem::path{detail::probe_path};
            CHECK(capture_env("true"sv, options).empty());
            CHECK(capture_env("declare -x ENVPROBE_005_SHELL=bash\n(exit 3)"sv, options) ==
                  env_delta{{"ENVPROBE_005_SHELL", "bash"}});
        }

        SECTION("zsh") {
            auto zsh = detail::find_on_path("zsh");
            if (!zsh) {
                SKIP("zsh not installed");
            }
            auto options = preset_for(zsh->string());
            options.probe = std::filesystem::path{detail::probe_path};
            CHECK(capture_env("true"sv, options).empty());
            CHECK(capture_env("typeset -x ENVPROBE_005_SHELL=zsh"sv, options) ==
                  env_delta{{"ENVPROBE_005_SHELL", "zsh"}});
        }

        SECTION("fish") {
            auto fish = detail::find_on_path("fish");
            if (!fish) {
                SKIP("fish not installed");
            }
            auto options = preset_for(fish->string());
            options.probe = std::filesystem::path{detail::probe_path};
            CHECK(capture_env("true"sv, options).empty());
            CHECK(capture_env("set -gx ENVPROBE_005_SHELL fish"sv, options) ==
                  env_delta{{"ENVPROBE_005_SHELL", "fish"}});
        }
    }

    TEST_CASE("005: powershell preset", "[005][capture][shells]") {
        auto pwsh = detail::find_on_path("pwsh");
        if (!pwsh) {
            SKIP("pwsh not installed");
        }
        detail::scoped_env_var unset{"ENVPROBE_005_PWSH", std::nullopt};
        auto options = preset_for(pwsh->string());
        options.probe = std::filesystem::path{detail::probe_path};

        CHECK(capture_env("$env:ENVPROBE_005_PWSH = 'yes'"sv, options) == env_delta{{"ENVPROBE_005_PWSH", "yes"}});
    }

}  // namespace envprobe::test
