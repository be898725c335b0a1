#pragma once

#include "envprobe.hpp"
#include "envprobe/cli.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "internal/process.hpp"

extern "C" {
#include <unistd.h>
}

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace envprobe::test::detail {
    namespace fs = std::filesystem;

    inline constexpr auto probe_path = std::string_view{ENVPROBE_TEST_PROBE_PATH};

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }
    };

    struct scoped_env_var {
        std::string key{};
        std::optional<std::string> previous{};

        scoped_env_var(std::string key_value, std::optional<std::string> next) : key(std::move(key_value)) {
            if (auto* existing = std::getenv(key.c_str()); existing != nullptr) {
                previous = std::string{existing};
            }

            if (next) {
                REQUIRE(::setenv(key.c_str(), next->c_str(), 1) == 0);
            }
            else {
                REQUIRE(::unsetenv(key.c_str()) == 0);
            }
        }

        ~scoped_env_var() {
            if (previous) {
                (void)::setenv(key.c_str(), previous->c_str(), 1);
            }
            else {
                (void)::unsetenv(key.c_str());
            }
        }
    };

    // routes a standard stream into a buffer for the lifetime of the object
    struct captured_stream {
        std::ostream& stream;
        std::ostringstream buffer{};
        std::streambuf* previous{nullptr};

        explicit captured_stream(std::ostream& target) : stream(target), previous(target.rdbuf(buffer.rdbuf())) {}
        ~captured_stream() { stream.rdbuf(previous); }

        captured_stream(const captured_stream&) = delete;
        captured_stream& operator=(const captured_stream&) = delete;

        std::string str() const { return buffer.str(); }
    };

    inline void write_text_file(const fs::path& path, std::string_view text) {
        std::ofstream out{path};
        REQUIRE(out.good());
        out << text;
        REQUIRE(out.good());
    }

    inline std::string read_text_file(const fs::path& path) {
        std::ifstream in{path};
        REQUIRE(in.good());
        return std::string{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    }

    inline size_t count_entries(const fs::path& dir) {
        return static_cast<size_t>(std::distance(fs::directory_iterator{dir}, fs::directory_iterator{}));
    }

    inline std::optional<fs::path> find_on_path(std::string_view name) {
        auto* path_env = std::getenv("PATH");
        if (path_env == nullptr) {
            return std::nullopt;
        }
        std::string_view dirs{path_env};
        while (!dirs.empty()) {
            auto sep = dirs.find(':');
            auto dir = dirs.substr(0, sep);
            if (!dir.empty()) {
                auto candidate = fs::path{dir} / name;
                if (::access(candidate.c_str(), X_OK) == 0) {
                    return candidate;
                }
            }
            if (sep == std::string_view::npos) {
                break;
            }
            dirs.remove_prefix(sep + 1U);
        }
        return std::nullopt;
    }

    inline capture_options sh_options() {
        auto options = posix_preset("/bin/sh");
        options.probe = fs::path{probe_path};
        return options;
    }

    inline std::vector<char*> to_argv(std::vector<std::string>& args) {
        std::vector<char*> argv{};
        argv.reserve(args.size());
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return argv;
    }
}  // namespace envprobe::test::detail
