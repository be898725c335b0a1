#include "envprobe/snapshot.hpp"

#include "envprobe/errors.hpp"
#include "envprobe/format.hpp"

#include <glaze/glaze.hpp>

#include <fstream>
#include <sstream>
#include <system_error>

extern "C" {
extern char** environ;
}

using namespace envprobe::literals;

namespace envprobe {

    namespace fs = std::filesystem;

    command probe_snapshot_command(const fs::path& probe, const fs::path& target) {
        return {probe.string(), std::string{dump_env_flag}, target.string()};
    }

    env_snapshot snapshot_from_environ(char** envp) {
        env_snapshot snapshot{};
        if (envp == nullptr) {
            return snapshot;
        }
        for (auto** entry = envp; *entry != nullptr; ++entry) {
            std::string_view kv{*entry};
            auto eq = kv.find('=');
            if (eq == std::string_view::npos || eq == 0U) {
                continue;
            }
            // emplace keeps the first occurrence, matching getenv
            snapshot.emplace(std::string{kv.substr(0, eq)}, std::string{kv.substr(eq + 1U)});
        }
        return snapshot;
    }

    env_snapshot current_environment() {
        return snapshot_from_environ(environ);
    }

    void write_env_snapshot(const fs::path& target) {
        write_env_snapshot(current_environment(), target);
    }

    void write_env_snapshot(const env_snapshot& snapshot, const fs::path& target) {
        std::string json{};
        if (auto ec = glz::write_json(snapshot, json)) {
            throw std::runtime_error("failed to serialize environment: {}"_format(glz::format_error(ec, json)));
        }

        std::ofstream out{target, std::ios::binary | std::ios::trunc};
        if (!out) {
            throw std::runtime_error("failed to open {}"_format(target.string()));
        }
        out << json << '\n';
        if (!out) {
            throw std::runtime_error("failed to write {}"_format(target.string()));
        }
    }

    env_snapshot parse_env_snapshot(std::string_view json, std::string_view origin) {
        env_snapshot snapshot{};
        if (utils::trim_view(json).empty()) {
            throw capture_error{capture_error_kind::snapshot_parse, "snapshot {} is empty"_format(origin)};
        }
        std::string buffer{json};
        if (auto ec = glz::read_json(snapshot, buffer)) {
            throw capture_error{
                    capture_error_kind::snapshot_parse,
                    "failed to parse snapshot {}: {}"_format(origin, glz::format_error(ec, buffer))};
        }
        return snapshot;
    }

    env_snapshot read_env_snapshot(const fs::path& source) {
        std::error_code ec{};
        if (!fs::is_regular_file(source, ec)) {
            throw capture_error{capture_error_kind::snapshot_parse, "snapshot {} is missing"_format(source.string())};
        }

        std::ifstream in{source, std::ios::binary};
        if (!in) {
            throw capture_error{
                    capture_error_kind::snapshot_parse, "failed to open snapshot {}"_format(source.string())};
        }
        std::ostringstream ss{};
        ss << in.rdbuf();
        return parse_env_snapshot(ss.str(), source.string());
    }

    env_delta diff_snapshots(const env_snapshot& before, const env_snapshot& after) {
        env_delta delta{};
        for (const auto& [name, value] : after) {
            if (auto it = before.find(name); it != before.end() && it->second == value) {
                continue;
            }
            delta.emplace_hint(delta.end(), name, value);
        }
        return delta;
    }

}  // namespace envprobe
