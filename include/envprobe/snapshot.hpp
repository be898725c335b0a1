#pragma once

#include "script.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace envprobe {

    using namespace std::string_view_literals;

    using env_snapshot = std::map<std::string, std::string>;
    using env_delta = std::map<std::string, std::string>;

    // argument that switches the envprobe binary into probe mode
    inline constexpr auto dump_env_flag = "--dump-env"sv;

    command probe_snapshot_command(const std::filesystem::path& probe, const std::filesystem::path& target);

    // builds a snapshot from an `environ`-style array; entries without '=' are skipped
    env_snapshot snapshot_from_environ(char** envp);

    env_snapshot current_environment();

    // probe side: serializes the calling process' environment to `target` as a JSON object
    void write_env_snapshot(const std::filesystem::path& target);

    void write_env_snapshot(const env_snapshot& snapshot, const std::filesystem::path& target);

    env_snapshot read_env_snapshot(const std::filesystem::path& source);

    env_snapshot parse_env_snapshot(std::string_view json, std::string_view origin = "<memory>"sv);

    /*
     * Keys of `after` that are missing from `before` or whose value differs byte for byte.
     * Variables present only in `before` are not reported: the delta can set values, it
     * never unsets them.
     */
    env_delta diff_snapshots(const env_snapshot& before, const env_snapshot& after);

}  // namespace envprobe
