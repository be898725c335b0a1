#pragma once

#include "config.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace envprobe::cli {

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg);

    // merges a JSON config file into cfg; fields already set on the command line win
    void load_config_file(
            const std::filesystem::path& path, startup_config& cfg, const std::vector<std::string>& explicit_keys);

    void print_config(const startup_config& cfg, std::ostream& os);

    void print_delta(const env_delta& delta, output_mode mode, std::ostream& os);

    // [A-Za-z_][A-Za-z0-9_]*, the names an `export` line can carry
    bool is_shell_identifier(std::string_view name);

    // single-quoted POSIX word that survives embedded quotes
    std::string quote_posix_word(std::string_view value);

    int run(const startup_config& cfg);

}  // namespace envprobe::cli
