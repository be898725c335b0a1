#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace envprobe::internal {

    struct subprocess_result {
        int exit_code{};
        bool timed_out{false};
        std::string stdout_output{};
        std::string stderr_output{};
    };

    /*
     * Spawns args[0] (PATH lookup applies) with stdin inherited and stdout/stderr captured.
     * Blocks until the child exits, or until timeout_ms elapses, in which case the child
     * is killed and `timed_out` is set. Throws capture_error(spawn) if the process could
     * not be started at all; exit code 127 from a started child is reported as-is.
     */
    subprocess_result run_subprocess(const std::vector<std::string>& args, std::optional<int> timeout_ms);

    // exclusively owned, uniquely named file in the platform temp directory
    class temp_file {
      public:
        explicit temp_file(std::string_view prefix);
        ~temp_file();

        temp_file(const temp_file&) = delete;
        temp_file& operator=(const temp_file&) = delete;
        temp_file(temp_file&&) = delete;
        temp_file& operator=(temp_file&&) = delete;

        const std::filesystem::path& path() const { return path_; }

      private:
        std::filesystem::path path_{};
    };

    std::filesystem::path current_executable();

}  // namespace envprobe::internal
