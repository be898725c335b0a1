#include "envprobe/script.hpp"

#include "envprobe/utils.hpp"

namespace envprobe {

    namespace detail {

        static std::string quote_tokens(const command& cmd) {
            std::vector<std::string> quoted{};
            quoted.reserve(cmd.size());
            for (const auto& token : cmd) {
                quoted.push_back("'" + token + "'");
            }
            return utils::join_with_separator(quoted, " ");
        }

    }  // namespace detail

    std::string compose_posix(const command& cmd) {
        return detail::quote_tokens(cmd) + '\n';
    }

    std::string compose_powershell(const command& cmd) {
        if (cmd.empty()) {
            return "\n";
        }
        return "& " + detail::quote_tokens(cmd) + '\n';
    }

    std::string preprocess_input(std::string_view input) {
        std::string out{input};
        if (!out.ends_with('\n')) {
            out.push_back('\n');
        }
        return out;
    }

    command run_posix(std::string_view interpreter, std::string_view script) {
        return {std::string{interpreter}, "-c", std::string{script}};
    }

    command run_powershell(std::string_view interpreter, std::string_view script) {
        return {std::string{interpreter}, "-NoProfile", "-NonInteractive", "-Command", std::string{script}};
    }

}  // namespace envprobe
