#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace envprobe {

    // one shell invocation, one token per argument
    using command = std::vector<std::string>;

    /*
     * Script composition
     *
     * Each token is wrapped in single quotes and tokens are joined by one space, with a
     * trailing newline. Quote characters inside a token are passed through verbatim: a
     * token such as `it's` closes the quoting early and the rest of the token is spliced
     * into the script as unquoted source. Callers that need arbitrary tokens must quote
     * them before handing them over.
     */
    std::string compose_posix(const command& cmd);

    // PowerShell needs the call operator to run a quoted command name
    std::string compose_powershell(const command& cmd);

    // guarantees that whatever is appended after the input starts on a fresh line
    std::string preprocess_input(std::string_view input);

    command run_posix(std::string_view interpreter, std::string_view script);
    command run_powershell(std::string_view interpreter, std::string_view script);

    inline command noop_posix() {
        return {"true"};
    }

    inline command noop_powershell() {
        return {"Out-Null"};
    }

}  // namespace envprobe
