#include "envprobe/config.hpp"

#include <algorithm>

namespace envprobe {

    std::vector<std::string> effective_ignore_list(const startup_config& cfg) {
        std::vector<std::string> names{};
        if (!cfg.keep_all) {
            names = default_ignored_vars;
        }
        for (const auto& name : cfg.ignore) {
            if (std::ranges::find(names, name) == names.end()) {
                names.push_back(name);
            }
        }
        return names;
    }

    env_delta without_ignored(env_delta delta, const std::vector<std::string>& names) {
        for (const auto& name : names) {
            delta.erase(name);
        }
        return delta;
    }

    capture_options make_capture_options(const startup_config& cfg) {
        auto options = preset_for(cfg.shell, cfg.dialect);
        options.probe = cfg.probe;
        options.timeout_ms = cfg.timeout_ms;
        return options;
    }

}  // namespace envprobe
