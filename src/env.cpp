#include "sfa/env.hpp"

#include "sfa/format.hpp"

#include <unistd.h>

extern char** environ;

using namespace sfa::literals;

namespace sfa {

    environment_map current_environment() {
        environment_map env{};
        for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
            std::string_view kv{*entry};
            auto eq = kv.find('=');
            if (eq == std::string_view::npos || eq == 0) {
                continue;
            }
            env.emplace(std::string{kv.substr(0, eq)}, std::string{kv.substr(eq + 1)});
        }
        return env;
    }

    std::optional<std::string> resolved_env::get(std::string_view name) const {
        if (auto it = values.find(name); it != values.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    resolved_env resolve_env(const std::vector<env_declaration>& declarations, const environment_map& process_env) {
        resolved_env resolved{};
        for (const auto& decl : declarations) {
            if (decl.secret) {
                resolved.secrets.insert(decl.name);
            }
            if (auto it = process_env.find(decl.name); it != process_env.end() && !it->second.empty()) {
                resolved.values[decl.name] = it->second;
                continue;
            }
            if (decl.default_value && !decl.default_value->empty()) {
                resolved.values[decl.name] = *decl.default_value;
            }
        }
        return resolved;
    }

    std::vector<env_declaration> validate_env(
            const std::vector<env_declaration>& declarations, const resolved_env& resolved) {
        std::vector<env_declaration> missing{};
        for (const auto& decl : declarations) {
            if (!decl.required) {
                continue;
            }
            auto value = resolved.get(decl.name);
            if (!value || value->empty()) {
                missing.push_back(decl);
            }
        }
        return missing;
    }

    std::string format_missing_env(std::string_view agent_name, const std::vector<env_declaration>& missing) {
        auto text = "Missing required environment variables for {}:"_format(agent_name);
        for (const auto& decl : missing) {
            text += "\n  - {}"_format(decl.name);
            if (!decl.description.empty()) {
                text += ": {}"_format(decl.description);
            }
        }
        return text;
    }

    std::string mask_secrets(std::string text, const resolved_env& resolved) {
        for (const auto& name : resolved.secrets) {
            auto value = resolved.get(name);
            if (!value || value->empty()) {
                continue;
            }
            for (auto pos = text.find(*value); pos != std::string::npos; pos = text.find(*value, pos + 3)) {
                text.replace(pos, value->size(), "***");
            }
        }
        return text;
    }

}  // namespace sfa
