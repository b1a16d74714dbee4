#pragma once
#include <algorithm>
#include <cctype>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace natscred::tools {

// trim whitespace (both ends)
inline std::string trim(std::string s) {
    auto isspace = [](unsigned char c){ return std::isspace(c); };
    auto b = std::find_if_not(s.begin(), s.end(), isspace);
    auto e = std::find_if_not(s.rbegin(), s.rend(), isspace).base();
    if (b >= e) return {};
    return {b, e};
}

/**
 * Command line split into --key value options and positional arguments.
 *
 * Accepts "--key value", "--key=value" and "--key = value". A key with no
 * value is stored as "true". Single-dash arguments are short flags, and
 * "-abc" sets a, b and c.
 */
struct cmd_args {
    std::map<std::string, std::string> options;
    std::vector<std::string> positional;

    static cmd_args parse(int argc, char* argv[]) {
        cmd_args result;

        auto put = [&](std::string k, std::string v) {
            result.options[trim(std::move(k))] = trim(std::move(v));
        };

        // value following argv[i], consumed if it is not another option
        auto takeValue = [&](int& i, const std::string& key) {
            if (i + 2 < argc && std::string(argv[i + 1]) == "=") {
                put(key, argv[i + 2]);
                i += 2;
            } else if (i + 1 < argc && std::string(argv[i + 1]).rfind('-', 0) != 0
                       && std::string(argv[i + 1]) != "=") {
                put(key, argv[++i]);
            } else {
                put(key, "true");
            }
        };

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            // ----- LONG OPTIONS -----
            if (arg.rfind("--", 0) == 0) {
                std::string rest = arg.substr(2);
                auto eq = rest.find('=');
                if (eq != std::string::npos) {
                    std::string val = trim(rest.substr(eq + 1));
                    put(rest.substr(0, eq), val.empty() ? "true" : val);
                } else {
                    takeValue(i, rest);
                }
                continue;
            }

            // ----- SHORT OPTIONS (including grouped) -----
            if (arg.size() >= 2 && arg[0] == '-' && arg[1] != '-') {
                std::string s = arg.substr(1);

                auto eq = s.find('=');
                if (eq != std::string::npos && eq >= 1) {
                    std::string val = s.substr(eq + 1);
                    put(std::string(1, s[0]), val.empty() ? "true" : val);
                } else if (s.size() > 1) {
                    for (char ch : s) put(std::string(1, ch), "true");
                } else {
                    takeValue(i, s);
                }
                continue;
            }
            result.positional.push_back(trim(arg));
        }

        return result;
    }

    [[nodiscard]] std::optional<std::string> get(std::string_view key) const {
        if (const auto it = options.find(std::string(key)); it != options.end()) return it->second;
        return std::nullopt;
    }

    [[nodiscard]] bool has(std::string_view key) const {
        return options.count(std::string(key)) != 0;
    }

    /// Boolean flag: present and not explicitly "false"
    [[nodiscard]] bool flag(std::string_view key) const {
        auto value = get(key);
        return value && *value != "false";
    }

    /// Option value that must be present and carry a value
    [[nodiscard]] std::string require(std::string_view key, std::string_view what) const {
        auto value = get(key);
        if (!value || *value == "true") {
            throw std::runtime_error("--" + std::string(key) + " <" + std::string(what) + "> required");
        }
        return *value;
    }

    /// Operand of a command: "--cmd <value>" or, for a bare "--cmd", the first positional
    [[nodiscard]] std::string operand(std::string_view key, std::string_view what) const {
        auto value = get(key);
        if (value && *value != "true") {
            return *value;
        }
        if (!positional.empty()) {
            return positional.front();
        }
        throw std::runtime_error(std::string(what) + " required");
    }
};

} // namespace natscred::tools
