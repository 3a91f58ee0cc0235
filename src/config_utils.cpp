#include "config_utils.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>
#include <string>
#include <nlohmann/json.hpp>

extern char** environ;

namespace syncguard {

static bool to_string_value(const YAML::Node& node, std::string& out) {
    if (!node.IsDefined() || node.IsSequence() || node.IsMap())
        return false;
    if (node.IsNull()) {
        out.clear();
        return true;
    }
    // Scalars keep their source spelling, so `500ms` or `10MB` reach the
    // value parsers untouched. Booleans are normalized.
    bool b = false;
    if (YAML::convert<bool>::decode(node, b)) {
        out = b ? "true" : "false";
        return true;
    }
    out = node.Scalar();
    return true;
}

static bool to_string_value(const nlohmann::json& v, std::string& out) {
    if (v.is_string()) {
        out = v.get<std::string>();
        return true;
    }
    if (v.is_boolean()) {
        out = v.get<bool>() ? "true" : "false";
        return true;
    }
    if (v.is_number_integer()) {
        out = std::to_string(v.get<long long>());
        return true;
    }
    if (v.is_number_unsigned()) {
        out = std::to_string(v.get<unsigned long long>());
        return true;
    }
    if (v.is_number_float()) {
        std::ostringstream oss;
        oss << v.get<double>();
        out = oss.str();
        return true;
    }
    if (v.is_null()) {
        out.clear();
        return true;
    }
    return false;
}

bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        YAML::Node root = YAML::Load(ifs);
        if (root.IsNull())
            return true;
        if (!root.IsMap()) {
            error = "Root YAML node is not a map";
            return false;
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            if (!it->first.IsScalar())
                continue;
            const std::string key_name = it->first.as<std::string>();
            const YAML::Node& node = it->second;
            if (node.IsMap()) {
                for (auto it2 = node.begin(); it2 != node.end(); ++it2) {
                    if (!it2->first.IsScalar())
                        continue;
                    std::string s;
                    if (to_string_value(it2->second, s))
                        opts["--" + it2->first.as<std::string>()] = s;
                }
            } else {
                std::string s;
                if (!to_string_value(node, s)) {
                    error = "Unsupported value for " + key_name;
                    return false;
                }
                opts["--" + key_name] = s;
            }
        }
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}

bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        nlohmann::json root;
        ifs >> root;
        if (!root.is_object()) {
            error = "Root JSON value is not an object";
            return false;
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            const auto& val = it.value();
            if (val.is_object()) {
                for (auto sub = val.begin(); sub != val.end(); ++sub) {
                    std::string s;
                    if (to_string_value(sub.value(), s))
                        opts["--" + sub.key()] = s;
                }
            } else {
                std::string s;
                if (!to_string_value(val, s)) {
                    error = "Unsupported value for " + it.key();
                    return false;
                }
                opts["--" + it.key()] = s;
            }
        }
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos)
        return "";
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

bool load_env_file(const std::string& path, std::map<std::string, std::string>& vars,
                   std::string& error) {
    std::ifstream ifs(path);
    if (!ifs) {
        error = "Failed to open file";
        return false;
    }
    std::string line;
    int line_no = 0;
    while (std::getline(ifs, line)) {
        ++line_no;
        line = trim(line);
        if (line.empty() || line[0] == '#')
            continue;
        if (line.rfind("export ", 0) == 0)
            line = trim(line.substr(7));
        size_t eq = line.find('=');
        std::string key = eq == std::string::npos ? "" : trim(line.substr(0, eq));
        if (key.empty() || key.find_first_of(" \t") != std::string::npos) {
            error = "Line " + std::to_string(line_no) + " is not a KEY=VALUE assignment";
            return false;
        }
        std::string val = trim(line.substr(eq + 1));
        if (val.size() >= 2 && (val.front() == '"' || val.front() == '\'') &&
            val.back() == val.front())
            val = val.substr(1, val.size() - 2);
        vars[key] = val;
    }
    return true;
}

std::map<std::string, std::string> env_to_options(const std::map<std::string, std::string>& vars) {
    static const std::pair<const char*, const char*> mapping[] = {
        // legacy names first so the SYNCGUARD_ spelling overrides them
        {"AWS_S3_SYNC_LOG_FILE", "--log"},
        {"AWS_S3_SYNC_LOCK_FILE", "--lock"},
        {"SHOW_OUTPUT", "--show-output"},
        {"SYNCGUARD_LOG_FILE", "--log"},
        {"SYNCGUARD_LOCK_FILE", "--lock"},
        {"SYNCGUARD_SHOW_OUTPUT", "--show-output"},
        {"SYNCGUARD_TRANSFER_CMD", "--transfer-cmd"}};
    std::map<std::string, std::string> opts;
    for (const auto& m : mapping) {
        auto it = vars.find(m.first);
        if (it != vars.end() && !it->second.empty())
            opts[m.second] = it->second;
    }
    return opts;
}

std::map<std::string, std::string> current_environment() {
    std::map<std::string, std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry = *e;
        size_t eq = entry.find('=');
        if (eq == std::string::npos)
            continue;
        env[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    return env;
}

} // namespace syncguard
