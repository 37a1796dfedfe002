#pragma once
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace asset_matrix {

// Variables read by the command-line tools
constexpr const char *ENV_DATA_DIR = "ASSET_MATRIX_DATA_DIR";
constexpr const char *ENV_RESULTS_DIR = "ASSET_MATRIX_RESULTS_DIR";
constexpr const char *ENV_CONDA_ENV = "ASSET_MATRIX_CONDA_ENV";
constexpr const char *ENV_WORKERS = "ASSET_MATRIX_WORKERS";
constexpr const char *ENV_TIMEOUT = "ASSET_MATRIX_TIMEOUT";
constexpr const char *ENV_LOG_LEVEL = "ASSET_MATRIX_LOG_LEVEL";
constexpr const char *ENV_PYTHON = "ASSET_MATRIX_PYTHON";

class EnvLoader {
public:
    static EnvLoader& instance() {
        static EnvLoader instance;
        return instance;
    }

    // Loaded variables first, then the process environment
    std::optional<std::string> find(const std::string& key) const {
        if (auto it = m_variables.find(key); it != m_variables.end()) {
            return it->second;
        }
        if (const char* value = std::getenv(key.c_str()); value && *value) {
            return std::string{value};
        }
        return std::nullopt;
    }

    std::string get(const std::string& key, const std::string& defaultValue = "") const {
        return find(key).value_or(defaultValue);
    }

    // Unparsable values are logged and treated as unset
    std::optional<long> getLong(const std::string& key) const {
        auto value = find(key);
        if (!value) return std::nullopt;
        try {
            size_t consumed = 0;
            long parsed = std::stol(*value, &consumed);
            if (consumed == value->size()) {
                return parsed;
            }
        } catch (const std::exception& exp) {
            SPDLOG_WARN("Failed to parse environment variable '{}' with value '{}' as integer: {}",
                        key, *value, exp.what());
            return std::nullopt;
        }
        SPDLOG_WARN("Ignoring environment variable '{}': '{}' is not an integer", key, *value);
        return std::nullopt;
    }

    void set(const std::string& key, const std::string& value) {
        m_variables[key] = value;
        setenv(key.c_str(), value.c_str(), 1);
    }

    // KEY=VALUE lines, '#' comments, optional quotes, ${VAR} expansion
    void loadFile(const std::filesystem::path& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) return;

        std::string line;
        while (std::getline(file, line)) {
            parseLine(line);
        }
        SPDLOG_INFO("Loaded environment from {}.", filename.string());
    }

private:
    std::unordered_map<std::string, std::string> m_variables;

    EnvLoader() {
        if (std::filesystem::exists(".env.local")) {
            loadFile(".env.local");
        }
    }

    void parseLine(const std::string& raw) {
        std::string line = trim(raw);
        if (line.empty() || line[0] == '#') return;
        if (line.starts_with("export ")) {
            line = trim(line.substr(7));
        }

        size_t pos = line.find('=');
        if (pos == std::string::npos) return;

        std::string key = trim(line.substr(0, pos));
        std::string value = trim(line.substr(pos + 1));

        if (value.length() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.length() - 2);
        }

        value = expandVariables(value);

        if (!key.empty()) {
            set(key, value);
        }
    }

    std::string expandVariables(const std::string& value) const {
        std::string result = value;
        size_t pos = 0;

        while ((pos = result.find("${", pos)) != std::string::npos) {
            size_t end = result.find('}', pos);
            if (end == std::string::npos) break;

            std::string varValue = get(result.substr(pos + 2, end - pos - 2));
            result.replace(pos, end - pos + 1, varValue);
            pos += varValue.length();
        }
        return result;
    }

    static std::string trim(const std::string& str) {
        const auto strBegin = str.find_first_not_of(" \t\r\n");
        if (strBegin == std::string::npos) return "";

        const auto strEnd = str.find_last_not_of(" \t\r\n");
        return str.substr(strBegin, strEnd - strBegin + 1);
    }
};

#define ASSET_MATRIX_ENV(key) asset_matrix::EnvLoader::instance().get(key)

} // namespace asset_matrix
