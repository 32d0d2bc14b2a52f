#include "llmgate/environment.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace llmgate {
namespace {

std::string trim(std::string_view input) {
    auto begin = input.begin();
    auto end = input.end();
    while (begin != end && std::isspace(static_cast<unsigned char>(*begin))) {
        ++begin;
    }
    while (end != begin) {
        auto prev = end;
        --prev;
        if (!std::isspace(static_cast<unsigned char>(*prev))) {
            break;
        }
        end = prev;
    }
    return std::string(begin, end);
}

void setEnv(const std::string &key, const std::string &value) {
#ifdef _WIN32
    _putenv((key + "=" + value).c_str());
#else
    setenv(key.c_str(), value.c_str(), 1);
#endif
}

bool isQuoted(const std::string &value) {
    return value.size() >= 2 &&
           ((value.front() == '"' && value.back() == '"') || (value.front() == '\'' && value.back() == '\''));
}

// Unquoted values may carry a trailing " # comment".
std::string stripInlineComment(const std::string &value) {
    auto pos = value.find(" #");
    if (pos == std::string::npos) {
        return value;
    }
    return trim(std::string_view(value.data(), pos));
}

}  // namespace

bool loadDotEnv(const std::filesystem::path &path, bool overrideExisting) {
    std::ifstream input(path);
    if (!input.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(input, line)) {
        auto content = trim(line);
        if (content.empty() || content[0] == '#') {
            continue;
        }
        if (content.rfind("export ", 0) == 0) {
            content = trim(std::string_view(content).substr(7));
        }

        auto delimiterPos = content.find('=');
        if (delimiterPos == std::string::npos) {
            continue;
        }

        auto key = trim(std::string_view(content.data(), delimiterPos));
        auto value = trim(std::string_view(content.data() + delimiterPos + 1, content.size() - delimiterPos - 1));

        if (isQuoted(value)) {
            value = value.substr(1, value.size() - 2);
        } else {
            value = stripInlineComment(value);
        }

        if (key.empty()) {
            continue;
        }
        if (!overrideExisting && std::getenv(key.c_str()) != nullptr) {
            continue;
        }
        setEnv(key, value);
    }

    return true;
}

std::optional<std::string> getEnv(std::string_view key) {
    auto *value = std::getenv(std::string(key).c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

std::string getEnvOrDefault(std::string_view key, std::string_view defaultValue) {
    auto value = getEnv(key);
    if (!value.has_value() || value->empty()) {
        return std::string(defaultValue);
    }
    return *value;
}

bool getEnvFlag(std::string_view key, bool defaultValue) {
    auto value = getEnv(key);
    if (!value.has_value()) {
        return defaultValue;
    }

    std::string lowered = *value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") {
        return false;
    }

    return defaultValue;
}

std::int64_t getEnvInt(std::string_view key, std::int64_t defaultValue) {
    auto value = getEnv(key);
    if (!value.has_value() || value->empty()) {
        return defaultValue;
    }
    try {
        std::size_t consumed = 0;
        auto parsed = std::stoll(*value, &consumed);
        return consumed == value->size() ? parsed : defaultValue;
    } catch (const std::exception &) {
        return defaultValue;
    }
}

std::optional<std::string> firstEnv(const std::vector<std::string> &keys) {
    for (const auto &key : keys) {
        auto value = getEnv(key);
        if (value.has_value() && !value->empty()) {
            return value;
        }
    }
    return std::nullopt;
}

}  // namespace llmgate
