#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace llmgate {

// Values already present in the process environment win unless overrideExisting is set.
bool loadDotEnv(const std::filesystem::path &path, bool overrideExisting = false);
std::optional<std::string> getEnv(std::string_view key);
std::string getEnvOrDefault(std::string_view key, std::string_view defaultValue);
bool getEnvFlag(std::string_view key, bool defaultValue);
std::int64_t getEnvInt(std::string_view key, std::int64_t defaultValue);
std::optional<std::string> firstEnv(const std::vector<std::string> &keys);

}  // namespace llmgate
