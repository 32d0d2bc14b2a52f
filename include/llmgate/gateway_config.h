#pragma once

#include "providers/ProviderProfile.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace YAML {
class Node;
}  // namespace YAML

namespace llmgate {

// Expands "${NAME:-fallback}" against the environment; other scalars are returned as-is.
std::string resolveScalar(const YAML::Node &node);

// First non-empty value among the named environment variables.
std::optional<std::string> resolveApiKey(const std::vector<std::string> &envNames);

providers::ProviderProfile applyProfileOverrides(providers::ProviderProfile profile, const YAML::Node &node);

// Built-in profiles for every provider, overridden by providers.yaml when it
// exists. API keys are resolved here, once.
std::vector<providers::ProviderProfile> loadProviderProfiles(const std::filesystem::path &path);

void validateProviderConfig(const std::filesystem::path &path);

}  // namespace llmgate
