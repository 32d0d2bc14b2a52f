#pragma once

#include "providers/ProviderAdapter.hpp"

#include <map>
#include <memory>
#include <vector>

namespace llmgate::providers {

std::shared_ptr<const ProviderAdapter> makeAdapter(ProviderProfile profile);

// Built once before the server starts; read-only afterwards.
class ProviderRegistry {
   public:
    ProviderRegistry() = default;
    explicit ProviderRegistry(std::vector<ProviderProfile> profiles);

    [[nodiscard]] std::shared_ptr<const ProviderAdapter> find(core::Provider provider) const;
    [[nodiscard]] std::vector<core::Provider> providers() const;
    [[nodiscard]] bool empty() const { return adapters_.empty(); }

   private:
    std::map<core::Provider, std::shared_ptr<const ProviderAdapter>> adapters_;
};

}  // namespace llmgate::providers
