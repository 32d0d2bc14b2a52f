#pragma once

#include <json/json.h>

namespace llmgate::http {

// Tools the front end may offer to OpenAI models: {tools:[...], status:"success"}.
Json::Value toolCatalog();

}  // namespace llmgate::http
