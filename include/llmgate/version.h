#pragma once

#define LLMGATE_SERVICE_NAME "llmgate"
#define LLMGATE_VERSION "0.1.0"
