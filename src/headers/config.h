#pragma once
/**
 * TextForge — Server configuration
 *
 * Built once at startup from the environment, then handed by const reference
 * to everything that needs it. Nothing mutates it after the server listens.
 */

#include "common.h"

// ─── Fixed defaults ─────────────────────────────────────────────────────────

extern const char* const DEFAULT_API_URL;        // OpenAI chat-completions endpoint
extern const char* const DEFAULT_MODEL;          // model identifier sent upstream
extern const char* const DEFAULT_SYSTEM_PROMPT;  // first message of every chat request
extern const char* const DEFAULT_HOST;
constexpr int DEFAULT_PORT = 8080;

struct ServerConfig {
    string api_key;
    string api_url       = DEFAULT_API_URL;
    string model         = DEFAULT_MODEL;
    string system_prompt = DEFAULT_SYSTEM_PROMPT;
    string host          = DEFAULT_HOST;
    int    port          = DEFAULT_PORT;
    string webhook_url;                          // empty = notifications off
};

struct ConfigResult {
    ServerConfig config;
    string       error;
    bool         ok = false;
};

// Environment lookup: returns nullptr when the variable is unset.
using EnvLookup = function<const char*(const char*)>;

// Reads OPENAI_API_KEY (required), OPENAI_API_URL, HOST, PORT and
// DISCORD_WEBHOOK_URL. Fails when the key is missing or a value is malformed.
ConfigResult load_config(const EnvLookup& getenv_fn);
ConfigResult load_config_from_env();
