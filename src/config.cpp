/**
 * TextForge — Configuration loading
 */

#include "config.h"

const char* const DEFAULT_API_URL       = "https://api.openai.com/v1/chat/completions";
const char* const DEFAULT_MODEL         = "gpt-4o-mini";
const char* const DEFAULT_SYSTEM_PROMPT = "You are a helpful text-processing assistant.";
const char* const DEFAULT_HOST          = "0.0.0.0";

static string env_or(const EnvLookup& getenv_fn, const char* name, const string& def) {
    const char* v = getenv_fn(name);
    return (v && *v) ? string(v) : def;
}

ConfigResult load_config(const EnvLookup& getenv_fn) {
    ConfigResult result;
    ServerConfig& cfg = result.config;

    cfg.api_key = env_or(getenv_fn, "OPENAI_API_KEY", "");
    if (cfg.api_key.empty()) {
        result.error = "OPENAI_API_KEY env var is required";
        return result;
    }

    cfg.api_url = env_or(getenv_fn, "OPENAI_API_URL", DEFAULT_API_URL);
    if (!split_url(cfg.api_url).ok) {
        result.error = "OPENAI_API_URL is not a valid http(s) URL: " + cfg.api_url;
        return result;
    }

    cfg.host = env_or(getenv_fn, "HOST", DEFAULT_HOST);

    string port = env_or(getenv_fn, "PORT", "");
    if (!port.empty()) {
        try {
            size_t used = 0;
            cfg.port = std::stoi(port, &used);
            if (used != port.size()) throw std::invalid_argument(port);
        } catch (const std::exception&) {
            result.error = "PORT is not a number: " + port;
            return result;
        }

        if (cfg.port <= 0 || cfg.port > 65535) {
            result.error = "PORT out of range: " + port;
            return result;
        }
    }

    cfg.webhook_url = env_or(getenv_fn, "DISCORD_WEBHOOK_URL", "");
    if (!cfg.webhook_url.empty() && !split_url(cfg.webhook_url).ok) {
        cerr << log_prefix() << " WARNING: DISCORD_WEBHOOK_URL is not a valid URL, notifications disabled" << endl;
        cfg.webhook_url.clear();
    }

    result.ok = true;
    return result;
}

ConfigResult load_config_from_env() {
    return load_config([](const char* name) { return std::getenv(name); });
}
