/**
 * TextForge - AI text tools server
 * C++ backend using cpp-httplib + an OpenAI-compatible chat-completions API
 */

#include "common.h"
#include "config.h"
#include "discord.h"
#include "llm_client.h"
#include "routes.h"

int main() {
    ConfigResult loaded = load_config_from_env();
    if (!loaded.ok) {
        cerr << log_prefix() << " " << loaded.error << endl;
        return 1;
    }

    const ServerConfig& cfg = loaded.config;

    httplib::Server svr;
    build_server(svr, cfg, make_llm_caller(cfg));

    cout << R"(
  ╔╦╗┌─┐─┐ ┬┌┬┐  ╔═╗┌─┐┬─┐┌─┐┌─┐
   ║ ├┤ ┌┴┬┘ │   ╠╣ │ │├┬┘│ ┬├┤
   ╩ └─┘┴ └─ ┴   ╚  └─┘┴└─└─┘└─┘
        AI Text Tools
)" << endl;

    cout << log_prefix() << " Server starting on http://" << cfg.host << ":" << cfg.port << endl;
    cout << log_prefix() << " Model: " << cfg.model << " via " << cfg.api_url << endl;
    cout << log_prefix() << " Webhook notifications: " << (cfg.webhook_url.empty() ? "off" : "on") << endl;
    cout << log_prefix() << " Press Ctrl+C to stop" << endl;

    discord_log_server_start(cfg.webhook_url, cfg.port, cfg.model);

    if (!svr.listen(cfg.host, cfg.port)) {
        cerr << log_prefix() << " Failed to start server on port " << cfg.port << endl;
        return 1;
    }

    return 0;
}
