/**
 * TextForge — Discord webhook notifications implementation
 * Sends rich embeds to a Discord channel via webhook + cpp-httplib.
 */

#include "discord.h"

#include <ctime>

// Discord rejects embed descriptions above 4096 characters.
static constexpr size_t MAX_DESCRIPTION = 4000;

// ─── Internal: fire-and-forget POST ─────────────────────────────────────────

static void discord_send(const string& webhook_url, const json& payload) {
    if (webhook_url.empty()) return;

    thread([webhook_url, payload]() {
        UrlParts url = split_url(webhook_url);
        if (!url.ok) return;

        httplib::Client cli(url_origin(url));
        cli.set_connection_timeout(5, 0);
        cli.set_read_timeout(10, 0);

        auto res = cli.Post(url.path,
                            payload.dump(-1, ' ', false, json::error_handler_t::replace),
                            "application/json");
        if (!res) {
            cerr << log_prefix() << " Webhook delivery failed: " << httplib::to_string(res.error()) << endl;
        } else if (res->status >= 400) {
            cerr << log_prefix() << " Webhook rejected with status " << res->status << endl;
        }
    }).detach();
}

// ─── Get ISO-8601 timestamp ─────────────────────────────────────────────────

static string iso_now() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    char buf[32];
    struct tm gmt;
#ifdef _WIN32
    gmtime_s(&gmt, &t);
#else
    gmtime_r(&t, &gmt);
#endif
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &gmt);
    return string(buf);
}

// ─── Public API ─────────────────────────────────────────────────────────────

json discord_embed_payload(const string& title, const string& description, int color) {
    string desc = description;
    if (desc.size() > MAX_DESCRIPTION) desc = desc.substr(0, MAX_DESCRIPTION) + "…";

    json embed = {
        {"title",       title},
        {"description", desc},
        {"color",       color},
        {"timestamp",   iso_now()},
        {"footer",      {{"text", "⚙️ TextForge"}}}
    };
    return {{"embeds", json::array({embed})}};
}

void discord_log(const string& webhook_url, const string& title, const string& description, int color) {
    if (webhook_url.empty()) return;
    discord_send(webhook_url, discord_embed_payload(title, description, color));
}

void discord_log_error(const string& webhook_url, const string& context, const string& error) {
    string desc = "🔍 **Context** › `" + context + "`\n"
                  "💥 **Error** › " + error;
    discord_log(webhook_url, "❌ Operation Failed", desc, 0xED4245);  // Discord red
}

void discord_log_server_start(const string& webhook_url, int port, const string& model) {
    string desc = "🌐 **Port** › `" + to_string(port) + "`\n"
                  "🧠 **Model** › `" + model + "`";
    discord_log(webhook_url, "🚀 Server Online", desc, 0x5865F2);  // Discord blurple
}
