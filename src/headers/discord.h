#pragma once
/**
 * TextForge — Discord webhook notifications
 *
 * All functions are no-ops when the webhook URL is empty. Delivery happens on
 * a detached thread and never blocks the caller.
 */

#include "common.h"

// Send a rich embed to the given Discord webhook
void discord_log(const string& webhook_url, const string& title, const string& description, int color = 0x7C5CFF);

// Build the webhook payload for one embed (exposed for tests)
json discord_embed_payload(const string& title, const string& description, int color);

// Convenience helpers
void discord_log_error(const string& webhook_url, const string& context, const string& error);
void discord_log_server_start(const string& webhook_url, int port, const string& model);
