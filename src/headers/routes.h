#pragma once
/**
 * TextForge — Route registration
 */

#include "common.h"
#include "config.h"
#include "llm_client.h"

// Everything a text endpoint needs; shared read-only by all handler threads.
struct TextContext {
    ServerConfig config;
    LlmCaller    llm;
};

// ─── Text endpoints (POST, JSON in / JSON out) ──────────────────────────────

void handle_summarize(const TextContext& ctx, const httplib::Request& req, httplib::Response& res);
void handle_keywords(const TextContext& ctx, const httplib::Request& req, httplib::Response& res);
void handle_rewrite(const TextContext& ctx, const httplib::Request& req, httplib::Response& res);
void handle_questions(const TextContext& ctx, const httplib::Request& req, httplib::Response& res);
void handle_titles(const TextContext& ctx, const httplib::Request& req, httplib::Response& res);
void handle_expand(const TextContext& ctx, const httplib::Request& req, httplib::Response& res);

// ─── Middleware ─────────────────────────────────────────────────────────────

// Answers 405 unless the request method equals `method`.
httplib::Server::Handler with_method(const string& method, httplib::Server::Handler handler);

// Binds `handler` to `path` for every verb so wrong methods reach it instead of a 404.
void route_all_methods(httplib::Server& svr, const string& path, const httplib::Server::Handler& handler);

// ─── Registration ───────────────────────────────────────────────────────────

void register_text_routes(httplib::Server& svr, const ServerConfig& cfg, LlmCaller llm);
void register_ui_routes(httplib::Server& svr);

// Request logging + all routes. The server is ready to listen afterwards.
void build_server(httplib::Server& svr, const ServerConfig& cfg, LlmCaller llm);

const string& index_html();
