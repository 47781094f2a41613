#pragma once
/**
 * TextForge — Outbound chat-completion client
 *
 * One POST to an OpenAI-compatible /chat/completions endpoint per call.
 * A call either yields the first choice's text or a typed failure; there is
 * no retry and no fallback provider.
 */

#include "common.h"
#include "config.h"

// ─── Wire types ─────────────────────────────────────────────────────────────

enum class ChatRole { System, User, Assistant };

const char* role_name(ChatRole role);

struct ChatMessage {
    ChatRole role = ChatRole::User;
    string   content;
};

struct ChatRequest {
    string              model;
    vector<ChatMessage> messages;   // order is preserved on the wire
};

struct ChatChoice {
    ChatMessage message;
};

struct ChatResponse {
    vector<ChatChoice> choices;     // only the first one is consumed
};

void to_json(json& j, const ChatMessage& m);
void from_json(const json& j, ChatMessage& m);
void to_json(json& j, const ChatRequest& r);
void from_json(const json& j, ChatChoice& c);
void from_json(const json& j, ChatResponse& r);

// ─── Call outcome ───────────────────────────────────────────────────────────

enum class LlmErrorKind {
    None,
    Transport,       // no HTTP response at all (DNS, connect, TLS, read)
    Upstream,        // provider answered with status >= 400
    Decode,          // body is not a chat-completion JSON document
    EmptyResponse    // well-formed, but "choices" is empty
};

const char* error_kind_name(LlmErrorKind kind);

struct LlmResult {
    bool         ok         = false;
    string       content;                     // reply text when ok
    LlmErrorKind error_kind = LlmErrorKind::None;
    int          status     = 0;              // upstream HTTP status, 0 = none received
    string       error;                       // server-side detail, never sent to clients
};

LlmResult llm_success(string content);
LlmResult llm_failure(LlmErrorKind kind, string error, int status = 0);

// One-line log form, e.g. "Upstream (status 429): {...}".
string describe(const LlmResult& r);

// ─── Client operations ──────────────────────────────────────────────────────

ChatRequest build_chat_request(const string& model, const string& system_prompt, const string& prompt);
LlmResult   parse_chat_response(const string& body);
LlmResult   call_llm(const ServerConfig& cfg, const string& prompt);

// Handlers only see this; tests substitute their own.
using LlmCaller = function<LlmResult(const string& prompt)>;

LlmCaller make_llm_caller(const ServerConfig& cfg);
