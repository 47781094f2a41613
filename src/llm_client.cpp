/**
 * TextForge — Outbound chat-completion client implementation
 */

#include "llm_client.h"

// ─── Wire types ─────────────────────────────────────────────────────────────

const char* role_name(ChatRole role) {
    switch (role) {
        case ChatRole::System:    return "system";
        case ChatRole::User:      return "user";
        case ChatRole::Assistant: return "assistant";
    }
    return "user";
}

void to_json(json& j, const ChatMessage& m) {
    j = json{{"role", role_name(m.role)}, {"content", m.content}};
}

void from_json(const json& j, ChatMessage& m) {
    if (!j.is_object()) throw std::invalid_argument("chat message is not an object");

    string role = json_str(j, "role", "assistant");
    if (role == "system")    m.role = ChatRole::System;
    else if (role == "user") m.role = ChatRole::User;
    else                     m.role = ChatRole::Assistant;

    // Providers send "content": null for tool-call turns.
    m.content.clear();
    if (j.contains("content") && !j["content"].is_null()) j.at("content").get_to(m.content);
}

void to_json(json& j, const ChatRequest& r) {
    j = json{{"model", r.model}, {"messages", r.messages}};
}

void from_json(const json& j, ChatChoice& c) {
    if (!j.is_object()) throw std::invalid_argument("chat choice is not an object");
    if (j.contains("message") && !j["message"].is_null()) j.at("message").get_to(c.message);
}

void from_json(const json& j, ChatResponse& r) {
    r.choices.clear();
    if (j.contains("choices") && !j["choices"].is_null()) j.at("choices").get_to(r.choices);
}

// ─── Call outcome ───────────────────────────────────────────────────────────

const char* error_kind_name(LlmErrorKind kind) {
    switch (kind) {
        case LlmErrorKind::None:          return "None";
        case LlmErrorKind::Transport:     return "Transport";
        case LlmErrorKind::Upstream:      return "Upstream";
        case LlmErrorKind::Decode:        return "Decode";
        case LlmErrorKind::EmptyResponse: return "EmptyResponse";
    }
    return "Unknown";
}

LlmResult llm_success(string content) {
    LlmResult r;
    r.ok      = true;
    r.content = std::move(content);
    return r;
}

LlmResult llm_failure(LlmErrorKind kind, string error, int status) {
    LlmResult r;
    r.error_kind = kind;
    r.error      = std::move(error);
    r.status     = status;
    return r;
}

string describe(const LlmResult& r) {
    if (r.ok) return "ok";
    string out = error_kind_name(r.error_kind);
    if (r.status > 0) out += " (status " + to_string(r.status) + ")";
    if (!r.error.empty()) out += ": " + r.error;
    return out;
}

// ─── Client operations ──────────────────────────────────────────────────────

ChatRequest build_chat_request(const string& model, const string& system_prompt, const string& prompt) {
    ChatRequest req;
    req.model = model;
    req.messages.push_back({ChatRole::System, system_prompt});
    req.messages.push_back({ChatRole::User, prompt});
    return req;
}

LlmResult parse_chat_response(const string& body) {
    json j = json::parse(body, nullptr, false);

    if (j.is_discarded() || !j.is_object()) {
        return llm_failure(LlmErrorKind::Decode, "response is not a JSON object");
    }

    ChatResponse cr;
    try {
        j.get_to(cr);
    } catch (const std::exception& e) {
        return llm_failure(LlmErrorKind::Decode, e.what());
    }

    if (cr.choices.empty()) {
        return llm_failure(LlmErrorKind::EmptyResponse, "no choices from LLM");
    }

    return llm_success(cr.choices.front().message.content);
}

LlmResult call_llm(const ServerConfig& cfg, const string& prompt) {
    UrlParts url = split_url(cfg.api_url);
    if (!url.ok) {
        return llm_failure(LlmErrorKind::Transport, "invalid completions URL: " + cfg.api_url);
    }

    json payload = build_chat_request(cfg.model, cfg.system_prompt, prompt);
    httplib::Headers headers = {
        {"Authorization", "Bearer " + cfg.api_key}
    };

    httplib::Client cli(url_origin(url));
    auto res = cli.Post(url.path, headers,
                        payload.dump(-1, ' ', false, json::error_handler_t::replace),
                        "application/json");

    if (!res) {
        return llm_failure(LlmErrorKind::Transport,
                           "request to " + url.host + " failed: " + httplib::to_string(res.error()));
    }

    if (res->status >= 400) {
        return llm_failure(LlmErrorKind::Upstream, "OpenAI error body=" + res->body, res->status);
    }

    return parse_chat_response(res->body);
}

LlmCaller make_llm_caller(const ServerConfig& cfg) {
    return [cfg](const string& prompt) { return call_llm(cfg, prompt); };
}
