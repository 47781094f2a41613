/**
 * TextForge — Text transformation route handlers
 * POST /summarize, /keywords, /rewrite, /questions, /titles, /expand
 *
 * Every handler: decode body -> require `text` -> build prompt -> one LLM
 * call -> fit the reply into the endpoint's response shape. Upstream failure
 * details go to the log and the webhook, never to the caller.
 */

#include "routes.h"
#include "discord.h"
#include "prompts.h"

// ─── Request decoding ───────────────────────────────────────────────────────

struct TextBody {
    string text;
    string tone;
    string error;
    bool   ok = false;
};

// Absent and null fields read as ""; any other non-string value is a bad body.
static bool read_string_field(const json& j, const char* key, string& out) {
    if (!j.is_object() || !j.contains(key) || j[key].is_null()) return true;
    if (!j[key].is_string()) return false;
    out = j[key].get<string>();
    return true;
}

static TextBody decode_text_body(const httplib::Request& req, bool with_tone) {
    TextBody body;
    json j = json::parse(req.body, nullptr, false);

    if (j.is_discarded() || !(j.is_object() || j.is_null())
        || !read_string_field(j, "text", body.text)
        || (with_tone && !read_string_field(j, "tone", body.tone))) {
        body.error = "invalid JSON body";
        return body;
    }

    body.ok = true;
    return body;
}

// ─── Shared handler template ────────────────────────────────────────────────

using PromptBuilder = function<string(const TextBody&)>;
using ReplyShaper   = function<json(const string&)>;

static void run_text_task(const TextContext& ctx, const httplib::Request& req, httplib::Response& res,
                          const string& task, bool with_tone,
                          const PromptBuilder& make_prompt, const ReplyShaper& shape) {
    TextBody body = decode_text_body(req, with_tone);

    if (!body.ok) {
        send_error(res, 400, body.error);
        return;
    }

    if (body.text.empty()) {
        send_error(res, 400, "`text` is required");
        return;
    }

    LlmResult out = ctx.llm(make_prompt(body));

    if (!out.ok) {
        string detail = describe(out);
        cerr << log_prefix() << " " << task << " error: " << detail << endl;
        discord_log_error(ctx.config.webhook_url, task, detail);
        send_error(res, 500, "LLM error");
        return;
    }

    send_json(res, 200, shape(out.content));
}

static json list_reply(const string& task, const char* field, const string& reply) {
    ListOutcome list = parse_string_list(reply);

    if (list.kind == ListOutcome::Kind::Fallback) {
        cout << log_prefix() << " " << task << ": reply is not a JSON string array, returning raw text" << endl;
    }

    return {{field, list.as_list()}};
}

// ─── Handlers ───────────────────────────────────────────────────────────────

void handle_summarize(const TextContext& ctx, const httplib::Request& req, httplib::Response& res) {
    run_text_task(ctx, req, res, "summarize", false,
        [](const TextBody& b) { return summarize_prompt(b.text); },
        [](const string& reply) { return json{{"summary", reply}}; });
}

void handle_keywords(const TextContext& ctx, const httplib::Request& req, httplib::Response& res) {
    run_text_task(ctx, req, res, "keywords", false,
        [](const TextBody& b) { return keywords_prompt(b.text); },
        [](const string& reply) { return list_reply("keywords", "keywords", reply); });
}

void handle_rewrite(const TextContext& ctx, const httplib::Request& req, httplib::Response& res) {
    run_text_task(ctx, req, res, "rewrite", true,
        [](const TextBody& b) { return rewrite_prompt(b.text, b.tone); },
        [](const string& reply) { return json{{"text", reply}}; });
}

void handle_questions(const TextContext& ctx, const httplib::Request& req, httplib::Response& res) {
    run_text_task(ctx, req, res, "questions", false,
        [](const TextBody& b) { return questions_prompt(b.text); },
        [](const string& reply) { return list_reply("questions", "questions", reply); });
}

void handle_titles(const TextContext& ctx, const httplib::Request& req, httplib::Response& res) {
    run_text_task(ctx, req, res, "titles", false,
        [](const TextBody& b) { return titles_prompt(b.text); },
        [](const string& reply) { return list_reply("titles", "titles", reply); });
}

void handle_expand(const TextContext& ctx, const httplib::Request& req, httplib::Response& res) {
    run_text_task(ctx, req, res, "expand", false,
        [](const TextBody& b) { return expand_prompt(b.text); },
        [](const string& reply) { return json{{"text", reply}}; });
}

// ─── Registration ───────────────────────────────────────────────────────────

void register_text_routes(httplib::Server& svr, const ServerConfig& cfg, LlmCaller llm) {
    auto ctx = std::make_shared<const TextContext>(TextContext{cfg, std::move(llm)});

    using TextHandler = void (*)(const TextContext&, const httplib::Request&, httplib::Response&);
    const std::pair<const char*, TextHandler> endpoints[] = {
        {"/summarize", handle_summarize},
        {"/keywords",  handle_keywords},
        {"/rewrite",   handle_rewrite},
        {"/questions", handle_questions},
        {"/titles",    handle_titles},
        {"/expand",    handle_expand},
    };

    for (const auto& [path, handler] : endpoints) {
        TextHandler h = handler;
        route_all_methods(svr, path, with_method("POST", [ctx, h](const httplib::Request& req, httplib::Response& res) {
            h(*ctx, req, res);
        }));
    }
}
