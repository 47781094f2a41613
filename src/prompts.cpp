/**
 * TextForge — Task prompts and reply shaping
 */

#include "prompts.h"

// ─── Prompt templates ───────────────────────────────────────────────────────

string summarize_prompt(const string& text) {
    return "Summarize the following text in 3–5 bullet points. Be concise and clear.\n\n" + text;
}

string keywords_prompt(const string& text) {
    return R"(Extract 5–10 key keywords from the text below.
Return ONLY a JSON array of strings. Example: ["keyword1","keyword2"].

Text:
)" + text;
}

string rewrite_prompt(const string& text, const string& tone) {
    string t = tone.empty() ? DEFAULT_TONE : tone;
    return "Rewrite the following text in a " + t +
           " tone. Preserve the original meaning. Respond with ONLY the rewritten text.\n\n" + text;
}

string questions_prompt(const string& text) {
    return R"(From the text below, generate 5–10 clear, helpful questions.
Return ONLY a JSON array of strings. Example: ["Question 1?", "Question 2?"].

Text:
)" + text;
}

string titles_prompt(const string& text) {
    return R"(Generate 5 concise, engaging title ideas for the text below.
Return ONLY a JSON array of strings. Example: ["Title 1", "Title 2"].

Text:
)" + text;
}

string expand_prompt(const string& text) {
    return R"(Expand and elaborate on the following text.
Add helpful explanations and details but keep it clear and readable.
Respond with ONLY the expanded text.

Text:
)" + text;
}

// ─── Reply shaping ──────────────────────────────────────────────────────────

vector<string> ListOutcome::as_list() const {
    if (kind == Kind::Parsed) return items;
    return {raw};
}

ListOutcome parse_string_list(const string& reply) {
    ListOutcome out;
    out.raw = reply;

    json j = json::parse(reply, nullptr, false);
    if (j.is_discarded() || !j.is_array()) return out;

    vector<string> items;
    items.reserve(j.size());

    for (const auto& el : j) {
        if (!el.is_string()) return out;
        items.push_back(el.get<string>());
    }

    out.kind  = ListOutcome::Kind::Parsed;
    out.items = std::move(items);
    out.raw.clear();
    return out;
}
