#pragma once
/**
 * TextForge — Task prompts and reply shaping
 */

#include "common.h"

constexpr const char* DEFAULT_TONE = "neutral";

string summarize_prompt(const string& text);
string keywords_prompt(const string& text);
string rewrite_prompt(const string& text, const string& tone);   // empty tone -> "neutral"
string questions_prompt(const string& text);
string titles_prompt(const string& text);
string expand_prompt(const string& text);

// Result of fitting a model reply into a string list. The model is asked for
// a bare JSON array but is free to ignore that, so a reply that is not one
// comes back as Fallback holding the raw text.
struct ListOutcome {
    enum class Kind { Parsed, Fallback };

    Kind           kind = Kind::Fallback;
    vector<string> items;   // Parsed: the array elements
    string         raw;     // Fallback: the reply, verbatim

    // The list the endpoint returns: items, or {raw}.
    vector<string> as_list() const;
};

ListOutcome parse_string_list(const string& reply);
