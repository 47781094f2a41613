#pragma once
/**
 * TextForge — Common header
 * Shared includes, using declarations, and utility declarations
 */

#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif
#include <httplib.h>
#include <nlohmann/json.hpp>

#include <iostream>
#include <string>
#include <memory>
#include <regex>
#include <stdexcept>
#include <cstdlib>
#include <chrono>
#include <thread>
#include <algorithm>
#include <vector>
#include <functional>

// ─── Type aliases & namespace shortcuts ─────────────────────────────────────

using json = nlohmann::json;

using std::string;
using std::vector;
using std::thread;
using std::cout;
using std::cerr;
using std::endl;
using std::function;
using std::to_string;

// ─── Logging ────────────────────────────────────────────────────────────────

// Every log line starts with this tag, e.g. "[TextForge] Server starting".
const char* log_prefix();

// ─── Safe JSON accessors (handles null values) ──────────────────────────────

string json_str(const json& j, const string& key, const string& def = "");

// ─── JSON responses ─────────────────────────────────────────────────────────

void send_json(httplib::Response& res, int status, const json& body);
void send_error(httplib::Response& res, int status, const string& message);

// ─── URL handling ───────────────────────────────────────────────────────────

// An absolute http(s) URL split into the pieces httplib's clients take.
struct UrlParts {
    bool   ssl  = true;
    string host;
    int    port = 443;
    string path = "/";
    bool   ok   = false;
};

UrlParts split_url(const string& url);

// Scheme + authority ("https://host", "http://host:port"), the form
// httplib::Client's universal constructor takes.
string url_origin(const UrlParts& parts);
