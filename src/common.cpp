/**
 * TextForge — Common utilities implementation
 */

#include "common.h"

// ─── Logging ────────────────────────────────────────────────────────────────

const char* log_prefix() {
    return "[TextForge]";
}

// ─── JSON helpers ───────────────────────────────────────────────────────────

string json_str(const json& j, const string& key, const string& def) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<string>();
    return def;
}

void send_json(httplib::Response& res, int status, const json& body) {
    res.status = status;
    // Model output is relayed verbatim; replace broken UTF-8 rather than throw type_error.316.
    res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
}

void send_error(httplib::Response& res, int status, const string& message) {
    send_json(res, status, {{"error", message}});
}

// ─── URL handling ───────────────────────────────────────────────────────────

UrlParts split_url(const string& url) {
    static const std::regex url_re(R"(^(http|https)://([^/:]+)(?::(\d+))?(/.*)?$)", std::regex::icase);
    UrlParts parts;
    std::smatch m;

    if (!std::regex_match(url, m, url_re)) return parts;

    string scheme = m[1];
    std::transform(scheme.begin(), scheme.end(), scheme.begin(), ::tolower);
    parts.ssl  = (scheme == "https");
    parts.host = m[2];
    parts.port = parts.ssl ? 443 : 80;

    if (m[3].matched) {
        try { parts.port = std::stoi(m[3]); } catch (const std::exception&) { return parts; }
        if (parts.port <= 0 || parts.port > 65535) return parts;
    }

    if (m[4].matched) parts.path = m[4];
    parts.ok = true;
    return parts;
}

string url_origin(const UrlParts& parts) {
    string origin = (parts.ssl ? "https://" : "http://") + parts.host;
    bool default_port = parts.ssl ? parts.port == 443 : parts.port == 80;

    if (!default_port) origin += ":" + to_string(parts.port);
    return origin;
}
