/**
 * TextForge — Server assembly and middleware
 */

#include "routes.h"

// ─── Middleware ─────────────────────────────────────────────────────────────

httplib::Server::Handler with_method(const string& method, httplib::Server::Handler handler) {
    return [method, handler](const httplib::Request& req, httplib::Response& res) {
        if (req.method != method) {
            res.set_header("Allow", method);
            send_error(res, 405, "method not allowed");
            return;
        }
        handler(req, res);
    };
}

void route_all_methods(httplib::Server& svr, const string& path, const httplib::Server::Handler& handler) {
    svr.Get(path, handler);
    svr.Post(path, handler);
    svr.Put(path, handler);
    svr.Patch(path, handler);
    svr.Delete(path, handler);
    svr.Options(path, handler);
}

// ─── Assembly ───────────────────────────────────────────────────────────────

void build_server(httplib::Server& svr, const ServerConfig& cfg, LlmCaller llm) {
    // Request log, ahead of routing so 404s and 405s show up too
    svr.set_pre_routing_handler([](const httplib::Request& req, httplib::Response&) {
        cout << log_prefix() << " " << req.method << " " << req.path << endl;
        return httplib::Server::HandlerResponse::Unhandled;
    });

    register_ui_routes(svr);
    register_text_routes(svr, cfg, std::move(llm));
}
