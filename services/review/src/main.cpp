#include "../include/review_routes.hpp"
#include "../../../shared/cpp/ticket_sdk/include/context.hpp"
#include "../../../shared/cpp/ticket_sdk/include/log.hpp"
#include <microhttpd.h>
#include <spdlog/spdlog.h>
#include <csignal>
#include <cstring>
#include <map>
#include <string>

#if MHD_VERSION >= 0x00097002
using MhdResult = enum MHD_Result;
#else
using MhdResult = int;
#endif

static ReviewDesk* g_desk = nullptr;
static StopSignal* g_stop = nullptr;

struct ConnInfo {
    std::string method;
    std::string url;
    std::string body;
};

static MhdResult send_response(struct MHD_Connection* conn, int status, const std::string& body,
                               const char* ctype = "application/json") {
    struct MHD_Response* resp = MHD_create_response_from_buffer(body.size(), (void*)body.data(), MHD_RESPMEM_MUST_COPY);
    if (!resp) return MHD_NO;
    MHD_add_response_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, ctype);
    MhdResult ret = MHD_queue_response(conn, status, resp);
    MHD_destroy_response(resp);
    return ret;
}

static std::map<std::string, std::string> parse_query(struct MHD_Connection* conn) {
    std::map<std::string, std::string> out;
    MHD_get_connection_values(conn, MHD_GET_ARGUMENT_KIND,
        [](void* cls, enum MHD_ValueKind, const char* key, const char* val) -> MhdResult {
            auto* m = static_cast<std::map<std::string, std::string>*>(cls);
            (*m)[key ? key : ""] = val ? val : "";
            return MHD_YES;
        }, &out);
    return out;
}

static MhdResult handler(void* /*cls*/, struct MHD_Connection* connection, const char* url, const char* method,
                         const char* /*version*/, const char* upload_data, size_t* upload_data_size, void** con_cls) {
    ConnInfo* ci = static_cast<ConnInfo*>(*con_cls);
    if (!ci) {
        ci = new ConnInfo{method, url, {}};
        *con_cls = ci;
        return MHD_YES;
    }

    if (0 == strcmp(method, MHD_HTTP_METHOD_POST)) {
        if (*upload_data_size) {
            ci->body.append(upload_data, *upload_data_size);
            *upload_data_size = 0;
            return MHD_YES;
        }
    }

    auto r = handle_request(*g_desk, ci->method, ci->url, parse_query(connection), ci->body);
    spdlog::debug("[review] {} {} -> {}", ci->method, ci->url, r.status);
    return send_response(connection, r.status, r.body);
}

static void request_completed(void* /*cls*/, struct MHD_Connection* /*conn*/, void** con_cls,
                              enum MHD_RequestTerminationCode /*toe*/) {
    delete static_cast<ConnInfo*>(*con_cls);
    *con_cls = nullptr;
}

static void on_signal(int) {
    if (g_stop) g_stop->request_stop();
}

int main(int, char**) {
    AppConfig cfg = load_config();
    init_logging("review", cfg.log);

    try {
        AppContext ctx(cfg);
        ReviewDesk desk(ctx.store(), ctx.transitions(), ctx.claims(), ctx.retrieval(), ctx.completion(),
                        ctx.config().review);
        g_desk = &desk;
        g_stop = &ctx.stop();
        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);

        int port = ctx.config().review.port;
        spdlog::info("[review] Starting HTTP server on port {}...", port);
        struct MHD_Daemon* d = MHD_start_daemon(MHD_USE_AUTO | MHD_USE_INTERNAL_POLLING_THREAD, (uint16_t)port,
                                                nullptr, nullptr, &handler, nullptr,
                                                MHD_OPTION_NOTIFY_COMPLETED, &request_completed, nullptr,
                                                MHD_OPTION_END);
        if (!d) {
            spdlog::critical("[review] Failed to start HTTP server");
            return 1;
        }
        while (ctx.stop().wait_for(std::chrono::seconds(1))) {}
        spdlog::info("[review] stopping");
        MHD_stop_daemon(d);
        g_stop = nullptr;
        g_desk = nullptr;
    } catch (const std::exception& e) {
        spdlog::critical("[review] fatal: {}", e.what());
        return 1;
    }
    return 0;
}
