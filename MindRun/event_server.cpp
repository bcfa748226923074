// event_server.cpp - WebSocket push channel for supervision events
// Built with libwebsockets

#include "MindRun.h"
#include "event_server.h"
#include <libwebsockets.h>
#include <queue>

// WebSocket client tracking
struct EventClient {
    lws *wsi;
    std::queue<std::string> outgoing_messages;
    std::mutex mutex;
};

static std::map<lws*, EventClient*> g_clients;
static std::mutex g_clients_mutex;
static std::map<lws*, std::string> g_http_bodies;
static std::mutex g_http_mutex;
static std::atomic<lws_context*> g_lws_context{nullptr};
static std::atomic<bool> g_server_running{false};
static std::thread g_server_thread;
static std::mutex g_callbacks_mutex;
static EventServer::RequestCallback g_request_callback;
static EventServer::StatusCallback g_status_callback;

// Wake the service loop so queued lines get written from its own thread.
static void wake_service() {
    if (lws_context* ctx = g_lws_context.load())
        lws_cancel_service(ctx);
}

// Runs on the service thread after lws_cancel_service(). Depending on the
// libwebsockets version the wake-up reaches the first protocol or all of them.
static void request_event_writes(lws *wsi) {
    const lws_protocols* proto = lws_vhost_name_to_protocol(lws_get_vhost(wsi), "mindrun-events");
    if (proto)
        lws_callback_on_writable_all_protocol(lws_get_context(wsi), proto);
}

static int callback_http(lws *wsi, enum lws_callback_reasons reason,
                         void *user, void *in, size_t len) {
    switch (reason) {
    case LWS_CALLBACK_HTTP: {
        const char *requested_uri = static_cast<const char*>(in);

        if (strcmp(requested_uri, "/") == 0 || strcmp(requested_uri, "/status") == 0) {
            std::string body = "MindRun event server\n"
                               "WebSocket protocol: mindrun-events\n"
                               "Send \"replay\" or \"replay <session_id> <after_event_id>\" for backlog.\n";
            {
                std::lock_guard<std::mutex> lock(g_callbacks_mutex);
                if (g_status_callback) body += "\n" + g_status_callback();
            }

            unsigned char buffer[LWS_PRE + 1024];
            unsigned char *p = &buffer[LWS_PRE];
            unsigned char *end = &buffer[sizeof(buffer) - 1];

            if (lws_add_http_common_headers(wsi, HTTP_STATUS_OK, "text/plain",
                                           static_cast<lws_filepos_t>(body.size()),
                                           &p, end))
                return 1;
            if (lws_finalize_write_http_header(wsi, buffer + LWS_PRE, &p, end))
                return 1;

            {
                std::lock_guard<std::mutex> lock(g_http_mutex);
                g_http_bodies[wsi] = std::move(body);
            }
            lws_callback_on_writable(wsi);
            return 0;
        }

        lws_return_http_status(wsi, HTTP_STATUS_NOT_FOUND, nullptr);
        return -1;
    }

    case LWS_CALLBACK_HTTP_WRITEABLE: {
        std::string body;
        {
            std::lock_guard<std::mutex> lock(g_http_mutex);
            auto it = g_http_bodies.find(wsi);
            if (it == g_http_bodies.end())
                return -1;
            body = std::move(it->second);
            g_http_bodies.erase(it);
        }

        std::vector<unsigned char> buffer(LWS_PRE + body.size());
        memcpy(buffer.data() + LWS_PRE, body.data(), body.size());
        int n = static_cast<int>(body.size());
        if (lws_write(wsi, buffer.data() + LWS_PRE, body.size(), LWS_WRITE_HTTP_FINAL) != n)
            return 1;

        if (lws_http_transaction_completed(wsi))
            return -1;
        return 0;
    }

    case LWS_CALLBACK_CLOSED_HTTP: {
        std::lock_guard<std::mutex> lock(g_http_mutex);
        g_http_bodies.erase(wsi);
        break;
    }

    case LWS_CALLBACK_EVENT_WAIT_CANCELLED:
        request_event_writes(wsi);
        break;

    default:
        break;
    }

    return 0;
}

static int callback_events(lws *wsi, enum lws_callback_reasons reason,
                           void *user, void *in, size_t len) {
    EventClient *client = nullptr;

    switch (reason) {
    case LWS_CALLBACK_ESTABLISHED: {
        client = new EventClient{wsi, {}, {}};

        std::lock_guard<std::mutex> lock(g_clients_mutex);
        g_clients[wsi] = client;

        MindRun::log_notice("EventServer", "client connected (" + std::to_string(g_clients.size()) + " total)");
        break;
    }

    case LWS_CALLBACK_CLOSED: {
        std::lock_guard<std::mutex> lock(g_clients_mutex);
        auto it = g_clients.find(wsi);
        if (it != g_clients.end()) {
            delete it->second;
            g_clients.erase(it);
        }

        MindRun::log_notice("EventServer", "client disconnected");
        break;
    }

    case LWS_CALLBACK_RECEIVE: {
        std::string request(static_cast<const char*>(in), len);
        request = MindRun::trim_copy(request);

        std::vector<std::string> reply;
        {
            std::lock_guard<std::mutex> lock(g_callbacks_mutex);
            if (g_request_callback) {
                try {
                    reply = g_request_callback(request);
                } catch (const std::exception& e) {
                    reply.push_back(std::string("{\"error\":\"") + MindRun::json_escape(e.what()) + "\"}");
                }
            }
        }
        if (reply.empty())
            break;

        std::lock_guard<std::mutex> lock(g_clients_mutex);
        auto it = g_clients.find(wsi);
        if (it == g_clients.end())
            break;
        client = it->second;
        {
            std::lock_guard<std::mutex> msg_lock(client->mutex);
            for (auto& line : reply)
                client->outgoing_messages.push(std::move(line));
        }
        lws_callback_on_writable(wsi);
        break;
    }

    case LWS_CALLBACK_SERVER_WRITEABLE: {
        std::lock_guard<std::mutex> lock(g_clients_mutex);
        auto it = g_clients.find(wsi);
        if (it == g_clients.end())
            break;

        client = it->second;

        std::lock_guard<std::mutex> msg_lock(client->mutex);
        if (client->outgoing_messages.empty())
            break;

        std::string msg = std::move(client->outgoing_messages.front());
        client->outgoing_messages.pop();

        std::vector<unsigned char> buffer(LWS_PRE + msg.size());
        memcpy(buffer.data() + LWS_PRE, msg.data(), msg.size());
        if (lws_write(wsi, buffer.data() + LWS_PRE, msg.size(), LWS_WRITE_TEXT) < static_cast<int>(msg.size()))
            return -1;

        if (!client->outgoing_messages.empty())
            lws_callback_on_writable(wsi);
        break;
    }

    case LWS_CALLBACK_EVENT_WAIT_CANCELLED:
        request_event_writes(wsi);
        break;

    default:
        break;
    }

    return 0;
}

static struct lws_protocols protocols[] = {
    {
        "http",
        callback_http,
        0,
        0,
        0, nullptr, 0
    },
    {
        "mindrun-events",
        callback_events,
        0,
        4096,
        0, nullptr, 0
    },
    LWS_PROTOCOL_LIST_TERM
};

static void server_thread_func(int port) {
    struct lws_context_creation_info info;
    memset(&info, 0, sizeof(info));

    info.port = port;
    info.protocols = protocols;
    info.gid = -1;
    info.uid = -1;
    info.options = LWS_SERVER_OPTION_VALIDATE_UTF8;

    lws_context* ctx = lws_create_context(&info);
    if (!ctx) {
        MindRun::log_warning("EventServer", "failed to create libwebsockets context");
        g_server_running = false;
        return;
    }
    g_lws_context = ctx;

    MindRun::log_notice("EventServer", "listening on ws://localhost:" + std::to_string(port) + "/ (status: http://localhost:" +
                        std::to_string(port) + "/status)");

    while (g_server_running) {
        lws_service(ctx, 50);
    }

    g_lws_context = nullptr;
    lws_context_destroy(ctx);
}

namespace EventServer {

bool start(int port) {
    if (g_server_running) {
        MindRun::log_warning("EventServer", "server already running");
        return false;
    }

    g_server_running = true;
    g_server_thread = std::thread(server_thread_func, port);

    return true;
}

void stop() {
    if (!g_server_running && !g_server_thread.joinable())
        return;

    g_server_running = false;
    wake_service();

    if (g_server_thread.joinable())
        g_server_thread.join();

    std::lock_guard<std::mutex> lock(g_clients_mutex);
    for (auto& pair : g_clients) {
        delete pair.second;
    }
    g_clients.clear();
}

bool is_running() {
    return g_server_running;
}

size_t client_count() {
    std::lock_guard<std::mutex> lock(g_clients_mutex);
    return g_clients.size();
}

void broadcast(const std::string& line) {
    {
        std::lock_guard<std::mutex> lock(g_clients_mutex);
        if (g_clients.empty())
            return;
        for (auto& pair : g_clients) {
            EventClient* client = pair.second;
            std::lock_guard<std::mutex> msg_lock(client->mutex);
            client->outgoing_messages.push(line);
        }
    }
    wake_service();
}

void set_request_callback(RequestCallback callback) {
    std::lock_guard<std::mutex> lock(g_callbacks_mutex);
    g_request_callback = std::move(callback);
}

void set_status_callback(StatusCallback callback) {
    std::lock_guard<std::mutex> lock(g_callbacks_mutex);
    g_status_callback = std::move(callback);
}

} // namespace EventServer
