#pragma once

// Pushes supervision events to WebSocket clients (protocol "mindrun-events")
// and serves a plain status page over HTTP.
namespace EventServer {
    // Handles a text request from a client ("replay", "replay <session> <after>")
    // and returns the lines to send back to that client only.
    using RequestCallback = std::function<std::vector<std::string>(const std::string&)>;
    using StatusCallback = std::function<std::string()>;

    bool start(int port);
    void stop();
    bool is_running();
    size_t client_count();

    // Queue one line for every connected client.
    void broadcast(const std::string& line);

    void set_request_callback(RequestCallback callback);
    void set_status_callback(StatusCallback callback);
}
