#include "MindRun.h"
#include "inspect.h"
#include "event_server.h"
#include <csignal>

using namespace MindRun;

namespace {

std::atomic<bool> g_stop{false};

void handle_signal(int){
    g_stop = true;
}

const char* usage_text =
R"(usage: mindrun [--state-dir DIR] [--quiet] <command> [args]

Commands:
  sessions [--all]              session table (active only unless --all)
  events <session_id> [after]   events of one stream after an event id
  feed [n]                      n most recent events across all streams
  chain <snapshot_id>           snapshot ancestry back to the root
  show <snapshot_id>            snapshot manifest and payload
  watch [--refresh MS]          live ncurses dashboard
  serve [--port N]              WebSocket event push server (default port 8080)

The state directory defaults to $MINDRUN_STATE_DIR or ./mindrun_state.
)";

int usage(const std::string& msg){
    if(!msg.empty()) std::cerr << msg << "\n";
    std::cerr << usage_text;
    return 1;
}

uint64_t parse_u64(const std::string& text, const char* what){
    return static_cast<uint64_t>(parse_size_arg(text, what));
}

int cmd_sessions(StateReader& reader, const std::vector<std::string>& args){
    bool all = !args.empty() && args[0] == "--all";
    reader.reload();
    auto sessions = all ? reader.sessions().list_all() : reader.sessions().list_active();
    std::cout << format_session_table(sessions);
    return 0;
}

int cmd_events(StateReader& reader, const std::vector<std::string>& args){
    if(args.empty()) return usage("events requires a session id");
    uint64_t after = args.size() > 1 ? parse_u64(args[1], "after_event_id") : 0;
    reader.reload();
    std::cout << format_feed(reader.events().events_since(args[0], after));
    return 0;
}

int cmd_feed(StateReader& reader, const std::vector<std::string>& args){
    size_t n = args.empty() ? 20 : parse_size_arg(args[0], "feed length");
    reader.reload();
    std::cout << format_feed(reader.events().recent(n));
    return 0;
}

int cmd_chain(StateReader& reader, const std::vector<std::string>& args){
    if(args.empty()) return usage("chain requires a snapshot id");
    reader.reload();
    auto& store = reader.snapshots();
    for(const auto& id : store.chain(args[0])){
        Snapshot snap = store.get(id);
        std::cout << id << "  " << format_timestamp(snap.captured_at) << "  " << snap.session_id
                  << "  " << snap.encoding << "  " << snap.size << " bytes\n";
    }
    return 0;
}

int cmd_show(StateReader& reader, const std::vector<std::string>& args){
    if(args.empty()) return usage("show requires a snapshot id");
    reader.reload();
    auto& store = reader.snapshots();
    Snapshot snap = store.get(args[0]);
    std::cout << render_manifest(snap, store.chain(args[0]));
    SnapshotPayload payload = store.restore(args[0]);
    std::cout << "payload:\n" << payload.bytes;
    if(!payload.bytes.empty() && payload.bytes.back() != '\n') std::cout << "\n";
    return 0;
}

int cmd_watch(StateReader& reader, const std::vector<std::string>& args){
    Millis refresh(1000);
    for(size_t i = 0; i < args.size(); ++i){
        if(args[i] == "--refresh"){
            if(i + 1 >= args.size()) return usage("--refresh requires milliseconds");
            refresh = Millis(static_cast<Millis::rep>(parse_size_arg(args[++i], "--refresh")));
            continue;
        }
        return usage("unknown watch option " + args[i]);
    }
    return run_dashboard(reader, refresh) ? 0 : 1;
}

std::vector<std::string> replay_lines(StateReader& reader, const std::string& request){
    auto words = split_words(request);
    std::vector<std::string> lines;
    if(words.empty() || words[0] != "replay"){
        lines.push_back("{\"error\":\"unknown request; expected replay [session_id after_event_id]\"}");
        return lines;
    }
    std::vector<Event> events;
    if(words.size() == 1){
        events = reader.events().recent(std::numeric_limits<size_t>::max());
    } else {
        uint64_t after = words.size() > 2 ? parse_u64(words[2], "after_event_id") : 0;
        events = reader.events().events_since(words[1], after);
    }
    for(const auto& ev : events) lines.push_back(ev.to_json());
    return lines;
}

int cmd_serve(StateReader& reader, const std::vector<std::string>& args){
    int port = 8080;
    for(size_t i = 0; i < args.size(); ++i){
        if(args[i] == "--port" || args[i] == "-p"){
            if(i + 1 >= args.size()) return usage("--port requires a port number");
            size_t p = parse_size_arg(args[++i], "--port");
            if(p == 0 || p > 65535) return usage("--port out of range");
            port = static_cast<int>(p);
            continue;
        }
        return usage("unknown serve option " + args[i]);
    }

    reader.reload();
    std::mutex reader_mutex;

    size_t token = reader.events().subscribe([](const Event& ev){
        EventServer::broadcast(ev.to_json());
    });
    EventServer::set_request_callback([&reader, &reader_mutex](const std::string& request){
        std::lock_guard<std::mutex> lock(reader_mutex);
        return replay_lines(reader, request);
    });
    EventServer::set_status_callback([&reader, &reader_mutex](){
        std::lock_guard<std::mutex> lock(reader_mutex);
        return "clients: " + std::to_string(EventServer::client_count()) + "\n\n" +
               format_session_table(reader.sessions().list_all());
    });

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    if(!EventServer::start(port)) return 1;

    while(!g_stop && EventServer::is_running()){
        std::this_thread::sleep_for(Millis(500));
        std::lock_guard<std::mutex> lock(reader_mutex);
        try{
            reader.reload();
        } catch(const MindRunError& e){
            log_warning("mindrun", e.what());
        }
    }

    EventServer::stop();
    reader.events().unsubscribe(token);
    EventServer::set_request_callback(nullptr);
    EventServer::set_status_callback(nullptr);
    return 0;
}

} // namespace

int main(int argc, char** argv){
    TRACE_FN();
    std::vector<std::string> args(argv + 1, argv + argc);

    SupervisorConfig cfg;
    try{
        cfg = SupervisorConfig::from_env();
        args = cfg.merge_with_cli(args);
    } catch(const std::exception& e){
        return usage(e.what());
    }
    set_quiet(cfg.quiet);

    if(args.empty()) return usage("");
    std::string command = args.front();
    args.erase(args.begin());
    if(command == "help" || command == "--help" || command == "-h"){
        std::cout << usage_text;
        return 0;
    }

    StateReader reader(cfg.state_dir);
    try{
        if(command == "sessions") return cmd_sessions(reader, args);
        if(command == "events") return cmd_events(reader, args);
        if(command == "feed") return cmd_feed(reader, args);
        if(command == "chain") return cmd_chain(reader, args);
        if(command == "show") return cmd_show(reader, args);
        if(command == "watch") return cmd_watch(reader, args);
        if(command == "serve") return cmd_serve(reader, args);
    } catch(const NotFound& e){
        std::cerr << "not found: " << e.what() << "\n";
        return 2;
    } catch(const std::exception& e){
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
    return usage("unknown command '" + command + "'");
}
