#include "MindRun.h"
#include "inspect.h"
#define NCURSES_NOMACROS
#include <ncurses.h>

namespace fs = std::filesystem;

namespace MindRun {

StateReader::StateReader(fs::path state_dir)
    : dir_(std::move(state_dir)),
      events_(dir_ / "events"),
      sessions_(dir_ / "sessions", drivers_, events_, Millis(1)),
      snapshots_(dir_ / "snapshots") {}

void StateReader::reload(){
    std::error_code ec;
    if(!fs::is_directory(dir_, ec)){
        throw PersistError("no state directory at " + dir_.string());
    }
    if(!loaded_){
        events_.load(true);
        loaded_ = true;
    } else {
        events_.poll_logs();
    }
    sessions_.load(true);
    snapshots_.load(true);
}

std::string format_session_row(const Session& s){
    std::ostringstream oss;
    oss << std::left << std::setw(13) << s.session_id << " "
        << std::setw(9) << kind_label(s.kind) << " "
        << std::setw(17) << state_label(s.state) << " "
        << std::setw(25) << (s.last_health_at ? format_timestamp(*s.last_health_at) : std::string("-")) << " "
        << std::setw(13) << (s.last_snapshot_ref ? s.last_snapshot_ref->substr(0, 12) : std::string("-"));
    if(!s.detail.empty()) oss << " " << s.detail;
    return oss.str();
}

std::string format_session_table(const std::vector<Session>& sessions){
    if(sessions.empty()) return "(no sessions)\n";
    std::ostringstream oss;
    oss << std::left << std::setw(13) << "SESSION" << " "
        << std::setw(9) << "KIND" << " "
        << std::setw(17) << "STATE" << " "
        << std::setw(25) << "LAST HEALTH" << " "
        << std::setw(13) << "SNAPSHOT" << " DETAIL\n";
    for(const auto& s : sessions) oss << format_session_row(s) << "\n";
    return oss.str();
}

namespace {
    int state_color(SessionState state){
        switch(state){
            case SessionState::Running: return 1;
            case SessionState::Starting:
            case SessionState::Degraded: return 2;
            case SessionState::Lost:
            case SessionState::TerminalFailure:
            case SessionState::Failed: return 3;
            case SessionState::Terminated: return 5;
        }
        return 5;
    }

    int event_color(EventKind kind){
        switch(kind){
            case EventKind::Started:
            case EventKind::Recovered: return 1;
            case EventKind::Degraded: return 2;
            case EventKind::Lost:
            case EventKind::TerminalFailure:
            case EventKind::StartFailed: return 3;
            case EventKind::SnapshotCaptured: return 4;
            case EventKind::Terminated: return 5;
        }
        return 5;
    }

    void print_clipped(WINDOW* win, int y, int x, const std::string& text, int width, int color){
        std::string line = width > 0 && static_cast<int>(text.size()) > width ? text.substr(0, width) : text;
        if(has_colors() && color > 0){
            wattron(win, COLOR_PAIR(color));
            mvwprintw(win, y, x, "%s", line.c_str());
            wattroff(win, COLOR_PAIR(color));
        } else {
            mvwprintw(win, y, x, "%s", line.c_str());
        }
    }
}

bool run_dashboard(StateReader& reader, Millis interval){
    TRACE_FN("state_dir=", reader.state_dir().string());
    reader.reload();

    initscr();
    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    curs_set(0);

    if (has_colors()) {
        start_color();
        init_pair(1, COLOR_GREEN, COLOR_BLACK);    // running / recovered
        init_pair(2, COLOR_YELLOW, COLOR_BLACK);   // degraded / starting
        init_pair(3, COLOR_RED, COLOR_BLACK);      // lost / failures
        init_pair(4, COLOR_CYAN, COLOR_BLACK);     // snapshots, header
        init_pair(5, COLOR_WHITE, COLOR_BLACK);    // terminated
    }

    int max_y = 0, max_x = 0;
    WINDOW* header_win = nullptr;
    WINDOW* list_win = nullptr;
    WINDOW* feed_win = nullptr;
    int list_height = 0;

    auto layout = [&]() {
        if (header_win) delwin(header_win);
        if (list_win) delwin(list_win);
        if (feed_win) delwin(feed_win);
        getmaxyx(stdscr, max_y, max_x);
        list_height = std::max(4, std::min(14, max_y / 2));
        header_win = newwin(1, max_x, 0, 0);
        list_win = newwin(list_height, max_x, 1, 0);
        feed_win = newwin(std::max(3, max_y - list_height - 1), max_x, list_height + 1, 0);
        clear();
        refresh();
    };
    layout();

    std::string load_error;
    bool running = true;
    while (running) {
        auto sessions = reader.sessions().list_all();
        size_t active = 0;
        for (const auto& s : sessions) if (!is_terminal(s.state)) ++active;

        werase(header_win);
        wattron(header_win, A_REVERSE);
        std::string header = " MindRun  " + reader.state_dir().string() + "  sessions " +
                             std::to_string(active) + "/" + std::to_string(sessions.size()) +
                             "  snapshots " + std::to_string(reader.snapshots().size()) + "   [q] quit  [r] reload";
        if (!load_error.empty()) header += "  ! " + load_error;
        header.resize(static_cast<size_t>(std::max(0, max_x)), ' ');
        mvwprintw(header_win, 0, 0, "%s", header.c_str());
        wattroff(header_win, A_REVERSE);
        wrefresh(header_win);

        werase(list_win);
        int y = 1;
        int width = max_x - 2;
        for (const auto& s : sessions) {
            if (y >= list_height - 1) break;
            print_clipped(list_win, y++, 1, format_session_row(s), width, state_color(s.state));
        }
        if (sessions.empty()) print_clipped(list_win, 1, 1, "(no sessions)", width, 0);
        box(list_win, 0, 0);
        mvwprintw(list_win, 0, 2, " sessions ");
        wrefresh(list_win);

        werase(feed_win);
        int feed_height = std::max(3, max_y - list_height - 1);
        auto events = reader.events().recent(static_cast<size_t>(std::max(1, feed_height - 2)));
        y = 1;
        for (const auto& ev : events) {
            print_clipped(feed_win, y++, 1, format_event(ev), width, event_color(ev.kind));
        }
        if (events.empty()) print_clipped(feed_win, 1, 1, "(no events)", width, 0);
        box(feed_win, 0, 0);
        mvwprintw(feed_win, 0, 2, " events ");
        wrefresh(feed_win);

        keypad(feed_win, TRUE);
        wtimeout(feed_win, static_cast<int>(interval.count()));
        int ch = wgetch(feed_win);
        if (ch == 'q' || ch == 'Q') {
            running = false;
            continue;
        }
        if (ch == KEY_RESIZE) layout();

        try {
            reader.reload();
            load_error.clear();
        } catch (const MindRunError& e) {
            load_error = e.what();
        }
    }

    delwin(header_win);
    delwin(list_win);
    delwin(feed_win);
    endwin();
    return true;
}

} // namespace MindRun
