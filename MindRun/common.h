#pragma once


// Tracing (optional debug feature)
#ifdef MINDRUN_TRACE
namespace mindrun_trace {
    void log_line(const std::string& line);

    inline std::string concat(){ return {}; }

    template<typename... Args>
    std::string concat(Args&&... args){
        std::ostringstream oss;
        (oss << ... << std::forward<Args>(args));
        return oss.str();
    }

    struct Scope {
        std::string name;
        Scope(const char* fn, const std::string& details);
        ~Scope();
    };

    void log_loop(const char* tag, const std::string& details);
}

#define MINDRUN_TRACE_CAT(a,b) MINDRUN_TRACE_CAT_1(a,b)
#define MINDRUN_TRACE_CAT_1(a,b) a##b

#define TRACE_FN(...) auto MINDRUN_TRACE_CAT(_mindrun_trace_scope_, __LINE__) = ::mindrun_trace::Scope(__func__, ::mindrun_trace::concat(__VA_ARGS__))
#define TRACE_MSG(...) ::mindrun_trace::log_line(::mindrun_trace::concat(__VA_ARGS__))
#define TRACE_LOOP(tag, ...) ::mindrun_trace::log_loop(tag, ::mindrun_trace::concat(__VA_ARGS__))
#else
#define TRACE_FN(...) (void)0
#define TRACE_MSG(...) (void)0
#define TRACE_LOOP(...) (void)0
#endif

namespace MindRun {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Millis = std::chrono::milliseconds;

// String utilities
std::string trim_copy(const std::string& s);
std::string json_escape(const std::string& s);
std::string json_unescape(const std::string& s);
std::string extract_json_field(const std::string& json_str, const std::string& field_name);
std::vector<std::string> split_words(const std::string& s);

size_t parse_size_arg(const std::string& s, const char* ctx);

// Time utilities. Timestamps are rendered as UTC "YYYY-MM-DDTHH:MM:SS.mmmZ".
std::string format_timestamp(TimePoint tp);
std::optional<TimePoint> parse_timestamp(const std::string& text);

// Hash utilities (BLAKE3)
std::string compute_string_hash(const std::string& data);

// File utilities
void write_file_atomic(const std::filesystem::path& path, const std::string& content);
std::string read_file(const std::filesystem::path& path);
bool ensure_dir_exists(const std::filesystem::path& path);

// Operational log lines: "[Component] message"
void log_notice(const char* component, const std::string& message);
void log_warning(const char* component, const std::string& message);
void set_quiet(bool quiet);

} // namespace MindRun
