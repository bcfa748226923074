#include "MindRun.h"

#include <blake3.h>

#ifdef MINDRUN_TRACE
namespace mindrun_trace {
    namespace {
        std::mutex& trace_mutex(){ static std::mutex m; return m; }
        std::ofstream& trace_stream(){
            static std::ofstream s("mindrun_trace.log", std::ios::app);
            return s;
        }
        void write_line(const std::string& line){
            auto& os = trace_stream();
            os << line << '\n';
            os.flush();
        }
    }

    void log_line(const std::string& line){
        std::lock_guard<std::mutex> lock(trace_mutex());
        write_line(line);
    }

    Scope::Scope(const char* fn, const std::string& details) : name(fn ? fn : "?"){
        if(!name.empty()){
            std::string msg = std::string("enter ") + name;
            if(!details.empty()) msg += " | " + details;
            log_line(msg);
        }
    }

    Scope::~Scope(){
        if(!name.empty()){
            log_line(std::string("exit ") + name);
        }
    }

    void log_loop(const char* tag, const std::string& details){
        std::lock_guard<std::mutex> lock(trace_mutex());
        std::string msg = std::string("loop ") + (tag ? tag : "?");
        if(!details.empty()) msg += " | " + details;
        write_line(msg);
    }
}
#endif

namespace MindRun {

namespace fs = std::filesystem;

// String utilities
std::string trim_copy(const std::string& s){
    size_t a = 0, b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b-1]))) --b;
    return s.substr(a, b - a);
}

std::string json_escape(const std::string& s){
    std::string o; o.reserve(s.size()+8);
    for(char c: s){
        switch(c){
            case '"': o+="\\\""; break;
            case '\\': o+="\\\\"; break;
            case '\n': o+="\\n"; break;
            case '\r': o+="\\r"; break;
            case '\t': o+="\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    o+=buf;
                } else {
                    o+=c;
                }
        }
    }
    return o;
}

std::string json_unescape(const std::string& s){
    std::string o; o.reserve(s.size());
    for(size_t i = 0; i < s.size(); ++i){
        char c = s[i];
        if(c != '\\' || i + 1 >= s.size()){
            o += c;
            continue;
        }
        char n = s[++i];
        switch(n){
            case 'n': o += '\n'; break;
            case 'r': o += '\r'; break;
            case 't': o += '\t'; break;
            case '"': o += '"'; break;
            case '\\': o += '\\'; break;
            case 'u':
                // Only the \u00XX form json_escape writes for control bytes.
                if(i + 4 < s.size() && s.compare(i + 1, 2, "00") == 0 &&
                   std::isxdigit(static_cast<unsigned char>(s[i + 3])) &&
                   std::isxdigit(static_cast<unsigned char>(s[i + 4]))){
                    o += static_cast<char>(std::stoi(s.substr(i + 3, 2), nullptr, 16));
                    i += 4;
                } else {
                    o += '\\'; o += n;
                }
                break;
            default: o += '\\'; o += n;
        }
    }
    return o;
}

// Flat-object field lookup; enough for the one-line records this project writes.
std::string extract_json_field(const std::string& json_str, const std::string& field_name) {
    std::string search = "\"" + field_name + "\"";
    size_t pos = json_str.find(search);
    if (pos == std::string::npos) {
        return "";
    }

    pos += search.length();
    // Skip colon and whitespace
    while (pos < json_str.length() && (json_str[pos] == ':' || std::isspace(static_cast<unsigned char>(json_str[pos])))) {
        pos++;
    }

    if (pos >= json_str.length()) {
        return "";
    }

    char start_char = json_str[pos];
    if (start_char == '"') {
        pos++;
        size_t end_pos = pos;
        while (end_pos < json_str.length() && json_str[end_pos] != '"') {
            if (json_str[end_pos] == '\\' && end_pos + 1 < json_str.length()) {
                end_pos += 2;
                continue;
            }
            end_pos++;
        }

        if (end_pos < json_str.length()) {
            return json_unescape(json_str.substr(pos, end_pos - pos));
        }
    } else if (start_char == 't' || start_char == 'f') {
        if (json_str.compare(pos, 4, "true") == 0) {
            return "true";
        } else if (json_str.compare(pos, 5, "false") == 0) {
            return "false";
        }
    } else if (std::isdigit(static_cast<unsigned char>(start_char)) || start_char == '-') {
        size_t end_pos = pos + 1;
        while (end_pos < json_str.length() && std::isdigit(static_cast<unsigned char>(json_str[end_pos]))) {
            end_pos++;
        }
        return json_str.substr(pos, end_pos - pos);
    }

    return "";
}

std::vector<std::string> split_words(const std::string& s){
    std::vector<std::string> out;
    std::istringstream iss(s);
    std::string word;
    while(iss >> word) out.push_back(word);
    return out;
}

size_t parse_size_arg(const std::string& s, const char* ctx){
    if(s.empty()) throw std::runtime_error(std::string(ctx) + " must be non-negative integer");
    size_t idx = 0;
    while(idx < s.size()){
        if(!std::isdigit(static_cast<unsigned char>(s[idx])))
            throw std::runtime_error(std::string(ctx) + " must be non-negative integer");
        ++idx;
    }
    try{
        return static_cast<size_t>(std::stoull(s));
    } catch(const std::exception&){
        throw std::runtime_error(std::string(ctx) + " out of range");
    }
}

// Time utilities
std::string format_timestamp(TimePoint tp){
    auto ms = std::chrono::duration_cast<Millis>(tp.time_since_epoch()).count();
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    int frac = static_cast<int>(ms % 1000);
    if(frac < 0){ frac += 1000; --secs; }
    std::tm utc{};
    gmtime_r(&secs, &utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &utc);
    std::ostringstream oss;
    oss << buf << '.' << std::setw(3) << std::setfill('0') << frac << 'Z';
    return oss.str();
}

std::optional<TimePoint> parse_timestamp(const std::string& text){
    std::tm utc{};
    int frac = 0;
    int n = std::sscanf(text.c_str(), "%d-%d-%dT%d:%d:%d.%dZ",
                        &utc.tm_year, &utc.tm_mon, &utc.tm_mday,
                        &utc.tm_hour, &utc.tm_min, &utc.tm_sec, &frac);
    if(n < 6) return std::nullopt;
    utc.tm_year -= 1900;
    utc.tm_mon -= 1;
    std::time_t secs = timegm(&utc);
    if(secs == static_cast<std::time_t>(-1)) return std::nullopt;
    return Clock::from_time_t(secs) + Millis(frac);
}

//
// BLAKE3 hash functions
//
std::string compute_string_hash(const std::string& data){
    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, data.data(), data.size());
    uint8_t output[BLAKE3_OUT_LEN];
    blake3_hasher_finalize(&hasher, output, BLAKE3_OUT_LEN);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for(size_t i = 0; i < BLAKE3_OUT_LEN; ++i){
        oss << std::setw(2) << static_cast<unsigned>(output[i]);
    }
    return oss.str();
}

// File utilities
void write_file_atomic(const fs::path& path, const std::string& content){
    TRACE_FN("path=", path.string(), " size=", content.size());
    if(path.has_parent_path() && !ensure_dir_exists(path.parent_path())){
        throw PersistError("cannot create directory for " + path.string());
    }
    static std::atomic<uint64_t> tmp_counter{0};
    fs::path tmp = path;
    tmp += ".tmp." + std::to_string(getpid()) + "." + std::to_string(tmp_counter.fetch_add(1));
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if(!out) throw PersistError("cannot open " + tmp.string() + " for writing");
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if(!out) throw PersistError("write failed: " + tmp.string());
    }
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if(ec){
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw PersistError("rename " + tmp.string() + " failed: " + ec.message());
    }
}

std::string read_file(const fs::path& path){
    std::ifstream in(path, std::ios::binary);
    if(!in) throw PersistError("cannot open " + path.string());
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

bool ensure_dir_exists(const fs::path& path){
    std::error_code ec;
    if(fs::exists(path, ec)) return true;
    fs::create_directories(path, ec);
    if(ec){
        std::cerr << "[MindRun] Failed to create directory " << path.string() << ": " << ec.message() << "\n";
        return false;
    }
    return true;
}

namespace {
    std::atomic<bool> g_quiet{false};
    std::mutex& log_mutex(){ static std::mutex m; return m; }
}

void log_notice(const char* component, const std::string& message){
    if(g_quiet.load(std::memory_order_relaxed)) return;
    std::lock_guard<std::mutex> lock(log_mutex());
    std::cout << "[" << component << "] " << message << std::endl;
}

void log_warning(const char* component, const std::string& message){
    std::lock_guard<std::mutex> lock(log_mutex());
    std::cerr << "[" << component << "] " << message << std::endl;
}

void set_quiet(bool quiet){
    g_quiet.store(quiet, std::memory_order_relaxed);
}

} // namespace MindRun
