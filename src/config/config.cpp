#include "config/config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <string>

namespace loopscribe {

using std::string;

static inline void trim_inplace(string& s) {
    auto not_space = [](unsigned char ch){ return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
}

static inline string unquote(const string& s) {
    if (s.size() >= 2 && ((s.front()=='"' && s.back()=='"') || (s.front()=='\'' && s.back()=='\''))) {
        return s.substr(1, s.size()-2);
    }
    return s;
}

static inline bool ieq(const string& a, const string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i=0;i<a.size();++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
    return true;
}

// std::sto* accept trailing garbage; config values must parse completely.
template <typename T, typename Parse>
static T parse_whole(const string& key, const string& s, int line_no, Parse parse) {
    const string msg = "line " + std::to_string(line_no) + ": invalid value for '" + key + "': " + s;
    size_t used = 0;
    T v{};
    try {
        v = parse(s, &used);
    } catch (const std::logic_error&) { // invalid_argument, out_of_range
        throw ConfigError(msg);
    }
    if (used != s.size()) throw ConfigError(msg);
    return v;
}

// std::stoul wraps a leading '-' around, so parse signed and range-check.
unsigned long parse_chunk_size(const std::string& value) {
    const string msg = "chunk_size must be a positive integer: " + value;
    size_t used = 0;
    long long v = 0;
    try {
        v = std::stoll(value, &used);
    } catch (const std::logic_error&) {
        throw ConfigError(msg);
    }
    if (used != value.size() || v <= 0
        || static_cast<unsigned long long>(v) > std::numeric_limits<unsigned long>::max()) {
        throw ConfigError(msg);
    }
    return static_cast<unsigned long>(v);
}

std::string expand_path(const std::string& p) {
    if (p.size() >= 2 && p[0] == '~' && p[1] == '/') {
        const char* home = std::getenv("HOME");
        if (home && *home) return string(home) + p.substr(1);
    }
    return p;
}

std::string default_config_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return string(xdg) + "/loopscribe/loopscribe.toml";
    const char* home = std::getenv("HOME");
    string base = home ? string(home) + "/.config" : string(".config");
    return base + "/loopscribe/loopscribe.toml";
}

AppConfig load_config_file(const std::string& path) {
    AppConfig cfg;
    std::ifstream f(path);
    if (!f.good()) return cfg; // missing is fine

    string line;
    int line_no = 0;
    while (std::getline(f, line)) {
        ++line_no;
        // strip comments
        auto pos_hash = line.find('#');
        auto pos_sc   = line.find(';');
        auto pos_cmt  = std::min(pos_hash == string::npos ? line.size() : pos_hash,
                                  pos_sc   == string::npos ? line.size() : pos_sc);
        line = line.substr(0, pos_cmt);
        trim_inplace(line);
        if (line.empty() || line.front() == '[') continue;

        // allow 'key = value' or 'key: value'
        size_t sep = line.find('=');
        if (sep == string::npos) sep = line.find(':');
        if (sep == string::npos) continue;

        string key = line.substr(0, sep);
        string val = line.substr(sep+1);
        trim_inplace(key);
        trim_inplace(val);
        if (key.empty() || val.empty()) continue;
        val = unquote(val);

        auto as_int = [&](const string& s) {
            return parse_whole<int>(key, s, line_no, [](const string& v, size_t* n) { return std::stoi(v, n); });
        };
        auto as_frames = [&](const string& s) {
            try {
                return parse_chunk_size(s);
            } catch (const ConfigError& e) {
                throw ConfigError("line " + std::to_string(line_no) + ": " + e.what());
            }
        };
        auto as_double = [&](const string& s) {
            return parse_whole<double>(key, s, line_no, [](const string& v, size_t* n) { return std::stod(v, n); });
        };

        if (ieq(key, "input_device") || ieq(key, "device")) cfg.input_device = as_int(val);
        else if (ieq(key, "output_device")) cfg.output_device = as_int(val);
        else if (ieq(key, "sample_rate")) cfg.sample_rate = as_int(val);
        else if (ieq(key, "chunk_size") || ieq(key, "frames_per_buffer")) cfg.chunk_size = as_frames(val);
        else if (ieq(key, "chunk_duration")) cfg.chunk_duration = as_double(val);
        else if (ieq(key, "overlap_duration") || ieq(key, "overlap")) cfg.overlap_duration = as_double(val);
        else if (ieq(key, "block_gate")) cfg.block_gate = as_double(val);
        else if (ieq(key, "model_path")) cfg.model_path = expand_path(val);
        else if (ieq(key, "language")) cfg.language = val;
        else if (ieq(key, "threads")) cfg.threads = as_int(val);
        else if (ieq(key, "stop_timeout_ms")) cfg.stop_timeout_ms = as_int(val);
        else if (ieq(key, "db_path")) cfg.db_path = expand_path(val);
    }
    return cfg;
}

AppConfig merge_config(const AppConfig& base, const AppConfig& overrides) {
    AppConfig out = base;
    auto take = [](auto& dst, const auto& src) { if (src) dst = src; };
    take(out.input_device, overrides.input_device);
    take(out.output_device, overrides.output_device);
    take(out.sample_rate, overrides.sample_rate);
    take(out.chunk_size, overrides.chunk_size);
    take(out.chunk_duration, overrides.chunk_duration);
    take(out.overlap_duration, overrides.overlap_duration);
    take(out.block_gate, overrides.block_gate);
    take(out.model_path, overrides.model_path);
    take(out.language, overrides.language);
    take(out.threads, overrides.threads);
    take(out.stop_timeout_ms, overrides.stop_timeout_ms);
    take(out.db_path, overrides.db_path);
    return out;
}

Settings resolve_settings(const AppConfig& cfg) {
    Settings s;
    s.sample_rate = cfg.sample_rate.value_or(s.sample_rate);
    s.chunk_size = cfg.chunk_size.value_or(s.chunk_size);
    s.chunk_duration = cfg.chunk_duration.value_or(s.chunk_duration);
    s.overlap_duration = cfg.overlap_duration.value_or(s.overlap_duration);
    s.block_gate = cfg.block_gate.value_or(s.block_gate);
    s.input_device = cfg.input_device;
    s.output_device = cfg.output_device;
    s.model_path = cfg.model_path.value_or(s.model_path);
    s.language = cfg.language.value_or(s.language);
    s.threads = cfg.threads.value_or(s.threads);
    if (cfg.stop_timeout_ms) s.stop_timeout = std::chrono::milliseconds(*cfg.stop_timeout_ms);
    s.db_path = cfg.db_path;

    if (s.sample_rate <= 0) {
        throw ConfigError("sample_rate must be a positive integer");
    }
    if (s.chunk_size == 0) {
        throw ConfigError("chunk_size must be a positive integer");
    }
    if (!std::isfinite(s.chunk_duration) || s.chunk_duration <= 0.0) {
        throw ConfigError("chunk_duration must be positive");
    }
    if (!std::isfinite(s.overlap_duration) || s.overlap_duration < 0.0
        || s.overlap_duration >= s.chunk_duration) {
        throw ConfigError("overlap_duration must be >= 0 and smaller than chunk_duration");
    }
    // Window sizes are truncated to whole samples; both must stay consistent.
    const auto chunk_samples = static_cast<long long>(s.chunk_duration * s.sample_rate);
    const auto overlap_samples = static_cast<long long>(s.overlap_duration * s.sample_rate);
    if (chunk_samples <= 0 || overlap_samples >= chunk_samples) {
        throw ConfigError("chunk_duration is too short for sample_rate " + std::to_string(s.sample_rate));
    }
    if (s.block_gate < 0.0) {
        throw ConfigError("block_gate must not be negative");
    }
    if ((s.input_device && *s.input_device < 0) || (s.output_device && *s.output_device < 0)) {
        throw ConfigError("device indices must be non-negative");
    }
    if (s.threads <= 0) {
        throw ConfigError("threads must be positive");
    }
    if (s.stop_timeout.count() <= 0) {
        throw ConfigError("stop_timeout_ms must be positive");
    }
    return s;
}

} // namespace loopscribe
