#pragma once
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

namespace loopscribe {

// Thrown when a configured value cannot be used.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Values from the config file and the command line; unset means "use the default".
struct AppConfig {
    std::optional<int> input_device;               // -d / --device
    std::optional<int> output_device;              // -o / --output-device
    std::optional<int> sample_rate;                // --sr
    std::optional<unsigned long> chunk_size;       // --chunk-size (frames per buffer)

    std::optional<double> chunk_duration;          // --chunk-duration
    std::optional<double> overlap_duration;        // --overlap
    std::optional<double> block_gate;

    std::optional<std::string> model_path;         // --model
    std::optional<std::string> language;           // --language
    std::optional<int> threads;                    // --threads

    std::optional<int> stop_timeout_ms;
    std::optional<std::string> db_path;            // --db
};

// Fully validated settings.
struct Settings {
    int sample_rate = 16000;
    unsigned long chunk_size = 1024;
    double chunk_duration = 3.0;
    double overlap_duration = 0.5;
    double block_gate = 0.001;
    std::optional<int> input_device;
    std::optional<int> output_device;
    std::string model_path = "models/ggml-tiny.bin";
    std::string language = "es";
    int threads = 4;
    std::chrono::milliseconds stop_timeout{2000};
    std::optional<std::string> db_path;
};

// Returns $XDG_CONFIG_HOME/loopscribe/loopscribe.toml or ~/.config/loopscribe/loopscribe.toml
std::string default_config_path();

// Load config file if it exists. Simple TOML/INI-like: key = value
// Supports comments starting with '#' or ';'. Strings may be quoted.
// Missing file returns an empty AppConfig (all optionals disengaged).
// A value that does not parse throws ConfigError naming the line.
AppConfig load_config_file(const std::string& path);

// Values set in `overrides` win.
AppConfig merge_config(const AppConfig& base, const AppConfig& overrides);

// Fills defaults and validates; throws ConfigError.
Settings resolve_settings(const AppConfig& cfg);

// Parses a frames-per-buffer count; anything but a positive integer throws ConfigError.
unsigned long parse_chunk_size(const std::string& value);

// Expand leading '~/' in paths using $HOME.
std::string expand_path(const std::string& p);

} // namespace loopscribe
