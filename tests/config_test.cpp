#include "config/config.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace loopscribe;

namespace {

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path()
               / ("loopscribe_config_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed())
                  + "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(dir_);
    }
    void TearDown() override { std::filesystem::remove_all(dir_); }

    std::string write(const std::string& content) {
        const auto path = dir_ / "loopscribe.toml";
        std::ofstream(path) << content;
        return path.string();
    }

    std::filesystem::path dir_;
};

} // namespace

TEST_F(ConfigFileTest, MissingFileIsEmpty) {
    AppConfig cfg = load_config_file((dir_ / "nope.toml").string());
    EXPECT_FALSE(cfg.sample_rate);
    EXPECT_FALSE(cfg.input_device);
    EXPECT_FALSE(cfg.model_path);
}

TEST_F(ConfigFileTest, ParsesKeysCommentsAndQuotes) {
    const std::string path = write(
        "# capture\n"
        "[capture]\n"
        "sample_rate = 16000\n"
        "frames_per_buffer: 512   ; alias\n"
        "chunk_duration = 2.0\n"
        "overlap_duration = 0.5\n"
        "input_device = 3\n"
        "output_device = 7\n"
        "model_path = \"models/ggml-base.bin\"\n"
        "language = 'en'\n"
        "threads = 2\n"
        "stop_timeout_ms = 1500\n"
        "block_gate = 0.002\n"
        "unknown_key = whatever\n");
    AppConfig cfg = load_config_file(path);
    EXPECT_EQ(cfg.sample_rate, 16000);
    EXPECT_EQ(cfg.chunk_size, 512ul);
    EXPECT_DOUBLE_EQ(*cfg.chunk_duration, 2.0);
    EXPECT_DOUBLE_EQ(*cfg.overlap_duration, 0.5);
    EXPECT_EQ(cfg.input_device, 3);
    EXPECT_EQ(cfg.output_device, 7);
    EXPECT_EQ(cfg.model_path, std::string("models/ggml-base.bin"));
    EXPECT_EQ(cfg.language, std::string("en"));
    EXPECT_EQ(cfg.threads, 2);
    EXPECT_EQ(cfg.stop_timeout_ms, 1500);
    EXPECT_DOUBLE_EQ(*cfg.block_gate, 0.002);
}

TEST_F(ConfigFileTest, BadNumberNamesTheLine) {
    const std::string path = write("sample_rate = 16000\nchunk_size = lots\n");
    try {
        load_config_file(path);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("line 2"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("chunk_size"), std::string::npos);
    }
    EXPECT_THROW(load_config_file(write("sample_rate = 16k\n")), ConfigError);
}

TEST_F(ConfigFileTest, NegativeChunkSizeIsRejected) {
    try {
        load_config_file(write("chunk_size = -1\n"));
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("line 1"), std::string::npos);
    }
    EXPECT_THROW(load_config_file(write("frames_per_buffer = 0\n")), ConfigError);
    EXPECT_EQ(load_config_file(write("chunk_size = 512\n")).chunk_size, 512ul);
}

TEST(ConfigTest, DefaultsMatchCanonicalValues) {
    Settings s = resolve_settings(AppConfig{});
    EXPECT_EQ(s.sample_rate, 16000);
    EXPECT_EQ(s.chunk_size, 1024ul);
    EXPECT_DOUBLE_EQ(s.chunk_duration, 3.0);
    EXPECT_DOUBLE_EQ(s.overlap_duration, 0.5);
    EXPECT_DOUBLE_EQ(s.block_gate, 0.001);
    EXPECT_EQ(s.model_path, "models/ggml-tiny.bin");
    EXPECT_EQ(s.language, "es");
    EXPECT_EQ(s.threads, 4);
    EXPECT_EQ(s.stop_timeout.count(), 2000);
    EXPECT_FALSE(s.input_device);
    EXPECT_FALSE(s.output_device);
}

TEST(ConfigTest, RejectsInvalidValues) {
    auto with = [](auto mutate) {
        AppConfig cfg;
        mutate(cfg);
        return cfg;
    };
    EXPECT_THROW(resolve_settings(with([](AppConfig& c) { c.sample_rate = 0; })), ConfigError);
    EXPECT_THROW(resolve_settings(with([](AppConfig& c) { c.chunk_size = 0ul; })), ConfigError);
    EXPECT_THROW(resolve_settings(with([](AppConfig& c) { c.chunk_duration = 0.0; })), ConfigError);
    EXPECT_THROW(resolve_settings(with([](AppConfig& c) { c.overlap_duration = 3.0; })), ConfigError);
    EXPECT_THROW(resolve_settings(with([](AppConfig& c) { c.overlap_duration = -0.1; })), ConfigError);
    EXPECT_THROW(resolve_settings(with([](AppConfig& c) { c.input_device = -1; })), ConfigError);
    EXPECT_THROW(resolve_settings(with([](AppConfig& c) { c.output_device = -2; })), ConfigError);
    EXPECT_THROW(resolve_settings(with([](AppConfig& c) { c.threads = 0; })), ConfigError);
    EXPECT_NO_THROW(resolve_settings(with([](AppConfig& c) { c.overlap_duration = 0.0; })));

    EXPECT_THROW(parse_chunk_size("-1"), ConfigError);
    EXPECT_THROW(parse_chunk_size("0"), ConfigError);
    EXPECT_THROW(parse_chunk_size("12abc"), ConfigError);
    EXPECT_THROW(parse_chunk_size(""), ConfigError);
    EXPECT_EQ(parse_chunk_size("1024"), 1024ul);
}

TEST(ConfigTest, OverridesWin) {
    AppConfig file;
    file.sample_rate = 44100;
    file.language = "en";
    AppConfig cli;
    cli.sample_rate = 16000;
    cli.input_device = 2;

    AppConfig merged = merge_config(file, cli);
    EXPECT_EQ(merged.sample_rate, 16000);
    EXPECT_EQ(merged.language, std::string("en"));
    EXPECT_EQ(merged.input_device, 2);
}

TEST(ConfigTest, ExpandsHome) {
    const char* home = std::getenv("HOME");
    if (!home || !*home) GTEST_SKIP() << "HOME not set";
    EXPECT_EQ(expand_path("~/models/x.bin"), std::string(home) + "/models/x.bin");
    EXPECT_EQ(expand_path("/abs/path"), "/abs/path");
    EXPECT_EQ(expand_path("~user/x"), "~user/x");
}

TEST(ConfigTest, DefaultPathUsesXdg) {
    ::setenv("XDG_CONFIG_HOME", "/tmp/xdg-test", 1);
    EXPECT_EQ(default_config_path(), "/tmp/xdg-test/loopscribe/loopscribe.toml");
    ::unsetenv("XDG_CONFIG_HOME");
}
