#include <cstdlib>
#include <fstream>
#include <string>

#include <gtest/gtest.h>

#include "api_config.hpp"
#include "env_loader.hpp"

namespace citysuggest {

class ConfigTest : public testing::Test {
protected:
    void SetUp() override {
        unsetenv("CITYSUGGEST_DATA");
        unsetenv("CITYSUGGEST_PORT");
        unsetenv("CITYSUGGEST_HOST");
        unsetenv("CITYSUGGEST_RELOAD_TOKEN");
    }
    void TearDown() override { SetUp(); }
};

TEST_F(ConfigTest, CommandLine) {
    ServerConfig cfg;
    ASSERT_TRUE(resolve_server_config({"cities.tsv", "9090"}, {}, cfg));
    ASSERT_EQ(cfg.data_path, fs::path("cities.tsv"));
    ASSERT_EQ(cfg.port, 9090);
    ASSERT_EQ(cfg.host, "0.0.0.0");
}

TEST_F(ConfigTest, Defaults) {
    ServerConfig cfg;
    ASSERT_TRUE(resolve_server_config({"cities.tsv"}, {}, cfg));
    ASSERT_EQ(cfg.port, 8080);
    ASSERT_TRUE(cfg.reload_token.empty());
}

TEST_F(ConfigTest, EnvFileAndEnvironment) {
    std::unordered_map<std::string, std::string> env_file = {
        {"CITYSUGGEST_DATA", "from_file.tsv"},
        {"CITYSUGGEST_PORT", "7000"},
        {"CITYSUGGEST_HOST", "127.0.0.1"},
        {"CITYSUGGEST_RELOAD_TOKEN", "s3cret"},
    };

    ServerConfig cfg;
    ASSERT_TRUE(resolve_server_config({}, env_file, cfg));
    ASSERT_EQ(cfg.data_path, fs::path("from_file.tsv"));
    ASSERT_EQ(cfg.port, 7000);
    ASSERT_EQ(cfg.host, "127.0.0.1");
    ASSERT_EQ(cfg.reload_token, "s3cret");

    // Process environment beats the .env file, command line beats both
    setenv("CITYSUGGEST_PORT", "7100", 1);
    ServerConfig cfg2;
    ASSERT_TRUE(resolve_server_config({}, env_file, cfg2));
    ASSERT_EQ(cfg2.port, 7100);

    ServerConfig cfg3;
    ASSERT_TRUE(resolve_server_config({"cli.tsv", "7200"}, env_file, cfg3));
    ASSERT_EQ(cfg3.data_path, fs::path("cli.tsv"));
    ASSERT_EQ(cfg3.port, 7200);
}

TEST_F(ConfigTest, Rejections) {
    ServerConfig cfg;
    ASSERT_FALSE(resolve_server_config({}, {}, cfg));
    ASSERT_FALSE(resolve_server_config({"cities.tsv", "http"}, {}, cfg));
    ASSERT_FALSE(resolve_server_config({"cities.tsv", "70000"}, {}, cfg));
    ASSERT_FALSE(resolve_server_config({"cities.tsv", "80x"}, {}, cfg));
}

TEST_F(ConfigTest, LoadEnvFile) {
    fs::path p = fs::temp_directory_path() / "citysuggest_config_test.env";
    {
        std::ofstream out(p);
        out << "# comment\n"
            << "\n"
            << "CITYSUGGEST_PORT = 9000\n"
            << "CITYSUGGEST_HOST=\"localhost\"\n"
            << "not a pair\n"
            << "EMPTY=\n";
    }

    auto vars = load_env_file(p);
    fs::remove(p);

    ASSERT_EQ(vars["CITYSUGGEST_PORT"], "9000");
    ASSERT_EQ(vars["CITYSUGGEST_HOST"], "localhost");
    ASSERT_EQ(vars["EMPTY"], "");
    ASSERT_EQ(vars.count("not a pair"), 0u);

    ASSERT_TRUE(load_env_file(fs::temp_directory_path() / "citysuggest_missing.env").empty());
}

} // namespace citysuggest
