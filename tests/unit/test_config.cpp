#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

#include "Config.h"

namespace fs = std::filesystem;
using namespace BlockSync;

TEST(ConfigTest, BasicOperations) {
    Config config;

    config.set("key1", "value1");
    EXPECT_EQ(config.get("key1"), "value1");
    EXPECT_TRUE(config.hasKey("key1"));
    EXPECT_FALSE(config.hasKey("key2"));
    EXPECT_EQ(config.get("key2", "fallback"), "fallback");

    config.setInt("intKey", 42);
    EXPECT_EQ(config.getInt("intKey"), 42);

    config.setSize("blockSize", 4096);
    EXPECT_EQ(config.getSize("blockSize"), 4096u);

    config.setBool("boolKey", true);
    EXPECT_TRUE(config.getBool("boolKey"));
}

TEST(ConfigTest, ParsesCommentsAndWhitespace) {
    Config config;
    config.loadFromString(
        "# server settings\n"
        "  listen_port = 2222  \n"
        "\n"
        "root_directory=/srv/files\n"
        "no delimiter here\n"
        "verbose = yes\n");

    EXPECT_EQ(config.getInt("listen_port"), 2222);
    EXPECT_EQ(config.get("root_directory"), "/srv/files");
    EXPECT_TRUE(config.getBool("verbose"));
    EXPECT_FALSE(config.hasKey("no delimiter here"));
}

TEST(ConfigTest, MalformedNumbersFallBackToDefault) {
    Config config;
    config.loadFromString("port=80x\nsize=-1\nflag=maybe\n");

    EXPECT_EQ(config.getInt("port", 7), 7);
    EXPECT_EQ(config.getSize("size", 16), 16u);
    EXPECT_TRUE(config.getBool("flag", true));
}

TEST(ConfigTest, LayeringRespectsOverrideFlag) {
    Config config;
    config.loadFromString("a=1\nb=2\n");
    config.loadFromString("a=10\nc=3\n", false);

    EXPECT_EQ(config.get("a"), "1");
    EXPECT_EQ(config.get("c"), "3");

    config.loadFromString("a=10\n");
    EXPECT_EQ(config.get("a"), "10");
}

TEST(ConfigTest, FileOperations) {
    fs::path testFile = fs::temp_directory_path() / ("blocksync_config_" + std::to_string(::getpid()) + ".conf");

    Config config;
    config.set("listen_port", "8080");
    config.set("log_level", "debug");
    ASSERT_TRUE(config.saveToFile(testFile.string()));

    Config config2;
    ASSERT_TRUE(config2.loadFromFile(testFile.string()));
    EXPECT_EQ(config2.get("listen_port"), "8080");
    EXPECT_EQ(config2.get("log_level"), "debug");

    fs::remove(testFile);
    EXPECT_FALSE(config2.loadFromFile(testFile.string()));
}

TEST(ConfigTest, Validation) {
    Config config;
    config.set("port", "8080");
    config.set("host", "localhost");

    std::unordered_map<std::string, Config::Validator> schema;
    schema["port"] = [](const std::string&, const std::string& v) {
        Config parsed;
        parsed.set("v", v);
        int port = parsed.getInt("v", -1);
        return port > 0 && port < 65536;
    };
    schema["absent"] = [](const std::string&, const std::string&) { return false; };

    EXPECT_TRUE(config.validate(schema));

    config.set("port", "70000");
    std::string failedKey;
    EXPECT_FALSE(config.validate(schema, &failedKey));
    EXPECT_EQ(failedKey, "port");
}
