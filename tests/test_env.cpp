#include <gtest/gtest.h>
#include "ligaproxy/env.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

using ligaproxy::get_env;
using ligaproxy::load_env;

namespace {

class DotEnvTest : public ::testing::Test {
protected:
    std::filesystem::path path = std::filesystem::temp_directory_path() / "ligaproxy_test.env";

    void TearDown() override {
        std::filesystem::remove(path);
        for (const char* key : {"LIGAPROXY_T_A", "LIGAPROXY_T_B", "LIGAPROXY_T_KEEP"}) {
            ::unsetenv(key);
        }
    }

    std::unordered_map<std::string, std::string> load(const std::string& content) {
        std::ofstream(path) << content;
        return load_env(path);
    }
};

} // namespace

TEST_F(DotEnvTest, ReadsAssignmentsAndSkipsComments) {
    auto vars = load("# upstream\n\nLIGAPROXY_T_A=10\n  LIGAPROXY_T_B = 3  \n");

    EXPECT_EQ(vars.size(), 2u);
    EXPECT_EQ(vars["LIGAPROXY_T_A"], "10");
    EXPECT_EQ(vars["LIGAPROXY_T_B"], "3");
}

TEST_F(DotEnvTest, ExportPrefixIsAccepted) {
    auto vars = load("export LIGAPROXY_T_A=openliga\n");
    EXPECT_EQ(vars["LIGAPROXY_T_A"], "openliga");
}

TEST_F(DotEnvTest, QuotesAreStripped) {
    auto vars = load("LIGAPROXY_T_A=\"api.openligadb.de\"\nLIGAPROXY_T_B='a b'\n");
    EXPECT_EQ(vars["LIGAPROXY_T_A"], "api.openligadb.de");
    EXPECT_EQ(vars["LIGAPROXY_T_B"], "a b");
}

TEST_F(DotEnvTest, InlineCommentOnlyOutsideQuotes) {
    auto vars = load("LIGAPROXY_T_A=info # verbose is too noisy\nLIGAPROXY_T_B=\"%v # raw\"\n");
    EXPECT_EQ(vars["LIGAPROXY_T_A"], "info");
    EXPECT_EQ(vars["LIGAPROXY_T_B"], "%v # raw");
}

TEST_F(DotEnvTest, CarriageReturnsAreTrimmed) {
    auto vars = load("LIGAPROXY_T_A=8000\r\n");
    EXPECT_EQ(vars["LIGAPROXY_T_A"], "8000");
}

TEST_F(DotEnvTest, LinesWithoutKeyAreIgnored) {
    auto vars = load("=orphan\nno_equals_here\nLIGAPROXY_T_A=1\n");
    EXPECT_EQ(vars.size(), 1u);
}

TEST_F(DotEnvTest, ValuesReachTheEnvironment) {
    load("LIGAPROXY_T_A=from_file\n");
    EXPECT_EQ(get_env("LIGAPROXY_T_A"), "from_file");
}

TEST_F(DotEnvTest, ExistingVariablesWin) {
    ::setenv("LIGAPROXY_T_KEEP", "from_shell", 1);

    auto vars = load("LIGAPROXY_T_KEEP=from_file\n");

    EXPECT_EQ(vars["LIGAPROXY_T_KEEP"], "from_file");
    EXPECT_EQ(get_env("LIGAPROXY_T_KEEP"), "from_shell");
}

TEST(DotEnv, MissingFileIsNotAnError) {
    EXPECT_TRUE(load_env("/nonexistent/ligaproxy.env").empty());
}

TEST(GetEnv, UnsetIsNullopt) {
    ::unsetenv("LIGAPROXY_T_UNSET");
    EXPECT_FALSE(get_env("LIGAPROXY_T_UNSET").has_value());
}
