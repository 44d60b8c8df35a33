/**
 * @file test_cli.cpp
 * @brief Tests for the pathmap command-line tool (GoogleTest)
 *
 * Runs commands through run_cli() with string streams and checks
 * exit codes, printed output and files written.
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>
#include "pathmap/Cli.hpp"
#include "pathmap/Document.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using namespace pathmap;

// ============================================================================
// Test Utilities
// ============================================================================

/**
 * @brief RAII helper for a scratch directory
 */
class ScratchDir {
public:
    ScratchDir() : path_(fs::temp_directory_path() /
                         ("pathmap_cli_" + std::to_string(std::rand()))) {
        fs::create_directories(path_);
    }

    ~ScratchDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    std::string file(const std::string& name) const {
        return (path_ / name).string();
    }

    std::string write(const std::string& name, const std::string& content) const {
        std::string p = file(name);
        std::ofstream out(p);
        out << content;
        return p;
    }

private:
    fs::path path_;
};

struct CliRun {
    int code;
    std::string out;
    std::string err;
};

CliRun run(const std::vector<std::string>& args) {
    std::ostringstream out, err;
    int code = run_cli(args, out, err);
    return {code, out.str(), err.str()};
}

bool contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

class CliTest : public ::testing::Test {
protected:
    void SetUp() override {
        doc_ = dir_.write("doc.json", R"({"a": {"b": 1}, "s": "x"})");
    }

    ScratchDir dir_;
    std::string doc_;
};

// ============================================================================
// Usage errors (exit 2)
// ============================================================================

TEST(CliUsageTest, NoCommand) {
    auto r = run({});
    EXPECT_EQ(r.code, kExitUsage);
    EXPECT_TRUE(contains(r.out, "Commands:"));
}

TEST(CliUsageTest, HelpExitsZero) {
    auto r = run({"--help"});
    EXPECT_EQ(r.code, kExitOk);
    EXPECT_TRUE(contains(r.out, "put-auto"));
}

TEST(CliUsageTest, UnknownCommand) {
    auto r = run({"frobnicate"});
    EXPECT_EQ(r.code, kExitUsage);
    EXPECT_TRUE(contains(r.err, "Unknown command: frobnicate"));
}

TEST(CliUsageTest, UnknownOption) {
    EXPECT_EQ(run({"--bogus", "dump"}).code, kExitUsage);
}

TEST(CliUsageTest, WrongArgumentCount) {
    for (const auto& args : std::vector<std::vector<std::string>>{
             {"fetch"}, {"fetch", "a", "b"}, {"get"}, {"get", "a", "1", "2"},
             {"exists"}, {"validate"}, {"put", "a"}, {"put-auto", "a", "1", "2"},
             {"put-new"}, {"put-new-auto", "a"}, {"ensure", "a"}, {"dump", "x"}}) {
        auto r = run(args);
        EXPECT_EQ(r.code, kExitUsage) << args[0];
        EXPECT_TRUE(contains(r.err, "wrong number of arguments")) << args[0];
    }
}

TEST(CliUsageTest, BadFormat) {
    auto r = run({"--format", "yaml", "dump"});
    EXPECT_EQ(r.code, kExitUsage);
    EXPECT_TRUE(contains(r.err, "--format"));
}

TEST(CliUsageTest, WriteRequiresFile) {
    auto r = run({"-w", "put-auto", "a", "1"});
    EXPECT_EQ(r.code, kExitUsage);
    EXPECT_TRUE(contains(r.err, "--write requires --file"));
}

TEST_F(CliTest, WriteAndOutConflict) {
    auto out = dir_.file("out.json");
    auto r = run({"-f", doc_, "-w", "-o", out, "put", "a.b", "2"});
    EXPECT_EQ(r.code, kExitUsage);
    EXPECT_FALSE(fs::exists(out));
    EXPECT_EQ(load_document(doc_)["a"]["b"], 1);
}

TEST_F(CliTest, WriteOrOutOnReadCommand) {
    auto out = dir_.file("out.json");
    EXPECT_EQ(run({"-f", doc_, "-w", "fetch", "a"}).code, kExitUsage);
    EXPECT_EQ(run({"-f", doc_, "-o", out, "dump"}).code, kExitUsage);
    EXPECT_EQ(run({"-o", out, "exists", "a"}).code, kExitUsage);
    EXPECT_FALSE(fs::exists(out));
}

// ============================================================================
// Read commands
// ============================================================================

TEST_F(CliTest, FetchPrintsValue) {
    auto r = run({"-f", doc_, "fetch", "a.b"});
    EXPECT_EQ(r.code, kExitOk);
    EXPECT_EQ(r.out, "1\n");
}

TEST_F(CliTest, FetchJsonArrayPath) {
    auto r = run({"-f", doc_, "fetch", R"(["a", "b"])"});
    EXPECT_EQ(r.code, kExitOk);
    EXPECT_EQ(r.out, "1\n");
}

TEST_F(CliTest, FetchMissingFails) {
    auto r = run({"-f", doc_, "fetch", "a.x"});
    EXPECT_EQ(r.code, kExitFailure);
    EXPECT_TRUE(contains(r.err, "Missing key at 'a.x'"));
    EXPECT_TRUE(r.out.empty());
}

TEST_F(CliTest, FetchThroughLeafFails) {
    auto r = run({"-f", doc_, "fetch", "s.t"});
    EXPECT_EQ(r.code, kExitFailure);
    EXPECT_TRUE(contains(r.err, "Expected a map at 's'"));
}

TEST_F(CliTest, GetFallsBackToDefault) {
    EXPECT_EQ(run({"-f", doc_, "get", "a.b"}).out, "1\n");
    EXPECT_EQ(run({"-f", doc_, "get", "zz", "5"}).out, "5\n");

    auto r = run({"-f", doc_, "get", "zz"});
    EXPECT_EQ(r.code, kExitOk);
    EXPECT_EQ(r.out, "null\n");
}

TEST_F(CliTest, ExistsExitCode) {
    auto yes = run({"-f", doc_, "exists", "a.b"});
    EXPECT_EQ(yes.code, kExitOk);
    EXPECT_EQ(yes.out, "true\n");

    auto no = run({"-f", doc_, "exists", "a.zz"});
    EXPECT_EQ(no.code, kExitFailure);
    EXPECT_EQ(no.out, "false\n");
}

TEST_F(CliTest, ValidateExitCode) {
    auto ok = run({"-f", doc_, "validate", "a"});
    EXPECT_EQ(ok.code, kExitOk);
    EXPECT_EQ(ok.out, "ok\n");

    auto bad = run({"-f", doc_, "validate", "a..b"});
    EXPECT_EQ(bad.code, kExitFailure);
    EXPECT_TRUE(contains(bad.err, "Invalid path"));
}

TEST_F(CliTest, DumpJsonAndToml) {
    auto json = run({"-f", doc_, "dump"});
    EXPECT_EQ(json.code, kExitOk);
    EXPECT_EQ(json.out, "{\n  \"a\": {\n    \"b\": 1\n  },\n  \"s\": \"x\"\n}\n");

    auto toml = run({"-f", doc_, "--format", "toml", "dump"});
    EXPECT_EQ(toml.code, kExitOk);
    EXPECT_TRUE(contains(toml.out, "s = 'x'") || contains(toml.out, "s = \"x\""));
}

TEST_F(CliTest, DumpWithoutFileIsEmptyMap) {
    auto r = run({"dump"});
    EXPECT_EQ(r.code, kExitOk);
    EXPECT_EQ(r.out, "{}\n");
}

TEST_F(CliTest, MissingFileFails) {
    auto r = run({"-f", dir_.file("absent.json"), "dump"});
    EXPECT_EQ(r.code, kExitFailure);
    EXPECT_TRUE(contains(r.err, "Document file not found"));
}

// ============================================================================
// Write commands
// ============================================================================

TEST_F(CliTest, PutPrintsNewTree) {
    auto r = run({"-f", doc_, "put", "a.b", "2"});
    EXPECT_EQ(r.code, kExitOk);
    EXPECT_EQ(Value::parse(r.out), Value({{"a", {{"b", 2}}}, {"s", "x"}}));
    // Input untouched without -w
    EXPECT_EQ(load_document(doc_)["a"]["b"], 1);
}

TEST_F(CliTest, PutAbsentLeafFails) {
    auto r = run({"-f", doc_, "put", "a.c", "2"});
    EXPECT_EQ(r.code, kExitFailure);
    EXPECT_TRUE(contains(r.err, "Missing key at 'a.c'"));
}

TEST_F(CliTest, PutAutoToOutFile) {
    auto out = dir_.file("x.json");
    auto r = run({"-o", out, "put-auto", "x.y", "3"});
    EXPECT_EQ(r.code, kExitOk);
    EXPECT_EQ(r.out, "Wrote " + out + "\n");
    EXPECT_EQ(load_document(out), Value({{"x", {{"y", 3}}}}));
}

TEST_F(CliTest, PutAutoToTomlOutFile) {
    auto out = dir_.file("x.toml");
    EXPECT_EQ(run({"-f", doc_, "-o", out, "put-auto", "n.m", "true"}).code, kExitOk);
    EXPECT_EQ(load_document(out)["n"]["m"], true);
}

TEST_F(CliTest, WriteBackToFile) {
    auto r = run({"-f", doc_, "-w", "put", "a.b", R"({"deep": [1, 2]})"});
    EXPECT_EQ(r.code, kExitOk);
    EXPECT_EQ(load_document(doc_)["a"]["b"], Value({{"deep", {1, 2}}}));
}

TEST_F(CliTest, FailedWriteLeavesFileAlone) {
    auto r = run({"-f", doc_, "-w", "put-new", "a.b", "9"});
    EXPECT_EQ(r.code, kExitFailure);
    EXPECT_TRUE(contains(r.err, "already exists"));
    EXPECT_EQ(load_document(doc_)["a"]["b"], 1);
}

TEST_F(CliTest, PutNewAutoCreatesPath) {
    auto r = run({"-f", doc_, "put-new-auto", "p.q", "\"v\""});
    EXPECT_EQ(r.code, kExitOk);
    EXPECT_EQ(Value::parse(r.out)["p"]["q"], "v");
}

TEST_F(CliTest, EnsureKeepsExistingValue) {
    auto kept = run({"-f", doc_, "ensure", "a.b", "7"});
    EXPECT_EQ(kept.code, kExitOk);
    EXPECT_EQ(Value::parse(kept.out)["a"]["b"], 1);

    auto added = run({"-f", doc_, "ensure", "a.c", "7"});
    EXPECT_EQ(added.code, kExitOk);
    EXPECT_EQ(Value::parse(added.out)["a"]["c"], 7);
}

TEST_F(CliTest, EnsureMissingIntermediateFails) {
    auto r = run({"-f", doc_, "ensure", "q.r", "1"});
    EXPECT_EQ(r.code, kExitFailure);
    EXPECT_TRUE(contains(r.err, "Missing key at 'q'"));
}
