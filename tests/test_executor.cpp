#include <gtest/gtest.h>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>

#include "engine/executor.hpp"

using namespace splice::engine;

namespace {

    const std::string kApp =
        "import os\n"
        "\n"
        "def load(path):\n"
        "    with open(path) as f:\n"
        "        return f.read()\n"
        "\n"
        "def save(path, data):\n"
        "    with open(path, 'w') as f:\n"
        "        f.write(data)\n";

    using Outcome = OperationResult::Outcome;

}

TEST(TreeExecutor, UpdateReplacesOnlyTheMatchedSpan) {
    MemoryWorkspace ws({{"app.py", kApp}, {"other.py", "x = 1\n"}});
    auto report = apply_patch(
        "*** Begin Patch\n"
        "*** Update File: app.py\n"
        " def load(path):\n"
        "     with open(path) as f:\n"
        "-        return f.read()\n"
        "+        text = f.read()\n"
        "+        return text.strip()\n"
        "*** End Patch\n",
        ws, Config{});

    ASSERT_TRUE(report.ok()) << Reporter::to_text(report);
    EXPECT_EQ(report.exit_code(), 0);
    ASSERT_EQ(report.results.size(), 1u);
    EXPECT_EQ(report.results[0].hunks_applied, 1u);

    std::string expected = kApp;
    expected.replace(expected.find("        return f.read()"), std::string("        return f.read()").size(),
                     "        text = f.read()\n        return text.strip()");
    EXPECT_EQ(ws.read_file("app.py").value(), expected);
    EXPECT_EQ(ws.read_file("other.py").value(), "x = 1\n");
}

TEST(TreeExecutor, ReapplyingAReplacementFailsWithNoMatch) {
    MemoryWorkspace ws({{"app.py", kApp}});
    const std::string patch =
        "*** Begin Patch\n"
        "*** Update File: app.py\n"
        "-        f.write(data)\n"
        "+        f.write(data.encode())\n"
        "*** End of File\n"
        "*** End Patch\n";

    ASSERT_TRUE(apply_patch(patch, ws, Config{}).ok());
    const std::string after_first = ws.read_file("app.py").value();

    auto second = apply_patch(patch, ws, Config{});
    ASSERT_EQ(second.results.size(), 1u);
    EXPECT_EQ(second.results[0].outcome, Outcome::Failed);
    EXPECT_EQ(second.results[0].error, ErrorKind::NoMatch);
    EXPECT_EQ(second.exit_code(), 1);
    EXPECT_EQ(ws.read_file("app.py").value(), after_first);
}

TEST(TreeExecutor, WhitespaceDriftMatchesButNewLinesAreVerbatim) {
    MemoryWorkspace ws(std::map<std::string, std::string>{{"w.py", "def f():\n\tx = 1   \n\treturn x\n"}});
    auto report = apply_patch(
        "*** Begin Patch\n"
        "*** Update File: w.py\n"
        " def f():\n"
        "-    x = 1\n"
        "+  x = 2  \n"
        "     return x\n"
        "*** End Patch\n",
        ws, Config{});

    ASSERT_TRUE(report.ok()) << Reporter::to_text(report);
    EXPECT_EQ(ws.read_file("w.py").value(), "def f():\n  x = 2  \n\treturn x\n");
}

TEST(TreeExecutor, FailedHunkLeavesFileUntouched) {
    MemoryWorkspace ws({{"app.py", kApp}});
    auto report = apply_patch(
        "*** Begin Patch\n"
        "*** Update File: app.py\n"
        "-import os\n"
        "+import os\n"
        "+import sys\n"
        "@@\n"
        "-    this line does not exist\n"
        "+    replacement\n"
        "*** End Patch\n",
        ws, Config{});

    ASSERT_EQ(report.results.size(), 1u);
    EXPECT_EQ(report.results[0].outcome, Outcome::Failed);
    EXPECT_EQ(report.results[0].error, ErrorKind::NoMatch);
    EXPECT_NE(report.results[0].message.find("Hunk 2 of app.py"), std::string::npos);
    EXPECT_EQ(ws.read_file("app.py").value(), kApp);
}

TEST(TreeExecutor, HunksApplyInOrderAgainstUpdatedContent) {
    MemoryWorkspace ws(std::map<std::string, std::string>{{"a.txt", "one\ntwo\nthree\n"}});
    auto report = apply_patch(
        "*** Begin Patch\n"
        "*** Update File: a.txt\n"
        " one\n"
        "-two\n"
        "+TWO\n"
        "*** Update File: a.txt\n"
        " TWO\n"
        "-three\n"
        "+THREE\n"
        "*** End Patch\n",
        ws, Config{});

    ASSERT_TRUE(report.ok()) << Reporter::to_text(report);
    EXPECT_EQ(ws.read_file("a.txt").value(), "one\nTWO\nTHREE\n");
}

TEST(TreeExecutor, AppendAtEndOfFileKeepsTrailingNewline) {
    MemoryWorkspace ws({{"a.txt", "one\ntwo\n"}, {"empty.txt", ""}});
    auto report = apply_patch(
        "*** Begin Patch\n"
        "*** Update File: a.txt\n"
        "+three\n"
        "*** End of File\n"
        "*** Update File: empty.txt\n"
        "+first\n"
        "*** End of File\n"
        "*** End Patch\n",
        ws, Config{});

    ASSERT_TRUE(report.ok()) << Reporter::to_text(report);
    EXPECT_EQ(ws.read_file("a.txt").value(), "one\ntwo\nthree\n");
    EXPECT_EQ(ws.read_file("empty.txt").value(), "first");
}

TEST(TreeExecutor, AddCreatesFileAndRefusesToOverwrite) {
    MemoryWorkspace ws(std::map<std::string, std::string>{{"existing.py", "keep\n"}});
    auto report = apply_patch(
        "*** Begin Patch\n"
        "*** Add File: pkg/new.py\n"
        "+def helper():\n"
        "+    return 1\n"
        "*** Add File: existing.py\n"
        "+clobber\n"
        "*** End Patch\n",
        ws, Config{});

    ASSERT_EQ(report.results.size(), 2u);
    EXPECT_EQ(report.results[0].outcome, Outcome::Applied);
    EXPECT_EQ(report.results[1].outcome, Outcome::Failed);
    EXPECT_EQ(report.results[1].error, ErrorKind::PathExists);
    EXPECT_EQ(ws.read_file("pkg/new.py").value(), "def helper():\n    return 1");
    EXPECT_EQ(ws.read_file("existing.py").value(), "keep\n");
    EXPECT_EQ(report.exit_code(), 1);
}

TEST(TreeExecutor, DeleteMissingFileFails) {
    MemoryWorkspace ws(std::map<std::string, std::string>{{"a.txt", "a"}});
    auto report = apply_patch(
        "*** Begin Patch\n"
        "*** Delete File: missing.txt\n"
        "*** Delete File: a.txt\n"
        "*** End Patch\n",
        ws, Config{});

    ASSERT_EQ(report.results.size(), 2u);
    EXPECT_EQ(report.results[0].error, ErrorKind::PathNotFound);
    EXPECT_EQ(report.results[1].outcome, Outcome::Applied);
    EXPECT_FALSE(ws.exists("a.txt"));
}

TEST(TreeExecutor, MovePreconditions) {
    MemoryWorkspace ws({{"a.txt", "a"}, {"b.txt", "b"}});
    auto report = apply_patch(
        "*** Begin Patch\n"
        "*** Update File: missing.txt\n"
        "*** Move to: c.txt\n"
        "*** Update File: a.txt\n"
        "*** Move to: b.txt\n"
        "*** Update File: a.txt\n"
        "*** Move to: dir/c.txt\n"
        "*** End Patch\n",
        ws, Config{});

    ASSERT_EQ(report.results.size(), 3u);
    EXPECT_EQ(report.results[0].error, ErrorKind::PathNotFound);
    EXPECT_EQ(report.results[1].error, ErrorKind::PathExists);
    EXPECT_EQ(report.results[2].outcome, Outcome::Applied);
    EXPECT_FALSE(ws.exists("a.txt"));
    EXPECT_EQ(ws.read_file("dir/c.txt").value(), "a");
    EXPECT_EQ(ws.read_file("b.txt").value(), "b");
}

TEST(TreeExecutor, UpdateThenMoveWritesEditedContentAtTarget) {
    MemoryWorkspace ws(std::map<std::string, std::string>{{"old/mod.py", "x = 1\ny = 2\n"}});
    auto report = apply_patch(
        "*** Begin Patch\n"
        "*** Update File: old/mod.py\n"
        "*** Move to: new/mod.py\n"
        " x = 1\n"
        "-y = 2\n"
        "+y = 3\n"
        "*** End Patch\n",
        ws, Config{});

    ASSERT_TRUE(report.ok()) << Reporter::to_text(report);
    EXPECT_FALSE(ws.exists("old/mod.py"));
    EXPECT_EQ(ws.read_file("new/mod.py").value(), "x = 1\ny = 3\n");
}

TEST(TreeExecutor, MoveIsSkippedWhenItsUpdateFails) {
    MemoryWorkspace ws(std::map<std::string, std::string>{{"old.py", "x = 1\n"}});
    auto report = apply_patch(
        "*** Begin Patch\n"
        "*** Update File: old.py\n"
        "*** Move to: new.py\n"
        "-nothing like this\n"
        "+y\n"
        "*** End Patch\n",
        ws, Config{});

    ASSERT_EQ(report.results.size(), 2u);
    EXPECT_EQ(report.results[0].outcome, Outcome::Failed);
    EXPECT_EQ(report.results[1].outcome, Outcome::Skipped);
    EXPECT_TRUE(ws.exists("old.py"));
    EXPECT_FALSE(ws.exists("new.py"));
}

TEST(TreeExecutor, MalformedPatchAppliesNothing) {
    MemoryWorkspace ws(std::map<std::string, std::string>{{"a.txt", "a"}});
    auto report = apply_patch(
        "*** Begin Patch\n"
        "*** Delete File: a.txt\n"
        "*** Bogus\n"
        "*** End Patch\n",
        ws, Config{});

    ASSERT_TRUE(report.fatal.has_value());
    EXPECT_EQ(report.fatal->kind(), ErrorKind::MalformedPatch);
    EXPECT_TRUE(report.results.empty());
    EXPECT_EQ(report.exit_code(), 2);
    EXPECT_TRUE(ws.exists("a.txt"));
}

TEST(TreeExecutor, UnsafeAndProtectedPathsFail) {
    MemoryWorkspace ws({{".git/config", "[core]"}, {"secret.key", "k"}});
    Config config;
    config.protect = {"*.key"};

    auto report = apply_patch(
        "*** Begin Patch\n"
        "*** Add File: ../escape.txt\n"
        "+x\n"
        "*** Add File: /tmp/abs.txt\n"
        "+x\n"
        "*** Delete File: .git/config\n"
        "*** Delete File: secret.key\n"
        "*** Add File: fine.txt\n"
        "+ok\n"
        "*** End Patch\n",
        ws, config);

    ASSERT_EQ(report.results.size(), 5u);
    for (size_t i = 0; i < 4; ++i) {
        EXPECT_EQ(report.results[i].error, ErrorKind::UnsafePath) << i;
    }
    EXPECT_EQ(report.results[4].outcome, Outcome::Applied);
    EXPECT_TRUE(ws.exists(".git/config"));
    EXPECT_TRUE(ws.exists("secret.key"));
}

TEST(TreeExecutor, DryRunReportsWithoutChanging) {
    MemoryWorkspace ws({{"app.py", kApp}, {"gone.py", "g"}});
    auto report = apply_patch(
        "*** Begin Patch\n"
        "*** Update File: app.py\n"
        "-import os\n"
        "+import sys\n"
        "*** Delete File: gone.py\n"
        "*** Add File: new.py\n"
        "+n\n"
        "*** End Patch\n",
        ws, Config{}, true);

    EXPECT_TRUE(report.ok()) << Reporter::to_text(report);
    EXPECT_TRUE(report.dry_run);
    EXPECT_EQ(ws.read_file("app.py").value(), kApp);
    EXPECT_TRUE(ws.exists("gone.py"));
    EXPECT_FALSE(ws.exists("new.py"));
}

TEST(TreeExecutor, FailureIsScopedToItsOperation) {
    MemoryWorkspace ws({{"a.txt", "a\n"}, {"b.txt", "b\n"}});
    auto report = apply_patch(
        "*** Begin Patch\n"
        "*** Update File: a.txt\n"
        "-zzz\n"
        "+yyy\n"
        "*** Update File: b.txt\n"
        "-b\n"
        "+B\n"
        "*** End Patch\n",
        ws, Config{});

    ASSERT_EQ(report.results.size(), 2u);
    EXPECT_EQ(report.results[0].outcome, Outcome::Failed);
    EXPECT_EQ(report.results[1].outcome, Outcome::Applied);
    EXPECT_EQ(ws.read_file("a.txt").value(), "a\n");
    EXPECT_EQ(ws.read_file("b.txt").value(), "B\n");
}

TEST(TreeExecutor, IndentationOnlyDriftStillApplies) {
    MemoryWorkspace ws(std::map<std::string, std::string>{{"d.py", "def f(x):\n    if x:\n        return 1\n    return 0\n"}});
    auto report = apply_patch(
        "*** Begin Patch\n"
        "*** Update File: d.py\n"
        "-  if x:\n"
        "-      return 1\n"
        "+    if x:\n"
        "+        return 2\n"
        "*** End Patch\n",
        ws, Config{});

    ASSERT_TRUE(report.ok()) << Reporter::to_text(report);
    EXPECT_EQ(ws.read_file("d.py").value(), "def f(x):\n    if x:\n        return 2\n    return 0\n");
}

namespace {

    // Fails every write to one path with a non-patch exception.
    class FailingWorkspace : public MemoryWorkspace {
    public:
        FailingWorkspace(std::map<std::string, std::string> files, std::string bad_path)
            : MemoryWorkspace(std::move(files)), m_bad_path(std::move(bad_path)) {}

        void write_file(const std::string& path, const std::string& content) override {
            if (path == m_bad_path) throw std::runtime_error("device unavailable");
            MemoryWorkspace::write_file(path, content);
        }

    private:
        std::string m_bad_path;
    };

}

TEST(TreeExecutor, UnexpectedExceptionFailsOnlyItsOperation) {
    FailingWorkspace ws({}, "a.txt");
    auto report = apply_patch(
        "*** Begin Patch\n"
        "*** Add File: a.txt\n"
        "+a\n"
        "*** Add File: b.txt\n"
        "+b\n"
        "*** End Patch\n",
        ws, Config{});

    ASSERT_EQ(report.results.size(), 2u);
    EXPECT_EQ(report.results[0].outcome, Outcome::Failed);
    EXPECT_NE(report.results[0].message.find("device unavailable"), std::string::npos);
    EXPECT_EQ(report.results[1].outcome, Outcome::Applied);
    EXPECT_FALSE(ws.exists("a.txt"));
    EXPECT_EQ(ws.read_file("b.txt").value(), "b");
    EXPECT_EQ(report.exit_code(), 1);
}

TEST(Reporter, TextAndJson) {
    MemoryWorkspace ws(std::map<std::string, std::string>{{"a.txt", "a\n"}});
    auto report = apply_patch(
        "*** Begin Patch\n"
        "*** Update File: a.txt\n"
        "-a\n"
        "+A\n"
        "*** Delete File: nope.txt\n"
        "*** End Patch\n",
        ws, Config{});

    std::string text = Reporter::to_text(report);
    EXPECT_NE(text.find("M  a.txt (1 hunk)"), std::string::npos) << text;
    EXPECT_NE(text.find("FAILED  D  nope.txt: [PathNotFound]"), std::string::npos) << text;
    EXPECT_NE(text.find("1 of 2 operations applied."), std::string::npos) << text;

    nlohmann::json j = Reporter::to_json(report);
    EXPECT_FALSE(j["ok"].get<bool>());
    EXPECT_EQ(j["exit_code"].get<int>(), 1);
    ASSERT_EQ(j["results"].size(), 2u);
    EXPECT_EQ(j["results"][0]["outcome"], "applied");
    EXPECT_EQ(j["results"][0]["hunks_applied"], 1);
    EXPECT_EQ(j["results"][1]["error"], "PathNotFound");
}

TEST(Reporter, MalformedPatchJson) {
    MemoryWorkspace ws;
    auto report = apply_patch("not a patch", ws, Config{});
    nlohmann::json j = Reporter::to_json(report);
    EXPECT_EQ(j["exit_code"].get<int>(), 2);
    EXPECT_EQ(j["error"]["kind"], "MalformedPatch");
    EXPECT_NE(Reporter::to_text(report).find("Nothing applied."), std::string::npos);
}
