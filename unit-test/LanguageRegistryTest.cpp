#include <fstream>
#include "common/io_utils.hpp"
#include "gtest/gtest.h"
#include "language/profile.hpp"
#include "test/fixtures.hpp"

using namespace std;
using namespace dcx;
using namespace dcx::language;
using namespace nlohmann;

TEST(LanguageRegistryTest, BuiltinLanguages) {
    auto reg = registry::builtin();
    vector<string> expected = {"c", "cpp", "go", "java", "javascript", "python", "ruby", "rust"};
    EXPECT_EQ(reg->languages(), expected);

    const profile *python = reg->find("python");
    ASSERT_NE(python, nullptr);
    EXPECT_FALSE(python->compiles());
    EXPECT_EQ(python->source_file, "main.py");
    EXPECT_EQ(python->run_cmd, "python3 main.py");

    const profile *java = reg->find("java");
    ASSERT_NE(java, nullptr);
    EXPECT_TRUE(java->compiles());
    EXPECT_EQ(java->source_file, "Main.java");
    EXPECT_EQ(*java->compile_image, "eclipse-temurin:25");

    EXPECT_EQ(reg->find("brainfuck"), nullptr);
    EXPECT_FALSE(reg->contains("brainfuck"));
}

TEST(LanguageRegistryTest, OverrideReplacesBuiltin) {
    json config = R"({
        "languages": [
            {"language": "cpp", "source_file": "prog.cc", "compile_cmd": "clang++ -o main prog.cc",
             "run_cmd": "./main", "run_image": "alpine", "compile_time_limit_ms": 10000},
            {"language": "sh", "source_file": "main.sh", "run_cmd": "sh main.sh", "run_image": "alpine"}
        ]
    })"_json;
    auto reg = registry::from_config(config);

    EXPECT_EQ(reg->languages().size(), 9u);
    const profile *cpp = reg->find("cpp");
    ASSERT_NE(cpp, nullptr);
    EXPECT_EQ(cpp->source_file, "prog.cc");
    EXPECT_EQ(*cpp->compile_cmd, "clang++ -o main prog.cc");
    // 未指定编译镜像时使用运行镜像
    EXPECT_EQ(*cpp->compile_image, "alpine");
    EXPECT_EQ(cpp->compile_time_limit_ms, 10000);
    EXPECT_EQ(cpp->compile_memory_limit_mb, DEFAULT_COMPILE_MEMORY_LIMIT_MB);

    const profile *sh = reg->find("sh");
    ASSERT_NE(sh, nullptr);
    EXPECT_FALSE(sh->compiles());
    EXPECT_FALSE(sh->compile_image.has_value());

    // 内置表本身不受影响
    EXPECT_EQ(registry::builtin()->find("cpp")->source_file, "main.cpp");
}

TEST(LanguageRegistryTest, MalformedConfigRejected) {
    EXPECT_THROW(registry::from_config(R"({"languages": {}})"_json), invalid_argument);
    EXPECT_THROW(registry::from_config(R"({"languages": [{"language": "x"}]})"_json), invalid_argument);
    EXPECT_THROW(registry::from_config(R"({"languages": [{"language": "", "source_file": "a", "run_cmd": "a", "run_image": "a"}]})"_json),
                 invalid_argument);
    EXPECT_THROW(registry::from_config(R"({"languages": [{"language": "x", "source_file": "main.x", "run_cmd": "a", "run_image": "a", "compile_time_limit_ms": 0}]})"_json),
                 invalid_argument);
}

TEST(LanguageRegistryTest, SourceFileMustNotEscapeWorkdir) {
    EXPECT_THROW(registry::from_config(R"({"languages": [{"language": "x", "source_file": "../main.x", "run_cmd": "a", "run_image": "a"}]})"_json),
                 invalid_argument);
    EXPECT_THROW(registry::from_config(R"({"languages": [{"language": "x", "source_file": "..", "run_cmd": "a", "run_image": "a"}]})"_json),
                 invalid_argument);
}

TEST(LanguageRegistryTest, LoadFromFile) {
    auto path = RUN_DIR / "languages.json";
    write_file_content(path, R"({"languages": [{"language": "lua", "source_file": "main.lua", "run_cmd": "lua main.lua", "run_image": "lua"}]})");
    auto reg = registry::load(path);
    EXPECT_TRUE(reg->contains("lua"));
    EXPECT_TRUE(reg->contains("python"));

    write_file_content(path, "{not json");
    EXPECT_THROW(registry::load(path), invalid_argument);

    EXPECT_THROW(registry::load(RUN_DIR / "missing.json"), runtime_error);
}

TEST(LanguageRegistryTest, ProfileJsonRoundTrip) {
    const profile *go = registry::builtin()->find("go");
    ASSERT_NE(go, nullptr);
    json j = *go;
    EXPECT_EQ(j.at("language"), "go");
    EXPECT_EQ(j.at("compile_image"), "golang:latest");
    profile parsed = j.get<profile>();
    EXPECT_EQ(parsed.compile_cmd, go->compile_cmd);
    EXPECT_EQ(parsed.run_image, go->run_image);
}

TEST(LanguageRegistryTest, SampleConfigLinksStatically) {
    // 编译镜像和运行镜像不同，动态链接的程序在运行镜像中可能找不到匹配的运行库
    auto reg = registry::load(filesystem::path(DCX_SOURCE_DIR) / "exec" / "languages.json");
    for (string id : {"c", "cpp"}) {
        const profile *p = reg->find(id);
        ASSERT_NE(p, nullptr) << id;
        ASSERT_TRUE(p->compiles()) << id;
        EXPECT_NE(*p->compile_image, p->run_image);
        EXPECT_NE(p->compile_cmd->find("-static"), string::npos) << id << ": " << *p->compile_cmd;
    }
    EXPECT_TRUE(reg->contains("shell"));
}
