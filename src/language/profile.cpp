#include "language/profile.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <stdexcept>
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "config.hpp"

namespace dcx::language {
using namespace std;
using namespace nlohmann;

bool profile::compiles() const {
    return compile_cmd.has_value();
}

static profile interpreted(const string &language, const string &source_file, const string &run_cmd, const string &image) {
    return profile{language, source_file, nullopt, run_cmd, nullopt, image,
                   DEFAULT_COMPILE_TIME_LIMIT_MS, DEFAULT_COMPILE_MEMORY_LIMIT_MB};
}

static profile compiled(const string &language, const string &source_file,
                        const string &compile_cmd, const string &compile_image,
                        const string &run_cmd, const string &run_image) {
    return profile{language, source_file, compile_cmd, run_cmd, compile_image, run_image,
                   DEFAULT_COMPILE_TIME_LIMIT_MS, DEFAULT_COMPILE_MEMORY_LIMIT_MB};
}

static vector<profile> builtin_profiles() {
    // clang-format off
    return {
        interpreted("python", "main.py", "python3 main.py", "python:3-slim"),
        interpreted("javascript", "main.js", "node main.js", "node:slim"),
        interpreted("ruby", "main.rb", "ruby main.rb", "ruby:slim"),
        compiled("c", "main.c", "gcc -O2 -static -o main main.c -lm", "gcc:latest", "./main", "debian:bookworm-slim"),
        compiled("cpp", "main.cpp", "g++ -O2 -static -o main main.cpp", "gcc:latest", "./main", "debian:bookworm-slim"),
        compiled("rust", "main.rs", "rustc -O -o main main.rs", "rust:latest", "./main", "debian:bookworm-slim"),
        // go 默认把构建缓存放在 $HOME 下，容器内的 HOME 不一定可写
        compiled("go", "main.go", "GOCACHE=/tmp/gocache go build -o main main.go", "golang:latest", "./main", "debian:bookworm-slim"),
        compiled("java", "Main.java", "javac -d . Main.java", "eclipse-temurin:25", "java -cp . Main", "eclipse-temurin:25"),
    };
    // clang-format on
}

void from_json(const json &j, profile &value) {
    j.at("language").get_to(value.language);
    value.source_file = assert_safe_path(get_value<string>(j, "source_file"));
    j.at("run_cmd").get_to(value.run_cmd);
    j.at("run_image").get_to(value.run_image);
    if (exists(j, "compile_cmd"))
        value.compile_cmd = get_value<string>(j, "compile_cmd");
    else
        value.compile_cmd.reset();
    if (exists(j, "compile_image"))
        value.compile_image = get_value<string>(j, "compile_image");
    else
        value.compile_image.reset();
    if (value.compile_cmd && !value.compile_image)
        value.compile_image = value.run_image;
    value.compile_time_limit_ms = get_value_def<int>(j, DEFAULT_COMPILE_TIME_LIMIT_MS, "compile_time_limit_ms");
    value.compile_memory_limit_mb = get_value_def<int>(j, DEFAULT_COMPILE_MEMORY_LIMIT_MB, "compile_memory_limit_mb");
    if (value.language.empty())
        throw invalid_argument("language id must not be empty");
    if (value.compile_time_limit_ms <= 0 || value.compile_memory_limit_mb <= 0)
        throw invalid_argument("compile limits of " + value.language + " must be positive");
}

void to_json(json &j, const profile &value) {
    j = {{"language", value.language},
         {"source_file", value.source_file},
         {"run_cmd", value.run_cmd},
         {"run_image", value.run_image},
         {"compile_time_limit_ms", value.compile_time_limit_ms},
         {"compile_memory_limit_mb", value.compile_memory_limit_mb}};
    if (value.compile_cmd) j["compile_cmd"] = *value.compile_cmd;
    if (value.compile_image) j["compile_image"] = *value.compile_image;
}

registry::registry(vector<profile> list) {
    for (auto &p : list) {
        string id = p.language;
        profiles[id] = move(p);
    }
}

shared_ptr<const registry> registry::builtin() {
    static shared_ptr<const registry> instance = make_shared<const registry>(builtin_profiles());
    return instance;
}

shared_ptr<const registry> registry::from_config(const json &config) {
    vector<profile> list = builtin_profiles();
    if (!exists(config, "languages")) return make_shared<const registry>(move(list));
    const json &overrides = config.at("languages");
    if (!overrides.is_array())
        throw invalid_argument("languages must be an array");

    for (const json &entry : overrides) {
        profile p;
        try {
            entry.get_to(p);
        } catch (json::exception &e) {
            throw invalid_argument(string("Malformed language profile: ") + e.what());
        }
        auto it = find_if(list.begin(), list.end(), [&](const profile &q) { return q.language == p.language; });
        if (it != list.end()) {
            LOG(INFO) << "Overriding builtin language " << p.language;
            *it = p;
        } else {
            LOG(INFO) << "Registering language " << p.language;
            list.push_back(p);
        }
    }
    return make_shared<const registry>(move(list));
}

shared_ptr<const registry> registry::load(const filesystem::path &path) {
    if (!filesystem::exists(path))
        throw runtime_error("Unable to find language configuration " + path.string());
    json config;
    try {
        config = json::parse(read_file_content(path));
    } catch (json::exception &e) {
        throw invalid_argument("Malformed language configuration " + path.string() + ": " + e.what());
    }
    return from_config(config);
}

const profile *registry::find(const string &language) const {
    auto it = profiles.find(language);
    if (it == profiles.end()) return nullptr;
    return &it->second;
}

bool registry::contains(const string &language) const {
    return profiles.count(language) > 0;
}

vector<string> registry::languages() const {
    vector<string> result;
    for (auto &[id, p] : profiles)
        result.push_back(id);
    return result;
}

}  // namespace dcx::language
