#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace dcx::language {

/**
 * @brief 一种编程语言的编译与运行方式
 * 通过表驱动来支持不同语言，而不是在评测流程中为每种语言写分支。
 */
struct profile {
    /**
     * @brief 语言编号，即提交中的 language 字段，比如 cpp
     */
    std::string language;

    /**
     * @brief 源代码保存的文件名，比如 main.cpp、Main.java
     */
    std::string source_file;

    /**
     * @brief 编译命令，由 sh -c 执行，工作目录为提交的运行目录
     * 解释型语言没有编译命令
     */
    std::optional<std::string> compile_cmd;

    /**
     * @brief 运行命令，由 sh -c 执行
     */
    std::string run_cmd;

    /**
     * @brief 编译时使用的 docker 镜像
     */
    std::optional<std::string> compile_image;

    /**
     * @brief 运行时使用的 docker 镜像
     */
    std::string run_image;

    int compile_time_limit_ms;
    int compile_memory_limit_mb;

    bool compiles() const;
};

void from_json(const nlohmann::json &j, profile &value);
void to_json(nlohmann::json &j, const profile &value);

/**
 * @brief 语言编号到 profile 的查找表
 * 进程启动时加载一次，此后只读，可以被多个线程同时访问。
 */
struct registry {
    /**
     * @brief 内置的八种语言
     */
    static std::shared_ptr<const registry> builtin();

    /**
     * @brief 读取 JSON 配置文件，文件中的语言覆盖同名的内置语言
     * 配置文件格式为 {"languages": [profile...]}
     * @param path 配置文件路径
     * @throw std::invalid_argument 配置文件格式不正确
     * @throw std::runtime_error 配置文件不存在
     */
    static std::shared_ptr<const registry> load(const std::filesystem::path &path);

    /**
     * @brief 在内置语言的基础上应用 JSON 配置
     */
    static std::shared_ptr<const registry> from_config(const nlohmann::json &config);

    explicit registry(std::vector<profile> profiles);

    /**
     * @brief 查找语言
     * @return 语言不存在时返回 nullptr
     */
    const profile *find(const std::string &language) const;

    bool contains(const std::string &language) const;

    /**
     * @brief 所有支持的语言编号，按字典序
     */
    std::vector<std::string> languages() const;

private:
    std::map<std::string, profile> profiles;
};

}  // namespace dcx::language
