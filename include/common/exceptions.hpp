#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace dcx {

struct dcx_exception : std::exception {
    explicit dcx_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const dcx_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示执行系统的内部错误
 * 比如沙箱无法启动、容器镜像不存在、fork 失败等，与用户程序本身无关。
 * 这类错误会走重试流程，而不会作为测试点的评测结果保存。
 */
struct internal_error : public dcx_exception {
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示网络错误，通常由 CURL 产生
 */
struct network_error : public dcx_exception {
    explicit network_error(const std::string &message);
};

/**
 * @brief 表示客户端请求不合法
 * code 是返回给客户端的错误码，比如 unknown_language
 */
struct bad_request : public dcx_exception {
    const std::string code;

    bad_request(const std::string &code, const std::string &message);
};

/**
 * @brief 表示请求的对象（提交、worker）不存在
 * code 是返回给客户端的错误码，比如 job_not_found
 */
struct not_found : public dcx_exception {
    const std::string code;

    not_found(const std::string &code, const std::string &message);
};

/**
 * @brief 表示 worker 的上报已经过期
 * 比如提交已经被重新分配给其他 worker，旧的 worker 仍然在上报结果
 */
struct conflict : public dcx_exception {
    explicit conflict(const std::string &message);
};

}  // namespace dcx
