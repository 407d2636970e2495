#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <stdexcept>

namespace codejudge {

struct codejudge_exception : std::exception {
    codejudge_exception();
    explicit codejudge_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const codejudge_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测流水线的内部错误
 * 一般是流水线自身的不变量被破坏
 */
struct internal_error : public codejudge_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示消息队列（Redis）不可用或者命令执行失败
 * 调用方应当认为该错误是可以重试的
 */
struct broker_error : public codejudge_exception {
    broker_error();
    explicit broker_error(const std::string &message);
};

/**
 * @brief 表示数据库查询错误
 */
struct database_error : public codejudge_exception {
    database_error();
    explicit database_error(const std::string &message);
};

/**
 * @brief 表示请求不合法，比如时间限制超出系统允许的最大值
 * 这类错误在创建提交之前就会被拒绝，不会进入队列
 */
struct validation_error : public codejudge_exception {
    validation_error();
    explicit validation_error(const std::string &message);
};

/**
 * @brief 语言表中不存在请求的语言 id
 */
struct unsupported_language : public validation_error {
    explicit unsupported_language(int language_id);

    int language_id;
};

struct submission_not_found : public codejudge_exception {
    explicit submission_not_found(long long submission_id);

    long long submission_id;
};

}  // namespace codejudge
