#pragma once

#include <filesystem>
#include <string>

namespace runner {

/**
 * @brief 一次执行请求独占的工作文件夹
 * 构造时在 root 下创建一个以随机 uuid 命名的文件夹，析构时删除该文件夹及其所有内容。
 * 工作文件夹的路径总是绝对路径，子进程切换到工作文件夹后仍然可以使用该路径。
 * 删除失败只记录日志，不会抛出异常，因此无论执行过程从哪条路径退出
 * （正常返回、编译错误、超时、异常），工作文件夹都会被尝试清理。
 */
struct workspace {
    /**
     * @brief 创建工作文件夹
     * @param root 所有工作文件夹的根目录，不存在时会自动创建，相对路径相对于当前工作路径
     * @throw std::filesystem::filesystem_error 文件夹无法创建或者无法设置权限，此时不会留下文件夹
     */
    explicit workspace(const std::filesystem::path &root);
    workspace(const workspace &) = delete;
    workspace &operator=(const workspace &) = delete;
    ~workspace();

    const std::filesystem::path &path() const;

    /**
     * @brief 将文件写入工作文件夹
     * @param name 文件名，不能包含 ".." 或者以 "/" 开头
     * @param content 文件内容
     * @return 文件的绝对路径
     */
    std::filesystem::path write_file(const std::string &name, const std::string &content) const;

    /**
     * @brief 立即删除工作文件夹，之后析构时不再重复删除
     * @return 若文件夹已经不存在
     */
    bool release() noexcept;

private:
    std::filesystem::path dir;
};

}  // namespace runner
