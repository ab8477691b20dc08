#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * 这个头文件包含编程语言的配置
 * 每种语言对应一个 language_descriptor，描述源文件名、编译命令、运行命令。
 * 命令模板中可以使用以下占位符：
 * {source}: 源文件的绝对路径
 * {binary}: 编译产物（C/C++ 的可执行文件）的绝对路径
 * {workdir}: 工作文件夹的绝对路径
 * {main_class}: Java 的主类名
 *
 * 增加一种语言只需要在 language_registry 的构造函数中增加一项。
 */
namespace runner {

enum class language {
    PYTHON,
    C,
    CPP,
    JAVA,
    JAVASCRIPT
};

/**
 * @brief 获取语言的标识符，比如 "python"、"cpp"
 */
const char *get_language_name(language lang);

/**
 * @brief 编译器、解释器的可执行文件名
 * 可以是 PATH 中的命令名，也可以是绝对路径
 */
struct toolchain {
    std::string python = "python3";
    std::string node = "node";
    std::string cc = "gcc";
    std::string cxx = "g++";
    std::string javac = "javac";
    std::string java = "java";
};

struct language_descriptor {
    language id;

    /**
     * @brief 源代码保存的文件名
     * Java 要求文件名和 public class 的类名一致，因此固定为 Solution.java
     */
    std::string source_file_name;

    /**
     * @brief 编译命令模板，解释型语言为空
     */
    std::optional<std::vector<std::string>> compile_command;

    /**
     * @brief 运行命令模板
     */
    std::vector<std::string> run_command;
};

/**
 * @brief 将命令模板中的占位符替换为工作文件夹内的实际路径
 * @param command 命令模板，参见 language_descriptor
 * @param desc 该命令所属的语言
 * @param workdir 工作文件夹
 * @return 可以直接传给 run_process 的命令
 */
std::vector<std::string> expand_command(const std::vector<std::string> &command, const language_descriptor &desc, const std::filesystem::path &workdir);

/**
 * @brief 语言注册表
 * 构造完成后只读，可以被多个线程同时访问
 */
struct language_registry {
    explicit language_registry(const toolchain &tools = toolchain());

    /**
     * @brief 根据语言标识符查找语言配置
     * @param name 语言标识符，比如 "python"、"c"、"cpp"、"java"、"javascript"
     * @return 语言配置，若语言不受支持则返回 nullptr
     */
    const language_descriptor *find(const std::string &name) const;

    const language_descriptor &get(language lang) const;

    /**
     * @brief 所有受支持的语言标识符，按字典序排列
     */
    std::vector<std::string> names() const;

private:
    std::map<language, language_descriptor> descriptors;
};

}  // namespace runner
