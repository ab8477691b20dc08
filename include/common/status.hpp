#pragma once

namespace runner {

/**
 * @brief 表示一次执行的评测结果
 * 每次执行恰好产生其中一种结果
 */
enum class status {
    /**
     * @brief 程序正常运行结束，且返回码为 0
     * 不代表输出正确，输出比对由 check_solution 完成
     */
    ACCEPTED,

    /**
     * @brief 程序编译错误
     * 编译器返回了非零返回码，此时不会进入运行阶段
     */
    COMPILATION_ERROR,

    /**
     * @brief 程序运行时间超出限制
     * 只比较时钟时间。编译超时也会返回该结果
     */
    TIME_LIMIT_EXCEEDED,

    /**
     * @brief 程序运行时返回了非零返回码，或者因为信号崩溃
     */
    RUNTIME_ERROR,

    /**
     * @brief 请求的编程语言不受支持
     */
    UNSUPPORTED,

    /**
     * @brief 编译器不存在或者无法启动
     */
    COMPILER_NOT_FOUND,

    /**
     * @brief 解释器、虚拟机或者编译出的可执行文件无法启动
     */
    RUNTIME_NOT_FOUND,

    /**
     * @brief 内部错误，执行引擎本身出错
     * 比如无法创建工作文件夹、fork 失败
     */
    INTERNAL_ERROR
};

/**
 * @brief 获取评测结果的显示文本，对于 status_id 相同的结果，以该文本区分
 */
const char *get_display_message(status);

/**
 * @brief 获取与 Judge0 兼容的评测结果编号
 * 3: Accepted, 5: Time Limit Exceeded, 6: Compilation Error, 11: Runtime Error,
 * 其他结果均为 -1
 */
int get_status_id(status);

}  // namespace runner
