#pragma once

#include <cstddef>
#include <filesystem>

namespace runner {

/**
 * @brief 运行阶段默认的时钟时间限制
 * 单位为秒，请求没有指定时间限制或者指定了非正数时使用
 */
extern double DEFAULT_TIME_LIMIT;

/**
 * @brief 编译阶段的时钟时间限制
 * 单位为秒，编译阶段的时间限制与请求无关，所有请求共享
 */
extern double COMPILE_TIME_LIMIT;

/**
 * @brief 源代码的最大长度
 * 单位为字节，超过该长度的请求将被直接拒绝，不会创建工作文件夹
 */
extern std::size_t MAX_SOURCE_SIZE;

/**
 * @brief 每个输出流（stdout、stderr）最多保存多少数据
 * 单位为字节，超过的部分会被读取并丢弃，避免程序无限输出导致评测系统内存耗尽
 */
extern std::size_t OUTPUT_LIMIT;

/**
 * @brief 所有工作文件夹的根目录
 * RUN_DIR 的文件结构如下：
 *
 * RUN_DIR
 * ├── 6f1c...e2 // 随机生成的 uuid，一个执行请求对应一个文件夹
 * │   ├── code.cpp // 源代码，文件名由语言决定（Java 为 Solution.java）
 * │   └── program // 编译产物（C/C++），Java 为 Solution.class
 * └── ...
 *
 * 执行结束后对应的文件夹会被删除。
 */
extern std::filesystem::path RUN_DIR;

}  // namespace runner
