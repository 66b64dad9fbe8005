/**
 * @file test_programs.h
 * @brief 测试辅助：测试程序路径与临时目录
 */

#ifndef JUDGEBOX_TESTS_TEST_PROGRAMS_H
#define JUDGEBOX_TESTS_TEST_PROGRAMS_H

#include <string>
#include <unistd.h>

#ifndef JUDGEBOX_TEST_PROGRAMS_DIR
#error "JUDGEBOX_TEST_PROGRAMS_DIR must be defined by the build"
#endif

namespace judgebox {
namespace testing_support {

/// tests/programs 下编译出的测试程序
inline std::string program(const std::string &name) {
    return std::string(JUDGEBOX_TEST_PROGRAMS_DIR) + "/" + name;
}

/// 每个测试进程独立的 scratch 根目录
inline std::string scratch_root() {
    return "/tmp/judgebox_test_" + std::to_string(getpid());
}

} // namespace testing_support
} // namespace judgebox

#endif // JUDGEBOX_TESTS_TEST_PROGRAMS_H
