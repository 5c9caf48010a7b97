// tests/test_main.cpp
#include "test_framework.hpp"

// No tests here; all tests are registered via static initializers
// in the other compilation units. This TU just provides main().
// An optional argument filters tests by name prefix.
int main(int argc, char** argv) {
    const std::string filter = argc > 1 ? argv[1] : "";
    const auto& tests = tfw::registry();
    std::size_t ran = 0, passed = 0;
    for (const auto& test : tests) {
        if (!filter.empty() && test.name.rfind(filter, 0) != 0) continue;
        ++ran;
        std::cout << "[ RUN      ] " << test.name << std::endl;
        auto start = std::chrono::steady_clock::now();
        auto elapsed = [&start]{
            return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        };
        try {
            test.fn();
            std::cout << "[       OK ] " << test.name << " (" << elapsed() << "s)" << std::endl;
            ++passed;
        } catch (const tfw::Failure& e) {
            std::cout << e.what() << std::endl;
            std::cout << "[  FAILED  ] " << test.name << " (" << elapsed() << "s)" << std::endl;
        } catch (const std::exception& e) {
            std::cout << "[  EXCEPTION  ] " << test.name << ": " << e.what() << " (" << elapsed() << "s)" << std::endl;
        }
    }
    std::cout << "[==========] " << ran << " tests ran. " << passed << " passed, " << (ran - passed) << " failed." << std::endl;
    return (passed == ran) ? 0 : 1;
}
