#include <ctime>
#include <sstream>
#include <sys/utsname.h>
#include "sandbox_probe/utils.hpp"
#include "sandbox_probe/runtime.hpp"

namespace sandbox_probe {

    namespace {
        std::string language_standard() {
            switch (__cplusplus) {
                case 201103L: return "C++11";
                case 201402L: return "C++14";
                case 201703L: return "C++17";
                case 202002L: return "C++20";
                case 202302L: return "C++23";
                default: return "C++ (" + std::to_string(static_cast<long>(__cplusplus)) + ")";
            }
        }

        std::string compiler_version() {
#if defined(__clang__)
            return "clang " __clang_version__;
#elif defined(__GNUC__)
            return "g++ " __VERSION__;
#else
            return std::string();
#endif
        }
    }

    std::string runtime_version() {
        const std::string compiler = compiler_version();
        if (compiler.empty()) {
            return language_standard();
        }
        return language_standard() + " (" + compiler + ")";
    }

    std::string host_description() {
        struct utsname buffer {};
        if (uname(&buffer) != 0) {
            return "unknown";
        }
        std::ostringstream oss;
        oss << buffer.sysname << ' ' << buffer.release << " (" << buffer.machine << ')';
        return oss.str();
    }

    std::string utc_timestamp() {
        return format_utc_time(std::time(nullptr));
    }
}
