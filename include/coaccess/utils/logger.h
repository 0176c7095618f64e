#pragma once

#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>

namespace coaccess {

class Logger {
   private:
    template <typename... Args>
    static std::string format_args(Args&&... args) {
        std::ostringstream oss;
        (oss << ... << std::forward<Args>(args));
        return oss.str();
    }

    static std::string_view base_name(std::string_view path) noexcept {
        if (auto pos = path.rfind('/'); pos != std::string_view::npos) {
            return path.substr(pos + 1);
        }
        return path;
    }

    // lines from different event loops must not interleave
    static std::mutex& output_mutex() {
        static std::mutex mutex;
        return mutex;
    }

   public:
    template <typename... Args>
    static void log(const char* file, const char* function, int line, Args&&... args) {
        auto message = format_args(std::forward<Args>(args)...);

        std::lock_guard<std::mutex> lock(output_mutex());
        std::cout << "[" << base_name(file) << ":" << function << ":" << line << "]["
                  << std::this_thread::get_id() << "] " << message << std::endl;
    }
};

}  // namespace coaccess

#ifdef COACCESS_ENABLE_LOG
#define COACCESS_LOG(...) ::coaccess::Logger::log(__FILE__, __FUNCTION__, __LINE__, __VA_ARGS__)
#else
#define COACCESS_LOG(...) \
    do {                  \
    } while (0)
#endif
