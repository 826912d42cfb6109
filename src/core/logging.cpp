#include "core/logging.hpp"
#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace core {

namespace {
std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

std::atomic<bool>& verbose_flag() {
    static std::atomic<bool> flag{std::getenv("LIVESCRIBE_DEBUG") != nullptr};
    return flag;
}
}

void set_verbose(bool on) { verbose_flag().store(on); }
bool is_verbose() { return verbose_flag().load(); }

void log_debug(const std::string& msg) {
    if (!is_verbose()) return;
    std::lock_guard<std::mutex> lock(log_mutex());
    std::cout << "[DEBUG] " << msg << std::endl;
}

void log_info(const std::string& msg) {
    std::lock_guard<std::mutex> lock(log_mutex());
    std::cout << "[INFO] " << msg << std::endl;
}

void log_warn(const std::string& msg) {
    std::lock_guard<std::mutex> lock(log_mutex());
    std::cout << "[WARN] " << msg << std::endl;
}

void log_error(const std::string& msg) {
    std::lock_guard<std::mutex> lock(log_mutex());
    std::cerr << "[ERROR] " << msg << std::endl;
}

}
