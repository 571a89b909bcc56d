#include "platform.hpp"
#include <cstdlib>
#include <ctime>
#include <mutex>
#include <random>
#include <thread>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    std::error_code ec;
    fs::path dir = fs::temp_directory_path(ec);
    if (ec) return fs::path("/tmp");
    return dir;
}

bool open_owner_only(const fs::path& path, std::ofstream& out) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
    if (fd < 0) return false;
    // O_CREAT leaves the mode of an existing file alone
    int rc = fchmod(fd, 0600);
    ::close(fd);
    if (rc != 0) return false;

    out.open(path, std::ios::binary | std::ios::trunc);
    return static_cast<bool>(out);
}

fs::path temp_file(const std::string& prefix) {
    // pid + random for uniqueness across processes and threads
    static std::mutex rng_mutex;
    static std::mt19937 rng(static_cast<unsigned>(std::time(nullptr)) ^
                            static_cast<unsigned>(getpid()));
    std::uniform_int_distribution<int> dist(10000, 99999);
    std::lock_guard<std::mutex> lock(rng_mutex);
    return temp_dir() / (prefix + "_" + std::to_string(getpid()) + "_" + std::to_string(dist(rng)));
}

void sleep_ms(int ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

} // namespace platform
