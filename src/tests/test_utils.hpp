#ifndef GHOSTNET_TEST_UTILS_HPP
#define GHOSTNET_TEST_UTILS_HPP

#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <random>
#include <string>
#include <thread>
#include <unistd.h>

// Set logging severity level and configure logging
inline void init_logging(boost::log::trivial::severity_level level = boost::log::trivial::debug) {
    // Remove any existing sinks to prevent duplicates
    boost::log::core::get()->remove_all_sinks();

    boost::log::register_simple_formatter_factory<boost::log::trivial::severity_level, char>("Severity");

    boost::log::add_console_log(
        std::cout,
        boost::log::keywords::format = "[%TimeStamp%] [%ThreadID%] [%Severity%] %Message%",
        boost::log::keywords::auto_flush = true
    );

    boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
    boost::log::add_common_attributes();
}

// Fresh directory under the system temp dir, removed by the destructor
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "ghostnet_test") {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                (prefix + "_" + std::to_string(::getpid()) + "_" + std::to_string(++counter));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

// Polls `condition` until it holds or `timeout` elapses
inline bool wait_until(const std::function<bool()>& condition,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return condition();
}

inline std::string generate_random_data(size_t size, unsigned seed = 42) {
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dis(0, 255);
    std::string result(size, '\0');
    for (auto& c : result) {
        c = static_cast<char>(dis(gen));
    }
    return result;
}

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

#endif // GHOSTNET_TEST_UTILS_HPP
