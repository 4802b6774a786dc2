#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <numeric>
#include <span>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <parafetch/fetcher/progress_channel.hpp>

namespace parafetch::test_support {

// Owns a unique directory under the system temp dir and removes it on destruction.
class TempDirScope {
public:
    explicit TempDirScope(std::filesystem::path root) : root_(std::move(root)) {}
    TempDirScope(const TempDirScope&) = delete;
    TempDirScope& operator=(const TempDirScope&) = delete;

    ~TempDirScope() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& path() const { return root_; }
    std::filesystem::path operator/(const std::string& child) const { return root_ / child; }

    static TempDirScope unique_under(const std::string& base_name) {
        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
        auto n = counter_.fetch_add(1, std::memory_order_relaxed);
        auto root = std::filesystem::temp_directory_path() /
                    (base_name + "-" + std::to_string(now) + "-" + std::to_string(tid) + "-" +
                     std::to_string(n));
        std::error_code ec;
        std::filesystem::create_directories(root, ec);
        return TempDirScope(root);
    }

private:
    std::filesystem::path root_;
    static inline std::atomic<std::uint64_t> counter_{0};
};

// Deterministic body: byte i is (i * 131 + 7) % 251. Digests of the 10485760-byte body
// are pinned in fetcher_test.cpp.
inline std::vector<std::byte> make_payload(std::size_t size) {
    std::vector<std::byte> out(size);
    for (std::size_t i = 0; i < size; ++i)
        out[i] = static_cast<std::byte>((i * 131 + 7) % 251);
    return out;
}

inline void write_file(const std::filesystem::path& path, std::span<const std::byte> data) {
    if (path.has_parent_path())
        std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
}

inline std::vector<std::byte> read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::vector<char> raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    std::vector<std::byte> out(raw.size());
    for (std::size_t i = 0; i < raw.size(); ++i)
        out[i] = static_cast<std::byte>(raw[i]);
    return out;
}

inline std::vector<std::byte> read_all(std::istream& in) {
    std::vector<char> raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    std::vector<std::byte> out(raw.size());
    for (std::size_t i = 0; i < raw.size(); ++i)
        out[i] = static_cast<std::byte>(raw[i]);
    return out;
}

// Empties a closed channel. Only valid once the producer side has closed it.
inline std::vector<ProgressReport> drain(ProgressChannel& channel) {
    std::vector<ProgressReport> out;
    while (auto r = channel.receive())
        out.push_back(*r);
    return out;
}

inline std::int64_t sum_written(const std::vector<ProgressReport>& reports) {
    return std::accumulate(reports.begin(), reports.end(), std::int64_t{0},
                           [](std::int64_t acc, const ProgressReport& r) {
                               return acc + r.writtenBytes;
                           });
}

} // namespace parafetch::test_support
