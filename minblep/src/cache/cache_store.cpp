#include "minblep/cache/cache_store.hpp"
#include "minblep/errors.hpp"
#include "minblep/log.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <system_error>
#include <vector>
#include <unistd.h>

namespace minblep {

namespace {

std::filesystem::path env_path(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') return {};
    return value;
}

// Unique per process and call, so concurrent writers never share a temporary
std::string temporary_suffix() {
    static std::atomic<std::uint64_t> counter{0};
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    return ".tmp." + std::to_string(::getpid()) + "." +
           std::to_string(counter.fetch_add(1, std::memory_order_relaxed)) + "." +
           std::to_string(now);
}

}  // namespace

CacheConfig CacheConfig::from_environment() {
    CacheConfig config;
    if (auto dir = env_path("MINBLEP_CACHE_DIR"); !dir.empty()) {
        config.directory = dir;
    } else if (auto xdg = env_path("XDG_CACHE_HOME"); !xdg.empty()) {
        config.directory = xdg / "minblep";
    } else if (auto home = env_path("HOME"); !home.empty()) {
        config.directory = home / ".cache" / "minblep";
    } else {
        config.directory = std::filesystem::temp_directory_path() / "minblep-cache";
    }
    return config;
}

DirectoryCacheStore::DirectoryCacheStore(CacheConfig config) : config_(std::move(config)) {}

std::filesystem::path DirectoryCacheStore::path_for(const std::string& key) const {
    return config_.directory / key;
}

bool DirectoryCacheStore::exists(const std::string& key) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(path_for(key), ec);
}

MinBleps DirectoryCacheStore::load(const std::string& key) const {
    const auto path = path_for(key);
    log_debug("Loading cached minBLEPs: " + path.string());

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw CacheError("Failed to open cache entry: " + path.string());
    }
    std::vector<std::uint8_t> buffer((std::istreambuf_iterator<char>(file)),
                                     std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw CacheError("Failed to read cache entry: " + path.string());
    }

    auto snapshot = Snapshot::decode(buffer.data(), buffer.size());
    if (!snapshot.success) {
        throw CacheError(snapshot.error_message + ": " + path.string());
    }

    log_debug("Cached minBLEPs loaded.");
    return MinBleps(std::move(snapshot.table));
}

std::filesystem::path DirectoryCacheStore::write_temporary(const std::string& key,
                                                           const MinBleps& table) const {
    std::error_code ec;
    std::filesystem::create_directories(config_.directory, ec);
    if (ec) {
        throw CacheError("Failed to create cache directory " + config_.directory.string() +
                         ": " + ec.message());
    }

    auto temporary = path_for(key);
    temporary += temporary_suffix();

    const auto bytes = Snapshot::encode(table.data());
    {
        std::ofstream file(temporary, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw CacheError("Failed to create temporary cache file: " + temporary.string());
        }
        file.write(reinterpret_cast<const char*>(bytes.data()),
                   static_cast<std::streamsize>(bytes.size()));
        file.flush();
        if (!file) {
            file.close();
            std::filesystem::remove(temporary, ec);
            throw CacheError("Failed to write temporary cache file: " + temporary.string());
        }
    }
    return temporary;
}

void DirectoryCacheStore::publish(const std::filesystem::path& temporary,
                                  const std::string& key) const {
    std::error_code ec;
    std::filesystem::rename(temporary, path_for(key), ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temporary, ignored);
        log_error("Failed to publish cached minBLEPs: " + path_for(key).string());
        throw CacheError("Failed to publish cache entry " + path_for(key).string() + ": " +
                         ec.message());
    }
}

void DirectoryCacheStore::atomic_store(const std::string& key, const MinBleps& table) {
    publish(write_temporary(key, table), key);
}

}  // namespace minblep
