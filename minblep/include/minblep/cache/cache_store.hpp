#pragma once

#include "snapshot.hpp"
#include "../table/min_bleps.hpp"
#include <filesystem>
#include <string>

namespace minblep {

/// Where DirectoryCacheStore keeps its files
struct CacheConfig {
    std::filesystem::path directory;

    /// MINBLEP_CACHE_DIR, else $XDG_CACHE_HOME/minblep, else
    /// $HOME/.cache/minblep, else <temp>/minblep-cache
    [[nodiscard]] static CacheConfig from_environment();
};

/// Persistent table storage keyed by cache_key()
class CacheStore {
public:
    virtual ~CacheStore() = default;

    [[nodiscard]] virtual bool exists(const std::string& key) const = 0;

    /// Throws CacheError if the entry is missing, unreadable or corrupt
    [[nodiscard]] virtual MinBleps load(const std::string& key) const = 0;

    /// Publish `table` under `key`; readers see either no entry or the
    /// complete one. Throws CacheError on failure.
    virtual void atomic_store(const std::string& key, const MinBleps& table) = 0;
};

/// One snapshot file per key. Writes go to a unique sibling temporary file
/// which is then renamed over the key's path.
class DirectoryCacheStore : public CacheStore {
public:
    explicit DirectoryCacheStore(CacheConfig config);

    [[nodiscard]] bool exists(const std::string& key) const override;
    [[nodiscard]] MinBleps load(const std::string& key) const override;
    void atomic_store(const std::string& key, const MinBleps& table) override;

    /// Fully write and flush a snapshot next to the key's path, unpublished
    [[nodiscard]] std::filesystem::path write_temporary(const std::string& key,
                                                        const MinBleps& table) const;

    /// Atomically move a temporary written by write_temporary() into place
    void publish(const std::filesystem::path& temporary, const std::string& key) const;

    [[nodiscard]] std::filesystem::path path_for(const std::string& key) const;
    [[nodiscard]] const CacheConfig& config() const noexcept { return config_; }

private:
    CacheConfig config_;
};

}  // namespace minblep
