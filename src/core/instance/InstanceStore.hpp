#pragma once

#include "InstanceModel.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace craftkit::instance {

/**
 * InstanceStore - directory of per-instance JSON records
 *
 * Each instance lives in its own subdirectory of the root, named after the
 * instance and disambiguated with " (n)" on collision, and is described by
 * an instance.json inside it. The in-memory map is keyed by instance id.
 *
 * Not thread-safe: the map and the files are mutated without locking.
 */
class InstanceStore {
public:
    static constexpr const char* INSTANCE_FILE = "instance.json";

    /**
     * Create the root directory if needed and load every instance under it
     */
    explicit InstanceStore(const std::filesystem::path& root);

    InstanceStore(const InstanceStore&) = delete;
    InstanceStore& operator=(const InstanceStore&) = delete;

    /**
     * Allocate a directory for the instance, persist and register it
     * @return The instance with path and store populated
     * @throws std::invalid_argument if the id is already registered
     */
    InstanceModel create(InstanceModel instance);

    /**
     * Stamp lastModified, rewrite instance.json, then replace the entry for id.
     * The map is left untouched if the write fails.
     * @throws std::invalid_argument if id is not instance.id
     */
    InstanceModel save(const std::string& id, InstanceModel instance);

    /**
     * Rescan the root; unreadable records are logged and skipped
     */
    void loadAll();

    /**
     * Load <directory>/instance.json and register it
     * @return nullopt if the file does not exist
     * @throws InstanceFormatException if the file is malformed
     */
    std::optional<InstanceModel> loadOne(const std::filesystem::path& directory);

    /**
     * Append a mod and save; the caller's instance is updated in place
     */
    void addMod(InstanceModel& instance, const ModModel& mod);

    // Lookups
    std::vector<InstanceModel> byName(const std::string& name) const;
    InstanceModel firstByName(const std::string& name) const;
    InstanceModel byId(const std::string& id) const;
    bool exists(const std::string& name) const;
    std::vector<InstanceModel> all() const;
    size_t size() const { return m_instances.size(); }

    const std::filesystem::path& root() const { return m_root; }

private:
    std::string uniqueDirectoryName(const std::string& name) const;
    void scanDirectory(const std::filesystem::path& directory);
    void loadRecord(const std::filesystem::path& file);
    static std::optional<InstanceModel> readInstanceFile(const std::filesystem::path& file);

    std::filesystem::path m_root;
    std::map<std::string, InstanceModel> m_instances;
};

} // namespace craftkit::instance
