#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace craftkit::instance {

class InstanceStore;

// Mod attached to an instance
struct ModModel {
    std::string id;
    std::string name;
    std::string fileName;
    std::string version;
    std::string downloadUrl;
    std::string sha1;
    bool enabled = true;

    nlohmann::json toJson() const;
    static ModModel fromJson(const nlohmann::json& j);
};

// JVM heap limits
struct RamInfo {
    int minimumRamMB = 4096;
    int maximumRamMB = 4096;

    nlohmann::json toJson() const;
    static RamInfo fromJson(const nlohmann::json& j);
};

enum class ModLoaders {
    None,
    Forge,
    Fabric,
    Quilt,
    NeoForge
};

std::string toString(ModLoaders loader);
ModLoaders modLoaderFromString(const std::string& name);

struct ModLoaderModel {
    ModLoaders modloader = ModLoaders::None;
    std::string version;

    nlohmann::json toJson() const;
    static ModLoaderModel fromJson(const nlohmann::json& j);
};

/**
 * Thrown when an instance.json does not describe an instance
 */
class InstanceFormatException : public std::runtime_error {
public:
    explicit InstanceFormatException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Thrown by lookups that find nothing
 */
class InstanceNotFoundException : public std::runtime_error {
public:
    explicit InstanceNotFoundException(const std::string& message)
        : std::runtime_error(message) {}
};

// One installation, persisted as <path>/instance.json
struct InstanceModel {
    InstanceModel();

    std::string id;
    std::string name;
    std::string description;
    std::string minecraftVersion;
    ModLoaderModel modLoader;
    std::string javaPath;
    int windowWidth = 854;
    int windowHeight = 480;
    RamInfo ram;
    std::vector<ModModel> mods;
    std::string path;
    std::chrono::system_clock::time_point lastModified;

    // Store that manages this instance; not owned, not serialized
    InstanceStore* store = nullptr;

    /**
     * Save through the owning store
     * @throws std::logic_error if the instance was never registered
     */
    void save();

    nlohmann::json toJson() const;

    /**
     * @throws InstanceFormatException when id is missing or a field has the wrong type
     */
    static InstanceModel fromJson(const nlohmann::json& j);
};

} // namespace craftkit::instance
