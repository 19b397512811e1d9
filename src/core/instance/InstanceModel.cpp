#include "InstanceModel.hpp"
#include "InstanceStore.hpp"
#include "../../utils/StringUtils.hpp"

#include <chrono>
#include <cstdint>

namespace craftkit::instance {

namespace {

// Epoch milliseconds; anything system_clock cannot represent is a format error
std::chrono::system_clock::time_point parseTimestamp(const nlohmann::json& value) {
    using std::chrono::milliseconds;
    const auto limit = std::chrono::duration_cast<milliseconds>(
        std::chrono::system_clock::duration::max()).count();

    if (value.is_number_unsigned()) {
        if (value.get<std::uint64_t>() > static_cast<std::uint64_t>(limit)) {
            throw InstanceFormatException("lastModified out of range: " + value.dump());
        }
    } else if (!value.is_number_integer()) {
        throw InstanceFormatException("lastModified is not an integer: " + value.dump());
    }

    const std::int64_t ms = value.get<std::int64_t>();
    if (ms > limit || ms < -limit) {
        throw InstanceFormatException("lastModified out of range: " + value.dump());
    }
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(milliseconds(ms)));
}

} // namespace

// JSON serialization implementations
nlohmann::json ModModel::toJson() const {
    return {
        {"id", id},
        {"name", name},
        {"fileName", fileName},
        {"version", version},
        {"downloadUrl", downloadUrl},
        {"sha1", sha1},
        {"enabled", enabled}
    };
}

ModModel ModModel::fromJson(const nlohmann::json& j) {
    ModModel mod;
    mod.id = j.value("id", "");
    mod.name = j.value("name", "");
    mod.fileName = j.value("fileName", "");
    mod.version = j.value("version", "");
    mod.downloadUrl = j.value("downloadUrl", "");
    mod.sha1 = j.value("sha1", "");
    mod.enabled = j.value("enabled", true);
    return mod;
}

nlohmann::json RamInfo::toJson() const {
    return {
        {"minimumRamMB", minimumRamMB},
        {"maximumRamMB", maximumRamMB}
    };
}

RamInfo RamInfo::fromJson(const nlohmann::json& j) {
    RamInfo ram;
    ram.minimumRamMB = j.value("minimumRamMB", 4096);
    ram.maximumRamMB = j.value("maximumRamMB", 4096);
    return ram;
}

std::string toString(ModLoaders loader) {
    switch (loader) {
        case ModLoaders::Forge:    return "forge";
        case ModLoaders::Fabric:   return "fabric";
        case ModLoaders::Quilt:    return "quilt";
        case ModLoaders::NeoForge: return "neoforge";
        case ModLoaders::None:
        default:                   return "none";
    }
}

ModLoaders modLoaderFromString(const std::string& name) {
    auto lower = utils::StringUtils::toLower(name);
    if (lower == "forge") return ModLoaders::Forge;
    if (lower == "fabric") return ModLoaders::Fabric;
    if (lower == "quilt") return ModLoaders::Quilt;
    if (lower == "neoforge") return ModLoaders::NeoForge;
    return ModLoaders::None;
}

nlohmann::json ModLoaderModel::toJson() const {
    return {
        {"modloader", toString(modloader)},
        {"version", version}
    };
}

ModLoaderModel ModLoaderModel::fromJson(const nlohmann::json& j) {
    ModLoaderModel loader;
    loader.modloader = modLoaderFromString(j.value("modloader", "none"));
    loader.version = j.value("version", "");
    return loader;
}

// InstanceModel

InstanceModel::InstanceModel()
    : id(utils::StringUtils::generateUUID())
    , lastModified(std::chrono::system_clock::now()) {}

void InstanceModel::save() {
    if (!store) {
        throw std::logic_error("Instance '" + name + "' is not attached to a store");
    }
    *this = store->save(id, *this);
}

nlohmann::json InstanceModel::toJson() const {
    nlohmann::json modsJson = nlohmann::json::array();
    for (const auto& mod : mods) {
        modsJson.push_back(mod.toJson());
    }

    return {
        {"id", id},
        {"name", name},
        {"description", description},
        {"minecraftVersion", minecraftVersion},
        {"modLoader", modLoader.toJson()},
        {"javaPath", javaPath},
        {"windowWidth", windowWidth},
        {"windowHeight", windowHeight},
        {"ram", ram.toJson()},
        {"mods", modsJson},
        {"path", path},
        {"lastModified", std::chrono::duration_cast<std::chrono::milliseconds>(
            lastModified.time_since_epoch()).count()}
    };
}

InstanceModel InstanceModel::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw InstanceFormatException("Instance record is not a JSON object");
    }
    if (!j.contains("id") || !j["id"].is_string() || j["id"].get<std::string>().empty()) {
        throw InstanceFormatException("Instance record has no id");
    }

    try {
        InstanceModel instance;
        instance.id = j["id"].get<std::string>();
        instance.name = j.value("name", "");
        instance.description = j.value("description", "");
        instance.minecraftVersion = j.value("minecraftVersion", "");
        instance.javaPath = j.value("javaPath", "");
        instance.windowWidth = j.value("windowWidth", 854);
        instance.windowHeight = j.value("windowHeight", 480);
        instance.path = j.value("path", "");
        instance.lastModified = j.contains("lastModified")
            ? parseTimestamp(j.at("lastModified"))
            : std::chrono::system_clock::time_point{};

        if (j.contains("modLoader")) {
            instance.modLoader = ModLoaderModel::fromJson(j["modLoader"]);
        }
        if (j.contains("ram")) {
            instance.ram = RamInfo::fromJson(j["ram"]);
        }
        if (j.contains("mods") && j["mods"].is_array()) {
            for (const auto& m : j["mods"]) {
                instance.mods.push_back(ModModel::fromJson(m));
            }
        }

        return instance;

    } catch (const nlohmann::json::exception& e) {
        throw InstanceFormatException(std::string("Invalid instance record: ") + e.what());
    }
}

} // namespace craftkit::instance
