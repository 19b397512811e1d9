#include "InstanceStore.hpp"
#include "../Logger.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>
#include <fstream>
#include <set>
#include <stdexcept>

namespace craftkit::instance {

namespace fs = std::filesystem;
using utils::StringUtils;

InstanceStore::InstanceStore(const fs::path& root) {
    fs::create_directories(root);
    m_root = fs::absolute(root).lexically_normal();
    loadAll();
}

InstanceModel InstanceStore::create(InstanceModel instance) {
    if (m_instances.count(instance.id)) {
        throw std::invalid_argument("Instance id already registered: " + instance.id);
    }
    instance.store = this;

    fs::path directory = m_root / uniqueDirectoryName(instance.name);
    fs::create_directories(directory);
    instance.path = directory.string();

    core::Logger::instance().info("Created instance: {} ({}) at {}", instance.name, instance.id, instance.path);
    const std::string id = instance.id;
    return save(id, std::move(instance));
}

InstanceModel InstanceStore::save(const std::string& id, InstanceModel instance) {
    if (id != instance.id) {
        throw std::invalid_argument("Cannot save instance " + instance.id + " under id " + id);
    }

    fs::path file = fs::path(instance.path) / INSTANCE_FILE;
    core::Logger::instance().debug("Saving instance to file: {}", file.string());

    instance.store = this;
    // Never move backwards, even if the clock does
    instance.lastModified = std::max(std::chrono::system_clock::now(), instance.lastModified);

    fs::create_directories(file.parent_path());
    std::ofstream out(file, std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot write instance file: " + file.string());
    }
    out << instance.toJson().dump(4);
    out.close();
    if (!out) {
        throw std::runtime_error("Failed writing instance file: " + file.string());
    }

    // Registered only once the record is on disk
    m_instances[instance.id] = instance;
    return instance;
}

void InstanceStore::loadAll() {
    m_instances.clear();
    scanDirectory(m_root);
    core::Logger::instance().info("Loaded {} instances from {}", m_instances.size(), m_root.string());
}

// A directory that cannot be read is logged and skipped; its siblings are still scanned.
// Symlinked directories are not followed.
void InstanceStore::scanDirectory(const fs::path& directory) {
    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        core::Logger::instance().warn("Skipping unreadable directory {}: {}", directory.string(), ec.message());
        return;
    }

    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        const fs::path entry = it->path();

        std::error_code typeError;
        if (it->is_directory(typeError) && !it->is_symlink(typeError)) {
            scanDirectory(entry);
        } else if (entry.filename() == INSTANCE_FILE && it->is_regular_file(typeError)) {
            loadRecord(entry);
        }
    }

    if (ec) {
        core::Logger::instance().warn("Stopped scanning {}: {}", directory.string(), ec.message());
    }
}

void InstanceStore::loadRecord(const fs::path& file) {
    core::Logger::instance().debug("Attempting to load instance from file: {}", file.string());

    try {
        auto instance = readInstanceFile(file);
        if (!instance) {
            core::Logger::instance().error("Failed to load instance file: {}", file.string());
            return;
        }

        if (m_instances.count(instance->id)) {
            core::Logger::instance().error("Duplicate instance id {} in {}, skipping",
                                           instance->id, file.string());
            return;
        }

        instance->store = this;
        m_instances.emplace(instance->id, std::move(*instance));
        core::Logger::instance().debug("Successfully loaded instance from file: {}", file.string());

    } catch (const std::exception& e) {
        core::Logger::instance().error("Failed to load instance file {}: {}", file.string(), e.what());
    }
}

std::optional<InstanceModel> InstanceStore::loadOne(const fs::path& directory) {
    auto instance = readInstanceFile(directory / INSTANCE_FILE);
    if (!instance) {
        return std::nullopt;
    }

    instance->store = this;
    m_instances[instance->id] = *instance;
    return instance;
}

void InstanceStore::addMod(InstanceModel& instance, const ModModel& mod) {
    InstanceModel updated = instance;
    updated.mods.push_back(mod);
    const std::string id = updated.id;
    instance = save(id, std::move(updated));
}

std::vector<InstanceModel> InstanceStore::byName(const std::string& name) const {
    std::vector<InstanceModel> matches;
    for (const auto& [id, instance] : m_instances) {
        if (instance.name == name) matches.push_back(instance);
    }
    return matches;
}

InstanceModel InstanceStore::firstByName(const std::string& name) const {
    auto it = std::find_if(m_instances.begin(), m_instances.end(),
        [&name](const auto& entry) { return entry.second.name == name; });

    if (it == m_instances.end()) {
        throw InstanceNotFoundException("No instance named '" + name + "'");
    }
    return it->second;
}

InstanceModel InstanceStore::byId(const std::string& id) const {
    auto it = m_instances.find(id);
    if (it == m_instances.end()) {
        throw InstanceNotFoundException("No instance with id '" + id + "'");
    }
    return it->second;
}

bool InstanceStore::exists(const std::string& name) const {
    return std::any_of(m_instances.begin(), m_instances.end(),
        [&name](const auto& entry) { return entry.second.name == name; });
}

std::vector<InstanceModel> InstanceStore::all() const {
    std::vector<InstanceModel> result;
    result.reserve(m_instances.size());
    for (const auto& [id, instance] : m_instances) {
        result.push_back(instance);
    }
    return result;
}

std::string InstanceStore::uniqueDirectoryName(const std::string& name) const {
    std::string base = StringUtils::sanitizeFileName(name);
    if (StringUtils::trim(base).empty() || base == "." || base == "..") {
        base = "instance";
    }

    std::set<std::string> taken;
    for (const auto& entry : fs::directory_iterator(m_root)) {
        taken.insert(StringUtils::toLower(entry.path().filename().string()));
    }

    std::string candidate = base;
    for (int index = 1; taken.count(StringUtils::toLower(candidate)); ++index) {
        candidate = base + " (" + std::to_string(index) + ")";
    }
    return candidate;
}

std::optional<InstanceModel> InstanceStore::readInstanceFile(const fs::path& file) {
    std::ifstream in(file);
    if (!in.is_open()) {
        return std::nullopt;
    }

    auto j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        throw InstanceFormatException("Malformed JSON in " + file.string());
    }
    InstanceModel instance = InstanceModel::fromJson(j);
    // The directory may have been moved since the record was written
    instance.path = file.parent_path().string();
    return instance;
}

} // namespace craftkit::instance
