/**
 * Craftkit - command line driver
 *
 * Thin front end over the authentication chain and the instance store.
 *
 *   craftkit-cli [--config <file>] login
 *   craftkit-cli [--config <file>] instances list
 *   craftkit-cli [--config <file>] instances create <name> [minecraft-version]
 *   craftkit-cli [--config <file>] instances add-mod <id> <file-name>
 */

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "core/Config.hpp"
#include "core/Logger.hpp"
#include "core/auth/AuthErrors.hpp"
#include "core/auth/LoopbackRedirectListener.hpp"
#include "core/auth/MicrosoftAuth.hpp"
#include "core/instance/InstanceStore.hpp"
#include "utils/HttpClient.hpp"
#include "utils/PathUtils.hpp"

using namespace craftkit;

namespace {

// Shared with the signal handler; cancels a pending browser login
core::auth::CancellationToken g_cancel;

void signalHandler(int) {
    g_cancel.cancel();
}

void printUsage() {
    std::cerr << "Usage: craftkit-cli [--config <file>] <command>\n"
              << "Commands:\n"
              << "  login\n"
              << "  instances list\n"
              << "  instances create <name> [minecraft-version]\n"
              << "  instances add-mod <id> <file-name>\n";
}

int runLogin(const core::Config& config) {
    auto settings = core::auth::AuthSettings::fromConfig(config);
    if (settings.clientId.empty()) {
        std::cerr << "auth.clientId is not configured\n";
        return 2;
    }
    settings.cacheFile = utils::PathUtils::resolve(settings.cacheFile).string();

    utils::HttpClient http(settings.http);
    core::auth::SystemBrowserLauncher browser;
    core::auth::LoopbackRedirectListener listener;
    core::auth::MicrosoftAuth auth(http, browser, listener, settings);

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    auto token = auth.getMinecraftBearerAccessToken(g_cancel);
    if (!token) {
        std::cerr << "Authentication produced no token\n";
        return 1;
    }

    std::cout << "Minecraft bearer token (" << token->size() << " chars): "
              << token->substr(0, 16) << "...\n";
    return 0;
}

int runInstances(const core::Config& config, const std::vector<std::string>& args) {
    instance::InstanceStore store(utils::PathUtils::resolve(config.get<std::string>("instances.root", "instances")));

    if (args.empty() || args[0] == "list") {
        for (const auto& inst : store.all()) {
            std::cout << inst.id << "  " << inst.name << "  " << inst.minecraftVersion
                      << "  " << inst.mods.size() << " mods  " << inst.path << "\n";
        }
        return 0;
    }

    if (args[0] == "create" && args.size() >= 2) {
        instance::InstanceModel model;
        model.name = args[1];
        if (args.size() >= 3) model.minecraftVersion = args[2];

        auto created = store.create(model);
        std::cout << created.id << "  " << created.path << "\n";
        return 0;
    }

    if (args[0] == "add-mod" && args.size() >= 3) {
        auto target = store.byId(args[1]);

        instance::ModModel mod;
        mod.fileName = args[2];
        mod.name = args[2];
        store.addMod(target, mod);

        std::cout << target.name << " now has " << target.mods.size() << " mods\n";
        return 0;
    }

    printUsage();
    return 2;
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    core::Config config;
    if (args.size() >= 2 && args[0] == "--config") {
        if (!config.load(args[1])) {
            std::cerr << "Cannot read config file " << args[1] << "\n";
            return 2;
        }
        args.erase(args.begin(), args.begin() + 2);
    }

    core::Logger::instance().initialize(config);

    if (args.empty()) {
        printUsage();
        return 2;
    }

    try {
        if (args[0] == "login") {
            return runLogin(config);
        }
        if (args[0] == "instances") {
            return runInstances(config, std::vector<std::string>(args.begin() + 1, args.end()));
        }
    } catch (const core::auth::XSTSException& e) {
        LOG_ERROR("{}", e.what());
        if (!e.reason().empty()) std::cerr << e.reason() << "\n";
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("{}", e.what());
        return 1;
    }

    printUsage();
    return 2;
}
