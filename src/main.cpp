#include "cart.hpp"
#include "defaults.hpp"
#include "has_one_product_rule.hpp"
#include "in_memory_services.hpp"
#include "mapping.hpp"
#include "models.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

enum class Command {
    Check,
    ConfigUrl,
    Install,
    Uninstall,
};

struct Config {
    Command                    command = Command::Check;
    std::string                storeFile;
    std::string                requestFile;
    std::optional<int>         requirementId;
    std::optional<std::string> restrictions;
    int                        discountId = 0;
    bool                       cartsShared = false;
    bool                       lenient     = false;
    bool                       verbose     = false;
};

static void printUsage() {
    std::cout
        << "Usage: discount_rules [options]\n\n"
        << "Checks the \"has one product\" discount requirement for a cart.\n\n"
        << "Options:\n"
        << "  --request FILE         Validation request JSON (customer, cart, store)\n"
        << "  --store FILE           Settings / requirements / locale resources JSON\n"
        << "  --requirement-id N     Override the request's requirement id\n"
        << "  --restrictions STR     Restricted product list to check against,\n"
        << "                         e.g. \"77, 123:2, 156:3-8\"\n"
        << "  --carts-shared         Ignore store boundaries when reading the cart\n"
        << "  --lenient              Skip malformed tokens instead of failing\n"
        << "  --config-url ID        Print the configuration URL for discount ID\n"
        << "  --install              Register locale resources, print store contents\n"
        << "  --uninstall            Remove requirements and resources, print store contents\n"
        << "  --verbose              Enable verbose diagnostics\n"
        << "  --help, -h             Show this message\n";
}

static Config parseArgs(int argc, char* argv[]) {
    Config cfg;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if ((arg == "--request") && i + 1 < argc) {
            cfg.requestFile = argv[++i];
        } else if ((arg == "--store") && i + 1 < argc) {
            cfg.storeFile = argv[++i];
        } else if ((arg == "--requirement-id") && i + 1 < argc) {
            cfg.requirementId = std::stoi(argv[++i]);
        } else if ((arg == "--restrictions") && i + 1 < argc) {
            cfg.restrictions = argv[++i];
        } else if ((arg == "--config-url") && i + 1 < argc) {
            cfg.command    = Command::ConfigUrl;
            cfg.discountId = std::stoi(argv[++i]);
        } else if (arg == "--install") {
            cfg.command = Command::Install;
        } else if (arg == "--uninstall") {
            cfg.command = Command::Uninstall;
        } else if (arg == "--carts-shared") {
            cfg.cartsShared = true;
        } else if (arg == "--lenient") {
            cfg.lenient = true;
        } else if (arg == "--verbose") {
            cfg.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n\n";
            printUsage();
            std::exit(1);
        }
    }

    if (cfg.command == Command::Check && cfg.requestFile.empty()) {
        std::cerr << "Missing --request\n\n";
        printUsage();
        std::exit(1);
    }
    return cfg;
}

static nlohmann::json readJsonFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open " + path);
    }
    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
}

static discount_rules::StoreContents
snapshot(const discount_rules::InMemorySettingStore& settings,
         const discount_rules::InMemoryDiscountRequirementStore& requirements,
         const discount_rules::InMemoryLocaleResourceStore& resources) {
    discount_rules::StoreContents contents;
    contents.settings             = settings.all();
    contents.discountRequirements = requirements.getAllRequirements();
    contents.localeResources      = resources.all();
    return contents;
}

int main(int argc, char* argv[]) {
    using namespace discount_rules;

    try {
        Config cfg = parseArgs(argc, argv);

        InMemorySettingStore             settings;
        InMemoryDiscountRequirementStore requirements;
        InMemoryLocaleResourceStore      resources;
        RouteUrlHelper                   urlHelper;

        if (!cfg.storeFile.empty()) {
            const auto contents = parseStoreContents(readJsonFile(cfg.storeFile));
            for (const auto& [key, value] : contents.settings) {
                settings.setSetting(key, value);
            }
            for (const auto& r : contents.discountRequirements) {
                requirements.add(r);
            }
            for (const auto& [key, value] : contents.localeResources) {
                resources.addOrUpdate(key, value);
            }
        }

        RuleOptions options;
        options.cartsSharedBetweenStores = cfg.cartsShared;
        options.malformedTokenPolicy     = cfg.lenient
            ? MalformedTokenPolicy::SkipToken
            : MalformedTokenPolicy::AbortEvaluation;
        options.verbose = cfg.verbose;

        HasOneProductRule rule(settings, requirements, resources, urlHelper, options);

        switch (cfg.command) {
            case Command::ConfigUrl:
                std::cout << rule.getConfigurationUrl(cfg.discountId, cfg.requirementId)
                          << "\n";
                return 0;

            case Command::Install:
                rule.install();
                std::cout << std::setw(2)
                          << toJson(snapshot(settings, requirements, resources)) << "\n";
                return 0;

            case Command::Uninstall:
                rule.uninstall();
                std::cout << std::setw(2)
                          << toJson(snapshot(settings, requirements, resources)) << "\n";
                return 0;

            case Command::Check:
                break;
        }

        auto request = parseValidationRequest(readJsonFile(cfg.requestFile));
        if (cfg.requirementId) {
            request.discountRequirementId = *cfg.requirementId;
        }
        if (cfg.restrictions) {
            settings.setSetting(defaults::settingsKey(request.discountRequirementId),
                                *cfg.restrictions);
        }

        const auto result = rule.checkRequirement(request);

        std::cout
            << "=== discount_rules ===\n"
            << "Requirement:   " << request.discountRequirementId << "\n"
            << "Store:         " << request.store.id << "\n"
            << "Restrictions:  "
            << settings.getSettingByKey(defaults::settingsKey(request.discountRequirementId))
                   .value_or("(none)") << "\n";

        if (request.customer) {
            std::cout << "Customer:      " << request.customer->id << "\n"
                      << "Cart:\n";
            for (const auto& line : aggregateCart(*request.customer, request.store.id,
                                                  cfg.cartsShared)) {
                std::cout << "  product " << std::setw(8) << line.productId
                          << "  x " << line.totalQuantity << "\n";
            }
        } else {
            std::cout << "Customer:      (none)\n";
        }

        std::cout
            << "Result:        " << (result.isValid ? "VALID" : "INVALID") << "\n"
            << "======================\n";

        return result.isValid ? 0 : 2;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
