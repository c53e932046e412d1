#include "catalog/catalog_resolver.hpp"
#include "config/config_store.hpp"
#include "config/settings.hpp"
#include "deploy/deployment_engine.hpp"
#include "deploy/device_info.hpp"
#include "deploy/selection_flow.hpp"
#include "deploy/selection_writer.hpp"
#include "editions/edition_resolver.hpp"
#include "editions/image_inspector.hpp"
#include "editions/iso_inspector.hpp"
#include "util/logger.hpp"
#include "util/parse_utils.hpp"
#include "util/path_utils.hpp"

#include <cstdio>
#include <cstdlib>
#include <getopt.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace deployer;

namespace {

constexpr const char* kDefaultHandoffPath = "/tmp/pe-deployer-selection.json";

void PrintUsage(const char* argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [--settings <file>] --list-customers\n"
        "   %s [--settings <file>] -c <customer> [--list]\n"
        "   %s [--settings <file>] -c <customer> -m <image-id> [-e <index>] [options]\n"
        "\n"
        "Options:\n"
        "  -s, --settings <file>       Settings file (default %s)\n"
        "      --base-root <dir>       Base images root (overrides BaseImagesRoot)\n"
        "      --customer-root <dir>   Customer images root (overrides CustomerImagesRoot)\n"
        "      --config-root <dir>     Customer config root (overrides CustomerConfigRoot)\n"
        "      --list-customers        List customers with a Config.json\n"
        "  -c, --customer <name>       Customer to load\n"
        "  -l, --list                  Print the customer and base catalogs\n"
        "  -m, --image <id>            Catalog entry to deploy\n"
        "  -e, --edition-index <n>     Edition to deploy (base images and ISOs)\n"
        "  -o, --order <number>        Order number passed to the engine\n"
        "      --updates <yes|no>      RequiredUpdates for ISO deployments\n"
        "      --unattend <yes|no>     ApplyUnattend for ISO deployments\n"
        "      --drivers <yes|no>      DriverInject for ISO deployments\n"
        "      --handoff <file>        Selection JSON path (default %s)\n"
        "  -x, --exec <command>        Deployment command, run with the selection file\n"
        "      --dmi-dir <dir>         DMI sysfs directory (default %s)\n"
        "      --log-level <level>     debug|info|warn|error\n"
        "  -h, --help                  Show this help\n",
        argv, argv, argv, config::kDefaultSettingsPath, kDefaultHandoffPath, kDmiSysfsDir);
}

bool ParseYesNo(const char* s, bool& out) {
    const std::string v = ToLower(s);
    if (v == "yes" || v == "true" || v == "1") {
        out = true;
        return true;
    }
    if (v == "no" || v == "false" || v == "0") {
        out = false;
        return true;
    }
    return false;
}

void PrintDiagnostics(const std::vector<Diagnostic>& diags) {
    for (const auto& d : diags) {
        if (d.severity == Severity::Error)
            std::fprintf(stderr, "ERROR: %s\n", d.message.c_str());
    }
}

void PrintCatalog(const char* title, const ImageList& images) {
    std::printf("%s (%zu)\n", title, images.size());
    for (const auto& img : images) {
        std::printf("  %-32s %-4s %8.2f GiB  %-16s %s\n",
                    img.id.c_str(),
                    ToString(img.kind),
                    img.size_gib,
                    img.edition.c_str(),
                    img.path.c_str());
    }
}

const ImageDescriptor* FindEntry(const ImageList& images, const std::string& id) {
    for (const auto& img : images) {
        if (EqualsIgnoreCase(img.id, id))
            return &img;
    }
    return nullptr;
}

} // namespace

int main(int argc, char** argv) {
    std::string settings_path = config::kDefaultSettingsPath;
    std::optional<std::string> base_root;
    std::optional<std::string> customer_root;
    std::optional<std::string> config_root;
    std::optional<std::string> log_level;
    bool list_customers = false;
    bool list = false;
    std::string customer;
    std::string image_id;
    std::optional<int> edition_index;
    std::string order_number;
    std::optional<bool> updates;
    std::optional<bool> unattend;
    std::optional<bool> drivers;
    std::string handoff_path;
    std::string exec_command;
    std::string dmi_dir = kDmiSysfsDir;

    enum {
        kOptBaseRoot = 256,
        kOptCustomerRoot,
        kOptConfigRoot,
        kOptListCustomers,
        kOptUpdates,
        kOptUnattend,
        kOptDrivers,
        kOptHandoff,
        kOptDmiDir,
        kOptLogLevel,
    };

    static option long_opts[] = {
        {"settings", required_argument, nullptr, 's'},
        {"base-root", required_argument, nullptr, kOptBaseRoot},
        {"customer-root", required_argument, nullptr, kOptCustomerRoot},
        {"config-root", required_argument, nullptr, kOptConfigRoot},
        {"list-customers", no_argument, nullptr, kOptListCustomers},
        {"customer", required_argument, nullptr, 'c'},
        {"list", no_argument, nullptr, 'l'},
        {"image", required_argument, nullptr, 'm'},
        {"edition-index", required_argument, nullptr, 'e'},
        {"order", required_argument, nullptr, 'o'},
        {"updates", required_argument, nullptr, kOptUpdates},
        {"unattend", required_argument, nullptr, kOptUnattend},
        {"drivers", required_argument, nullptr, kOptDrivers},
        {"handoff", required_argument, nullptr, kOptHandoff},
        {"exec", required_argument, nullptr, 'x'},
        {"dmi-dir", required_argument, nullptr, kOptDmiDir},
        {"log-level", required_argument, nullptr, kOptLogLevel},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hs:c:lm:e:o:x:", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 's':
                settings_path = optarg;
                break;

            case kOptBaseRoot:
                base_root = optarg;
                break;

            case kOptCustomerRoot:
                customer_root = optarg;
                break;

            case kOptConfigRoot:
                config_root = optarg;
                break;

            case kOptListCustomers:
                list_customers = true;
                break;

            case 'c':
                customer = optarg;
                break;

            case 'l':
                list = true;
                break;

            case 'm':
                image_id = optarg;
                break;

            case 'e': {
                int v = 0;
                if (!ParsePositiveInt(optarg, v)) {
                    std::fprintf(stderr, "Invalid --edition-index: %s\n", optarg);
                    return 2;
                }
                edition_index = v;
                break;
            }

            case 'o':
                order_number = optarg;
                break;

            case kOptUpdates:
            case kOptUnattend:
            case kOptDrivers: {
                bool v = false;
                if (!ParseYesNo(optarg, v)) {
                    std::fprintf(stderr, "Invalid value for --%s: %s\n", long_opts[idx].name, optarg);
                    return 2;
                }
                if (c == kOptUpdates)
                    updates = v;
                else if (c == kOptUnattend)
                    unattend = v;
                else
                    drivers = v;
                break;
            }

            case kOptHandoff:
                handoff_path = optarg;
                break;

            case 'x':
                exec_command = optarg;
                break;

            case kOptDmiDir:
                dmi_dir = optarg;
                break;

            case kOptLogLevel:
                log_level = optarg;
                break;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (!list_customers && customer.empty()) {
        PrintUsage(argv[0]);
        return 2;
    }

    config::Settings settings;
    const bool roots_on_cli = base_root && customer_root && config_root;
    if (auto r = settings.LoadFile(settings_path); !r.is_ok()) {
        if (r.err == ENOENT && roots_on_cli) {
            std::fprintf(stderr, "WARN: %s (continuing with command-line roots)\n", r.msg.c_str());
        } else {
            std::fprintf(stderr, "ERROR: cannot load settings: %s\n", r.msg.c_str());
            return 1;
        }
    }
    if (base_root)
        settings.base_images_root = *base_root;
    if (customer_root)
        settings.customer_images_root = *customer_root;
    if (config_root)
        settings.customer_config_root = *config_root;
    if (log_level && !ParseLogLevel(*log_level, settings.log_level)) {
        std::fprintf(stderr, "Invalid --log-level: %s\n", log_level->c_str());
        return 2;
    }
    if (auto r = settings.Validate(); !r.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 1;
    }

    Logger::Instance().SetLevel(settings.log_level);
    if (!settings.log_file.empty()) {
        if (auto r = Logger::Instance().SetLogFile(settings.log_file); !r.is_ok())
            std::fprintf(stderr, "WARN: %s\n", r.msg.c_str());
    }

    config::ConfigStore store(settings.customer_config_root, settings.default_customer);
    if (list_customers) {
        for (const auto& name : store.ListCustomers())
            std::printf("%s\n", name.c_str());
        return 0;
    }

    auto inspector = std::make_shared<CommandImageInspector>(settings.inspector_command);
    auto iso_inspector = std::make_shared<ArchiveIsoInspector>(settings.iso_staging_dir, inspector);
    ImageCatalogResolver catalog(CatalogRoots{.base_images_root = settings.base_images_root,
                                              .customer_images_root = settings.customer_images_root});
    SelectionFlow flow(store, std::move(catalog), EditionResolver(inspector, iso_inspector));

    if (auto r = flow.SelectCustomer(customer); !r) {
        std::fprintf(stderr, "ERROR: %s: %s\n", config::ToString(r.error().code), r.error().msg.c_str());
        return 1;
    }
    if (flow.Profile().from_default) {
        std::fprintf(stderr, "WARN: %s has no usable Config.json, using %s\n",
                     customer.c_str(), flow.Profile().source_file.c_str());
    }

    auto customer_catalog = flow.CustomerCatalog();
    auto base_catalog = flow.BaseCatalog();
    PrintDiagnostics(customer_catalog.diagnostics);
    PrintDiagnostics(base_catalog.diagnostics);

    if (list || image_id.empty()) {
        PrintCatalog("Customer images", customer_catalog.value);
        PrintCatalog("Base images", base_catalog.value);
        return 0;
    }

    const ImageDescriptor* entry = FindEntry(customer_catalog.value, image_id);
    if (!entry)
        entry = FindEntry(base_catalog.value, image_id);
    if (!entry) {
        std::fprintf(stderr, "ERROR: no image '%s' in the catalogs of %s\n", image_id.c_str(), customer.c_str());
        return 2;
    }
    // The staged install image only lives as long as this process.
    if (entry->kind == ImageKind::ISO && exec_command.empty()) {
        std::fprintf(stderr, "ERROR: ISO sources need --exec\n");
        return 2;
    }

    auto editions = flow.Begin(*entry);
    PrintDiagnostics(editions.diagnostics);

    std::optional<EditionOption> chosen;
    if (RequiresEditionChoice(*entry)) {
        if (editions.value.empty()) {
            std::fprintf(stderr, "ERROR: no editions available for %s\n", entry->id.c_str());
            return 1;
        }
        if (!edition_index) {
            std::printf("Editions of %s:\n", entry->id.c_str());
            for (const auto& e : editions.value) {
                std::printf("  %2d  %-40s %-6s %s\n",
                            e.index, e.name.c_str(), e.architecture.c_str(), e.version.c_str());
            }
            std::printf("Re-run with --edition-index <n>.\n");
            return 0;
        }
        for (const auto& e : editions.value) {
            if (e.index == *edition_index) {
                chosen = e;
                break;
            }
        }
        if (!chosen) {
            std::fprintf(stderr, "ERROR: %s has no edition with index %d\n", entry->id.c_str(), *edition_index);
            return 2;
        }
    }

    DeploymentContext ctx;
    ctx.customer_name = flow.Profile().name;
    ctx.order_number = order_number;
    ctx.device_info = ReadDeviceInfo(dmi_dir);
    if (updates || unattend || drivers) {
        DeploymentFlags flags;
        flags.required_updates = updates.value_or(flags.required_updates);
        flags.apply_unattend = unattend.value_or(flags.apply_unattend);
        flags.driver_inject = drivers.value_or(flags.driver_inject);
        ctx.operator_flags = flags;
    }

    auto sel = flow.Finalize(chosen, ctx);
    if (!sel) {
        std::fprintf(stderr, "ERROR: %s\n", sel.error().msg.c_str());
        return 1;
    }

    if (exec_command.empty() && handoff_path.empty()) {
        std::printf("%s\n", SelectionToJson(*sel).dump(2).c_str());
        if (auto r = flow.Complete(); !r.is_ok())
            std::fprintf(stderr, "WARN: %s\n", r.msg.c_str());
        return 0;
    }

    CommandDeploymentEngine engine(exec_command, handoff_path.empty() ? kDefaultHandoffPath : handoff_path);
    if (auto r = flow.Deploy(engine); !r.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 1;
    }
    return 0;
}
