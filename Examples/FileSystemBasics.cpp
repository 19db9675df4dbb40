#include <filesystem>
#include <string>

#include "StrataCore.h"

using namespace Strata::Core;
using namespace Strata::Core::IO;

int main(int argc, char** argv) {
    Logging::Logger::global().configureFromEnvironment();

    RealFileSystem fs(RealFileSystem::Config::fromEnvironment());
    const std::string root = argc > 1 ? argv[1] : fs.cwd();
    STRATA_LOG_INFO("Working directory: " + fs.cwd());

    // List the directory and classify every entry
    auto listing = fs.readDirectory(root);
    if (!listing.ok()) {
        STRATA_LOG_ERROR("readDirectory failed: " + std::string(toString(listing.error.code)) + " " +
                         listing.error.message + " (" + listing.error.path + ")");
        return 1;
    }

    for (const auto& [name, entry] : *listing.entries) {
        auto kind = entry->kind();
        if (!kind.ok()) {
            STRATA_LOG_WARNING(name + ": " + kind.error.message);
            continue;
        }
        STRATA_LOG_INFO(std::string(toString(kind.kind)) + "  " + name);
    }

    // Second listing comes from the cache
    auto again = fs.readDirectory(root);
    STRATA_LOG_INFO("Cached listing shared: " + std::string(again.entries == listing.entries ? "yes" : "no"));

    // Read a manifest next to the listed directory, if there is one
    const std::string manifest = fs.join({root, "package.json"});
    auto contents = fs.readFile(manifest);
    if (contents.ok()) {
        STRATA_LOG_INFO("Read " + std::to_string(contents.contents.size()) + " bytes from " + manifest);

        auto key = fs.modKey(manifest);
        if (key.ok()) {
            STRATA_LOG_INFO("ModKey hash: " + std::to_string(std::hash<ModKey>()(key.key)));
        }
    } else {
        STRATA_LOG_INFO(manifest + ": " + std::string(toString(contents.error.code)));
    }

    return 0;
}
