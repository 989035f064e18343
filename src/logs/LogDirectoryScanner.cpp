#include "logs/LogDirectoryScanner.h"
#include <algorithm>

FileListing LogDirectoryScanner::scan(const PermittedDirectories& directories) {
    FileListing listing;
    listing.directories = directories.list();

    for (const auto& dir : directories) {
        std::error_code ec;
        auto status = fs::status(dir, ec);
        if (ec == std::errc::permission_denied) {
            listing.warnings.push_back("Permission denied accessing: " + dir.u8string());
            continue;
        }
        if (ec || !fs::exists(status)) {
            listing.warnings.push_back("Directory does not exist: " + dir.u8string());
            continue;
        }
        if (!fs::is_directory(status)) {
            listing.warnings.push_back("Path exists but is not a directory: " + dir.u8string());
            continue;
        }

        fs::directory_iterator it(dir, ec);
        if (ec) {
            if (ec == std::errc::permission_denied) {
                listing.warnings.push_back("Permission denied accessing: " + dir.u8string());
            } else {
                listing.warnings.push_back("Cannot read directory " + dir.u8string() + ": " + ec.message());
            }
            continue;
        }
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            std::error_code typeEc;
            if (it->is_regular_file(typeEc)) {
                listing.files.push_back(fs::absolute(it->path()).u8string());
            }
        }
        if (ec) {
            listing.warnings.push_back("Error while reading " + dir.u8string() + ": " + ec.message());
        }
    }

    std::sort(listing.files.begin(), listing.files.end());
    listing.files.erase(std::unique(listing.files.begin(), listing.files.end()), listing.files.end());
    return listing;
}
