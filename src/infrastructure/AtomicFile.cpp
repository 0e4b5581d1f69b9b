#include "infrastructure/AtomicFile.hpp"
#include "domain/Errors.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>

namespace ideasorter::infrastructure {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

void RemoveQuietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        std::cerr << "[AtomicFile] Could not remove " << path << ": " << ec.message() << std::endl;
    }
}

} // namespace

void AtomicFile::Write(const fs::path& path, const std::string& content) {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = path;
    tempPath += "." + std::to_string(stamp) + ".tmp";

    // 1. Ensure directory exists
    try {
        if (path.has_parent_path() && !fs::exists(path.parent_path())) {
            fs::create_directories(path.parent_path());
        }
    } catch (const fs::filesystem_error& e) {
        throw domain::PersistenceError(std::string("Cannot create directory: ") + e.what());
    }

    // 2. Write to temp
    {
        std::ofstream ofs(tempPath);
        if (!ofs.is_open()) {
            throw domain::PersistenceError("Cannot open temp file " + tempPath.string());
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            RemoveQuietly(tempPath);
            throw domain::PersistenceError("Write failed for " + tempPath.string());
        }
    }

    // 3. Atomic rename
    try {
        fs::rename(tempPath, path);
    } catch (const fs::filesystem_error& e) {
        RemoveQuietly(tempPath);
        throw domain::PersistenceError(std::string("Rename failed: ") + e.what());
    }
}

std::optional<json> AtomicFile::ReadJson(const fs::path& path) {
    if (!fs::exists(path)) return std::nullopt;

    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw domain::PersistenceError("Cannot open " + path.string());
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();

    json j = json::parse(buffer.str(), nullptr, false);
    if (j.is_discarded()) {
        throw domain::PersistenceError("Corrupt JSON in " + path.string());
    }
    return j;
}

} // namespace ideasorter::infrastructure
