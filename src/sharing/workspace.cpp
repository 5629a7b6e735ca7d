#include "sharing/workspace.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "nlohmann/json.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>

using json = nlohmann::json;

namespace {

template<typename T>
void put_optional(json& j, const char* key, const std::optional<T>& value) {
    if (value) j[key] = *value;
}

template<typename T>
void get_optional(const json& j, const char* key, std::optional<T>& out) {
    if (j.contains(key) && !j.at(key).is_null()) out = j.at(key).get<T>();
}

} // namespace

std::string sanitize_file_name(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == ' ') {
            out.push_back(c);
        } else {
            out.push_back('_');
        }
    }
    // Leading dots would make hidden files or "." / ".." entries
    size_t first = out.find_first_not_of(". ");
    out = first == std::string::npos ? std::string() : out.substr(first);
    while (!out.empty() && (out.back() == ' ' || out.back() == '.')) out.pop_back();
    return out.empty() ? "instance" : out;
}

WorkspaceCatalog::WorkspaceCatalog(fs::path root) : root_(std::move(root)) {}

std::vector<WorkspaceInfo> WorkspaceCatalog::list() const {
    std::vector<WorkspaceInfo> out;
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) return out;

    for (const auto& entry : fs::directory_iterator(root_, ec)) {
        if (!entry.is_directory()) continue;
        auto info = read_descriptor(entry.path());
        if (info) out.push_back(std::move(*info));
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.name < b.name; });
    return out;
}

WorkspaceInfo WorkspaceCatalog::resolve(const std::string& id) const {
    if (id.empty() || id.find('/') != std::string::npos || id == "." || id == "..") {
        throw SharingError(ErrorKind::PRECONDITION, "Invalid workspace id: " + id);
    }
    auto info = read_descriptor(root_ / id);
    if (!info) {
        throw SharingError(ErrorKind::PRECONDITION, "Workspace not found: " + id);
    }
    return *info;
}

bool WorkspaceCatalog::name_taken(const std::string& name) const {
    for (const auto& ws : list()) {
        if (ws.name == name) return true;
    }
    return false;
}

std::string WorkspaceCatalog::unique_name(const std::string& base) const {
    if (!name_taken(base)) return base;
    for (int i = 2;; ++i) {
        std::string candidate = base + " (" + std::to_string(i) + ")";
        if (!name_taken(candidate)) return candidate;
    }
}

std::string WorkspaceCatalog::allocate_directory(const std::string& name) const {
    std::string base = sanitize_file_name(name);
    std::transform(base.begin(), base.end(), base.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::replace(base.begin(), base.end(), ' ', '_');

    std::string candidate = base;
    for (int i = 2; fs::exists(root_ / candidate); ++i) {
        candidate = base + "_" + std::to_string(i);
    }
    return candidate;
}

void WorkspaceCatalog::write_descriptor(const WorkspaceInfo& info) {
    json j = {
        {"name", info.name},
        {"game_version", info.game_version},
        {"is_server", info.is_server},
        {"is_proxy", info.is_proxy}
    };
    put_optional(j, "loader", info.loader);
    put_optional(j, "loader_version", info.loader_version);
    put_optional(j, "memory_min_mb", info.memory_min_mb);
    put_optional(j, "memory_max_mb", info.memory_max_mb);
    put_optional(j, "jvm_args", info.jvm_args);

    std::ofstream out(info.directory / DESCRIPTOR_FILE, std::ios::trunc);
    if (!out.is_open()) {
        throw SharingError(ErrorKind::MATERIALIZATION,
                           "Cannot write " + (info.directory / DESCRIPTOR_FILE).string());
    }
    out << j.dump(4);
    if (!out) {
        throw SharingError(ErrorKind::MATERIALIZATION, "Write failed for workspace descriptor");
    }
}

std::optional<WorkspaceInfo> WorkspaceCatalog::read_descriptor(const fs::path& directory) {
    std::ifstream in(directory / DESCRIPTOR_FILE);
    if (!in.is_open()) return std::nullopt;

    try {
        json j = json::parse(in);
        WorkspaceInfo info;
        info.id = directory.filename().string();
        info.directory = directory;
        j.at("name").get_to(info.name);
        j.at("game_version").get_to(info.game_version);
        info.is_server = j.value("is_server", false);
        info.is_proxy = j.value("is_proxy", false);
        get_optional(j, "loader", info.loader);
        get_optional(j, "loader_version", info.loader_version);
        get_optional(j, "memory_min_mb", info.memory_min_mb);
        get_optional(j, "memory_max_mb", info.memory_max_mb);
        get_optional(j, "jvm_args", info.jvm_args);
        return info;
    } catch (const json::exception& e) {
        LOG_WARN("Skipping workspace with unreadable descriptor ", directory, ": ", e.what());
        return std::nullopt;
    }
}
