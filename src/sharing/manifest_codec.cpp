#include "sharing/manifest.hpp"
#include "common/errors.hpp"
#include "common/version.hpp"
#include "nlohmann/json.hpp"
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>

using json = nlohmann::json;

namespace {

std::string utc_timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm tm_buf{};
    gmtime_r(&now, &tm_buf);
    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

[[noreturn]] void reject(const std::string& why) {
    throw SharingError(ErrorKind::VALIDATION, "Invalid manifest: " + why);
}

uint64_t size_field(const json& j, const char* key) {
    const json& v = j.at(key);
    if (!v.is_number_unsigned()) {
        reject(std::string("'") + key + "' must be a non-negative integer");
    }
    return v.get<uint64_t>();
}

template<typename T>
void put_optional(json& j, const char* key, const std::optional<T>& value) {
    if (value) j[key] = *value;
}

template<typename T>
void get_optional(const json& j, const char* key, std::optional<T>& out) {
    if (j.contains(key) && !j.at(key).is_null()) out = j.at(key).get<T>();
}

} // namespace

void to_json(json& j, const ManifestFile& f) {
    j = json{{"path", f.path}, {"size_bytes", f.size_bytes}};
    put_optional(j, "sha256", f.sha256);
}

void from_json(const json& j, ManifestFile& f) {
    j.at("path").get_to(f.path);
    f.size_bytes = size_field(j, "size_bytes");
    get_optional(j, "sha256", f.sha256);
}

void to_json(json& j, const ContentSection& s) {
    j = json{{"included", s.included}, {"count", s.count}, {"total_size_bytes", s.total_size_bytes}};
    if (!s.files.empty()) j["files"] = s.files;
}

void from_json(const json& j, ContentSection& s) {
    j.at("included").get_to(s.included);
    j.at("count").get_to(s.count);
    s.total_size_bytes = size_field(j, "total_size_bytes");
    if (j.contains("files")) j.at("files").get_to(s.files);
}

void to_json(json& j, const WorldEntry& w) {
    j = json{
        {"name", w.name},
        {"folder_name", w.folder_name},
        {"size_bytes", w.size_bytes},
        {"is_server_world", w.is_server_world}
    };
    if (!w.additional_folders.empty()) j["additional_folders"] = w.additional_folders;
}

void from_json(const json& j, WorldEntry& w) {
    j.at("name").get_to(w.name);
    j.at("folder_name").get_to(w.folder_name);
    w.size_bytes = size_field(j, "size_bytes");
    w.is_server_world = j.value("is_server_world", false);
    if (j.contains("additional_folders")) j.at("additional_folders").get_to(w.additional_folders);
}

void to_json(json& j, const ManifestInstance& i) {
    j = json{
        {"name", i.name},
        {"game_version", i.game_version},
        {"is_server", i.is_server},
        {"is_proxy", i.is_proxy}
    };
    put_optional(j, "loader", i.loader);
    put_optional(j, "loader_version", i.loader_version);
    put_optional(j, "memory_min_mb", i.memory_min_mb);
    put_optional(j, "memory_max_mb", i.memory_max_mb);
    put_optional(j, "jvm_args", i.jvm_args);
}

void from_json(const json& j, ManifestInstance& i) {
    j.at("name").get_to(i.name);
    j.at("game_version").get_to(i.game_version);
    i.is_server = j.value("is_server", false);
    i.is_proxy = j.value("is_proxy", false);
    get_optional(j, "loader", i.loader);
    get_optional(j, "loader_version", i.loader_version);
    get_optional(j, "memory_min_mb", i.memory_min_mb);
    get_optional(j, "memory_max_mb", i.memory_max_mb);
    get_optional(j, "jvm_args", i.jvm_args);
}

std::optional<uint64_t> SharingManifest::derived_total() const {
    uint64_t total = 0;
    auto add = [&total](uint64_t size) {
        if (size > std::numeric_limits<uint64_t>::max() - total) return false;
        total += size;
        return true;
    };
    for (const auto& s : contents) {
        if (s.included && !add(s.total_size_bytes)) return std::nullopt;
    }
    if (saves.included) {
        for (const auto& w : saves.worlds) {
            if (!add(w.size_bytes)) return std::nullopt;
        }
    }
    return total;
}

namespace ManifestCodec {

SharingManifest build(const WorkspaceInfo& workspace, const ExportOptions& options,
                      const ContentInventory& inventory) {
    ExportOptions clean = sanitize_options(options, inventory);

    SharingManifest m;
    m.version = FORMAT_VERSION;
    m.app_version = INSTSHARE_VERSION;
    m.created_at = utc_timestamp();

    m.instance.name = workspace.name;
    m.instance.game_version = workspace.game_version;
    m.instance.loader = workspace.loader;
    m.instance.loader_version = workspace.loader_version;
    m.instance.is_server = workspace.is_server;
    m.instance.is_proxy = workspace.is_proxy;
    m.instance.memory_min_mb = workspace.memory_min_mb;
    m.instance.memory_max_mb = workspace.memory_max_mb;
    m.instance.jvm_args = workspace.jvm_args;

    for (ContentCategory c : ALL_CATEGORIES) {
        ContentSection& section = m.section(c);
        section.included = clean.includes(c);
        if (section.included) {
            section.count = inventory.stats(c).count;
            section.total_size_bytes = inventory.stats(c).total_size_bytes;
        }
    }

    for (const auto& folder : clean.worlds) {
        m.saves.worlds.push_back(*inventory.find_world(folder));
    }
    m.saves.included = !m.saves.worlds.empty();

    auto total = m.derived_total();
    if (!total) reject("sizes overflow");
    m.total_size_bytes = *total;
    return m;
}

std::string encode(const SharingManifest& m) {
    json contents = json::object();
    for (ContentCategory c : ALL_CATEGORIES) {
        contents[category_key(c)] = m.section(c);
    }
    contents["saves"] = json{{"included", m.saves.included}, {"worlds", m.saves.worlds}};

    json j = {
        {"version", m.version},
        {"instshare_version", m.app_version},
        {"created_at", m.created_at},
        {"instance", m.instance},
        {"contents", contents},
        {"total_size_bytes", m.total_size_bytes}
    };
    return j.dump(2);
}

void validate(const SharingManifest& m) {
    if (m.version != FORMAT_VERSION) {
        reject("unsupported version '" + m.version + "', expected " + FORMAT_VERSION);
    }
    if (m.instance.name.empty()) reject("instance name is missing");
    if (m.instance.game_version.empty()) reject("instance game_version is missing");

    for (ContentCategory c : ALL_CATEGORIES) {
        const ContentSection& s = m.section(c);
        if (!s.included && (s.total_size_bytes != 0 || s.count != 0)) {
            reject(std::string("excluded section '") + category_key(c) + "' reports content");
        }
    }
    if (!m.saves.included && !m.saves.worlds.empty()) {
        reject("worlds listed while saves are excluded");
    }
    for (const auto& w : m.saves.worlds) {
        if (w.folder_name.empty()) reject("world without folder_name");
    }

    auto derived = m.derived_total();
    if (!derived) reject("sizes overflow");
    if (*derived != m.total_size_bytes) {
        reject("total_size_bytes is " + std::to_string(m.total_size_bytes) +
               " but the sections add up to " + std::to_string(*derived));
    }
}

SharingManifest decode(const std::string& text) {
    SharingManifest m;
    try {
        json j = json::parse(text);
        if (!j.is_object()) reject("top-level value is not an object");

        j.at("version").get_to(m.version);
        m.app_version = j.value("instshare_version", std::string());
        m.created_at = j.value("created_at", std::string());
        j.at("instance").get_to(m.instance);

        const json& contents = j.at("contents");
        for (ContentCategory c : ALL_CATEGORIES) {
            contents.at(category_key(c)).get_to(m.section(c));
        }
        const json& saves = contents.at("saves");
        saves.at("included").get_to(m.saves.included);
        saves.at("worlds").get_to(m.saves.worlds);

        m.total_size_bytes = size_field(j, "total_size_bytes");
    } catch (const json::exception& e) {
        reject(std::string("malformed document (") + e.what() + ")");
    }

    validate(m);
    return m;
}

ExportOptions options_of(const SharingManifest& m) {
    ExportOptions options;
    for (ContentCategory c : ALL_CATEGORIES) {
        options.set(c, m.section(c).included);
    }
    for (const auto& w : m.saves.worlds) {
        options.worlds.insert(w.folder_name);
    }
    return options;
}

} // namespace ManifestCodec
