#include "sharing/package_archive.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/serializer.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <sstream>

namespace PackageArchive {

namespace {

constexpr std::array<char, 4> MAGIC = {'I', 'S', 'P', 'K'};
constexpr size_t COPY_BUFFER_SIZE = 64 * 1024;

[[noreturn]] void corrupt(const std::string& why) {
    throw SharingError(ErrorKind::VALIDATION, "Invalid package: " + why);
}

void write_all(std::ofstream& out, const std::vector<uint8_t>& bytes) {
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

std::vector<uint8_t> read_exact(std::ifstream& in, size_t n, const char* what) {
    std::vector<uint8_t> buf(n);
    in.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(n));
    if (static_cast<size_t>(in.gcount()) != n) {
        corrupt(std::string("truncated ") + what);
    }
    return buf;
}

uint32_t read_u32(std::ifstream& in, const char* what) {
    auto buf = read_exact(in, 4, what);
    return Serializer::decode_u32(buf.data());
}

} // namespace

bool is_safe_entry_path(const std::string& path) {
    if (path.empty() || path.size() > MAX_PATH_BYTES) return false;
    if (path.front() == '/') return false;
    if (path.find('\\') != std::string::npos) return false;
    if (path.find('\0') != std::string::npos) return false;
    if (path.size() >= 2 && std::isalpha(static_cast<unsigned char>(path[0])) && path[1] == ':') return false;

    std::stringstream ss(path);
    std::string segment;
    while (std::getline(ss, segment, '/')) {
        if (segment.empty() || segment == "." || segment == "..") return false;
    }
    return path.back() != '/';
}

std::vector<Entry> write(const fs::path& out, const std::string& manifest_json,
                         const std::vector<ContentFile>& files, const ByteProgress& progress) {
    std::vector<Entry> entries;
    entries.reserve(files.size());
    uint64_t total = 0;
    for (const auto& f : files) {
        if (!is_safe_entry_path(f.relative_path)) {
            throw std::runtime_error("Refusing to package unsafe path: " + f.relative_path);
        }
        Entry e;
        e.path = f.relative_path;
        e.size = f.size_bytes;
        e.sha256 = Hasher::sha256_file(f.source);
        entries.push_back(std::move(e));
        total += f.size_bytes;
    }

    std::vector<uint8_t> header(MAGIC.begin(), MAGIC.end());
    Serializer::put_u16(header, FORMAT_VERSION);
    Serializer::put_string(header, manifest_json);
    Serializer::put_u32(header, static_cast<uint32_t>(entries.size()));
    for (const auto& e : entries) {
        Serializer::put_string(header, e.path);
        Serializer::put_u64(header, e.size);
        Serializer::put_hash(header, e.sha256);
    }

    std::ofstream os(out, std::ios::binary | std::ios::trunc);
    if (!os.is_open()) {
        throw std::runtime_error("Cannot create package file " + out.string());
    }
    write_all(os, header);

    uint64_t offset = header.size();
    uint64_t done = 0;
    std::vector<char> buffer(COPY_BUFFER_SIZE);
    for (size_t i = 0; i < files.size(); ++i) {
        entries[i].offset = offset;
        std::ifstream in(files[i].source, std::ios::binary);
        if (!in.is_open()) {
            throw std::runtime_error("Cannot read " + files[i].source.string());
        }
        uint64_t remaining = files[i].size_bytes;
        while (remaining > 0) {
            size_t chunk = static_cast<size_t>(std::min<uint64_t>(remaining, buffer.size()));
            in.read(buffer.data(), static_cast<std::streamsize>(chunk));
            if (static_cast<size_t>(in.gcount()) != chunk) {
                throw std::runtime_error("File changed while packaging: " + files[i].source.string());
            }
            os.write(buffer.data(), static_cast<std::streamsize>(chunk));
            remaining -= chunk;
            done += chunk;
        }
        offset += files[i].size_bytes;
        if (!os.good()) {
            throw std::runtime_error("Failed writing package file " + out.string());
        }
        if (progress) progress(done, total);
    }

    os.close();
    if (os.fail()) {
        throw std::runtime_error("Failed closing package file " + out.string());
    }
    return entries;
}

Index read_index(const fs::path& package) {
    std::error_code ec;
    uint64_t file_size = fs::file_size(package, ec);
    if (ec) {
        throw SharingError(ErrorKind::VALIDATION, "Cannot read package " + package.string() + ": " + ec.message());
    }

    std::ifstream in(package, std::ios::binary);
    if (!in.is_open()) {
        throw SharingError(ErrorKind::VALIDATION, "Cannot open package " + package.string());
    }

    auto magic = read_exact(in, MAGIC.size(), "header");
    if (!std::equal(MAGIC.begin(), MAGIC.end(), magic.begin())) {
        corrupt("not an instance package");
    }
    auto version = read_exact(in, 2, "header");
    uint16_t format = static_cast<uint16_t>((version[0] << 8) | version[1]);
    if (format != FORMAT_VERSION) {
        corrupt("unsupported package format " + std::to_string(format));
    }

    Index index;
    uint32_t manifest_len = read_u32(in, "manifest length");
    if (manifest_len > MAX_MANIFEST_BYTES || manifest_len > file_size) {
        corrupt("manifest length out of range");
    }
    auto manifest = read_exact(in, manifest_len, "manifest");
    index.manifest_json.assign(manifest.begin(), manifest.end());

    uint32_t count = read_u32(in, "entry count");
    if (count > MAX_ENTRIES) {
        corrupt("too many entries");
    }

    index.entries.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        Entry e;
        uint32_t path_len = read_u32(in, "entry path length");
        if (path_len > MAX_PATH_BYTES) {
            corrupt("entry path too long");
        }
        auto path = read_exact(in, path_len, "entry path");
        e.path.assign(path.begin(), path.end());
        if (!is_safe_entry_path(e.path)) {
            corrupt("unsafe entry path '" + e.path + "'");
        }
        auto size = read_exact(in, 8, "entry size");
        Serializer::Reader reader(size);
        e.size = reader.u64();
        auto digest = read_exact(in, HASH_SIZE, "entry hash");
        std::copy(digest.begin(), digest.end(), e.sha256.begin());
        index.entries.push_back(std::move(e));
    }

    uint64_t offset = static_cast<uint64_t>(in.tellg());
    for (auto& e : index.entries) {
        if (e.size > file_size - std::min(offset, file_size)) {
            corrupt("entry '" + e.path + "' extends past the end of the file");
        }
        e.offset = offset;
        offset += e.size;
        index.data_bytes += e.size;
    }
    if (offset != file_size) {
        corrupt("trailing bytes after the last entry");
    }
    return index;
}

void extract(const fs::path& package, const Index& index, const fs::path& destination,
             const ByteProgress& progress) {
    std::ifstream in(package, std::ios::binary);
    if (!in.is_open()) {
        throw SharingError(ErrorKind::MATERIALIZATION, "Cannot open package " + package.string());
    }

    uint64_t done = 0;
    std::vector<char> buffer(COPY_BUFFER_SIZE);
    for (const auto& e : index.entries) {
        fs::path target = destination / fs::path(e.path);
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw SharingError(ErrorKind::MATERIALIZATION,
                               "Cannot create " + target.parent_path().string() + ": " + ec.message());
        }

        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw SharingError(ErrorKind::MATERIALIZATION, "Cannot write " + target.string());
        }

        in.seekg(static_cast<std::streamoff>(e.offset));
        uint64_t remaining = e.size;
        while (remaining > 0) {
            size_t chunk = static_cast<size_t>(std::min<uint64_t>(remaining, buffer.size()));
            in.read(buffer.data(), static_cast<std::streamsize>(chunk));
            if (static_cast<size_t>(in.gcount()) != chunk) {
                corrupt("truncated entry '" + e.path + "'");
            }
            out.write(buffer.data(), static_cast<std::streamsize>(chunk));
            remaining -= chunk;
            done += chunk;
        }
        out.close();
        if (out.fail()) {
            throw SharingError(ErrorKind::MATERIALIZATION, "Failed writing " + target.string());
        }

        if (Hasher::sha256_file(target) != e.sha256) {
            corrupt("checksum mismatch for '" + e.path + "'");
        }
        if (progress) progress(done, index.data_bytes);
    }
    LOG_DEBUG("Extracted ", index.entries.size(), " entries into ", destination);
}

} // namespace PackageArchive
