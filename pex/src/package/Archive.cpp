#include "package/Archive.h"
#include "common/FileHelper.h"
#include "common/Logger.h"
#include "common/StringHelper.h"
#include <algorithm>
#include <filesystem>
#include <zlib.h>

namespace PEX {

namespace {

// 1980-01-01 00:00:00, the earliest MS-DOS timestamp
constexpr uint16_t DOS_TIME = 0;
constexpr uint16_t DOS_DATE = (0 << 9) | (1 << 5) | 1;

constexpr uint32_t LOCAL_HEADER_SIGNATURE = 0x04034b50;
constexpr uint32_t CENTRAL_HEADER_SIGNATURE = 0x02014b50;
constexpr uint32_t END_OF_CENTRAL_DIRECTORY_SIGNATURE = 0x06054b50;

constexpr uint16_t VERSION_NEEDED = 20;
constexpr uint16_t UTF8_NAMES_FLAG = 0x0800;
constexpr uint16_t METHOD_DEFLATE = 8;

void putU16(std::string &out, uint16_t value) {
    out += static_cast<char>(value & 0xff);
    out += static_cast<char>((value >> 8) & 0xff);
}

void putU32(std::string &out, uint32_t value) {
    for (int shift = 0; shift < 32; shift += 8) {
        out += static_cast<char>((value >> shift) & 0xff);
    }
}

}  // namespace

bool Archive::isSafePath(const std::string &path) {
    if (path.empty() || path.front() == '/' || path.find('\\') != std::string::npos) {
        return false;
    }
    for (const auto &segment : StringHelper::split(path, '/')) {
        if (segment.empty() || segment == "..") {
            return false;
        }
    }
    return true;
}

bool Archive::add(const std::string &path, const std::string &data) {
    if (!isSafePath(path)) {
        LOG_ERROR("Archive: Refusing unsafe entry path '{}'", path);
        return false;
    }
    if (contains(path)) {
        LOG_ERROR("Archive: Entry '{}' already exists, not overwritten", path);
        return false;
    }

    entries_.push_back({path, data});
    LOG_DEBUG("Archive: Added {} ({} bytes)", path, data.size());
    return true;
}

bool Archive::contains(const std::string &path) const {
    return find(path) != nullptr;
}

const std::string *Archive::find(const std::string &path) const {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&path](const ArchiveEntry &entry) { return entry.path == path; });
    return it == entries_.end() ? nullptr : &it->data;
}

std::vector<std::string> Archive::paths() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto &entry : entries_) {
        result.push_back(entry.path);
    }
    return result;
}

std::optional<std::string> Archive::deflateRaw(const std::string &data) {
    z_stream stream{};
    // Negative window bits: raw deflate without the zlib header, as ZIP expects
    if (deflateInit2(&stream, Z_BEST_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        LOG_ERROR("Archive: deflateInit2 failed");
        return std::nullopt;
    }

    std::string compressed(deflateBound(&stream, static_cast<uLong>(data.size())), '\0');
    stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(data.data()));
    stream.avail_in = static_cast<uInt>(data.size());
    stream.next_out = reinterpret_cast<Bytef *>(compressed.data());
    stream.avail_out = static_cast<uInt>(compressed.size());

    const int status = deflate(&stream, Z_FINISH);
    const uLong produced = stream.total_out;
    deflateEnd(&stream);

    if (status != Z_STREAM_END) {
        LOG_ERROR("Archive: deflate failed with status {}", status);
        return std::nullopt;
    }

    compressed.resize(produced);
    return compressed;
}

std::optional<std::string> Archive::toZipBytes() const {
    std::string zip;
    std::string centralDirectory;

    for (const auto &entry : entries_) {
        auto compressed = deflateRaw(entry.data);
        if (!compressed) {
            LOG_ERROR("Archive: Cannot compress {}", entry.path);
            return std::nullopt;
        }

        const uint32_t crc = static_cast<uint32_t>(
            crc32(crc32(0L, Z_NULL, 0), reinterpret_cast<const Bytef *>(entry.data.data()),
                  static_cast<uInt>(entry.data.size())));
        const uint32_t localHeaderOffset = static_cast<uint32_t>(zip.size());
        const uint16_t nameLength = static_cast<uint16_t>(entry.path.size());

        putU32(zip, LOCAL_HEADER_SIGNATURE);
        putU16(zip, VERSION_NEEDED);
        putU16(zip, UTF8_NAMES_FLAG);
        putU16(zip, METHOD_DEFLATE);
        putU16(zip, DOS_TIME);
        putU16(zip, DOS_DATE);
        putU32(zip, crc);
        putU32(zip, static_cast<uint32_t>(compressed->size()));
        putU32(zip, static_cast<uint32_t>(entry.data.size()));
        putU16(zip, nameLength);
        putU16(zip, 0);  // extra field length
        zip += entry.path;
        zip += *compressed;

        putU32(centralDirectory, CENTRAL_HEADER_SIGNATURE);
        putU16(centralDirectory, VERSION_NEEDED);  // made by
        putU16(centralDirectory, VERSION_NEEDED);
        putU16(centralDirectory, UTF8_NAMES_FLAG);
        putU16(centralDirectory, METHOD_DEFLATE);
        putU16(centralDirectory, DOS_TIME);
        putU16(centralDirectory, DOS_DATE);
        putU32(centralDirectory, crc);
        putU32(centralDirectory, static_cast<uint32_t>(compressed->size()));
        putU32(centralDirectory, static_cast<uint32_t>(entry.data.size()));
        putU16(centralDirectory, nameLength);
        putU16(centralDirectory, 0);  // extra field length
        putU16(centralDirectory, 0);  // comment length
        putU16(centralDirectory, 0);  // disk number
        putU16(centralDirectory, 0);  // internal attributes
        putU32(centralDirectory, 0);  // external attributes
        putU32(centralDirectory, localHeaderOffset);
        centralDirectory += entry.path;
    }

    const uint32_t centralDirectoryOffset = static_cast<uint32_t>(zip.size());
    zip += centralDirectory;

    putU32(zip, END_OF_CENTRAL_DIRECTORY_SIGNATURE);
    putU16(zip, 0);  // this disk
    putU16(zip, 0);  // disk with the central directory
    putU16(zip, static_cast<uint16_t>(entries_.size()));
    putU16(zip, static_cast<uint16_t>(entries_.size()));
    putU32(zip, static_cast<uint32_t>(centralDirectory.size()));
    putU32(zip, centralDirectoryOffset);
    putU16(zip, 0);  // comment length

    LOG_DEBUG("Archive: {} entries, {} zip bytes", entries_.size(), zip.size());
    return zip;
}

bool Archive::writeZip(const std::string &zipPath) const {
    auto bytes = toZipBytes();
    if (!bytes) {
        return false;
    }
    if (!FileHelper::writeFileContent(zipPath, *bytes)) {
        return false;
    }
    LOG_INFO("Archive: Wrote {} ({} entries)", zipPath, entries_.size());
    return true;
}

bool Archive::writeToDirectory(const std::string &directory) const {
    const std::filesystem::path root(directory);
    for (const auto &entry : entries_) {
        if (!FileHelper::writeFileContent((root / entry.path).string(), entry.data)) {
            LOG_ERROR("Archive: Stopped writing to {} at {}", directory, entry.path);
            return false;
        }
    }
    LOG_INFO("Archive: Wrote {} files to {}", entries_.size(), directory);
    return true;
}

}  // namespace PEX
