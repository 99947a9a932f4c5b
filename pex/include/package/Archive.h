#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace PEX {

struct ArchiveEntry {
    std::string path;  // relative, '/'-separated
    std::string data;
};

/**
 * @brief Ordered set of files making up one export
 *
 * Entries keep insertion order, which is the order they are written in. The ZIP
 * form uses fixed timestamps, so the same entries always serialize to the same bytes.
 */
class Archive {
public:
    /**
     * @brief Append a file
     * @return false when @p path is empty, absolute, contains ".." or already exists
     */
    bool add(const std::string &path, const std::string &data);

    bool contains(const std::string &path) const;

    /**
     * @brief Data of @p path, nullptr when missing
     */
    const std::string *find(const std::string &path) const;

    const std::vector<ArchiveEntry> &entries() const {
        return entries_;
    }

    std::vector<std::string> paths() const;

    size_t size() const {
        return entries_.size();
    }

    bool empty() const {
        return entries_.empty();
    }

    /**
     * @brief ZIP bytes, every entry deflated
     * @return std::nullopt when compression failed (logged)
     */
    std::optional<std::string> toZipBytes() const;

    bool writeZip(const std::string &zipPath) const;

    /**
     * @brief Write every entry below @p directory, creating subdirectories as needed
     */
    bool writeToDirectory(const std::string &directory) const;

private:
    static bool isSafePath(const std::string &path);
    static std::optional<std::string> deflateRaw(const std::string &data);

    std::vector<ArchiveEntry> entries_;
};

}  // namespace PEX
