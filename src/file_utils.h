#pragma once

#include <string>
#include <map>
#include <set>
#include <vector>

namespace tabrun {

// File categories relevant to tabular input and result files
enum class FileType {
    CSV,        // .csv
    EXCEL,      // .xlsx, .xls
    JSON,       // .json
    TEXT,       // .txt, .log, .md
    OTHER       // Unknown/other types
};

// File metadata with hash (reported with result downloads)
struct FileMetadata {
    std::string path;
    size_t size_bytes = 0;
    std::string sha256_hash;
    FileType type = FileType::OTHER;
};

class FileUtils {
public:
    // Lowercase extension including the dot (".csv"), empty if none
    static std::string extension_of(const std::string& filename);

    // Detect file type based on extension
    static FileType detect_file_type(const std::string& filename);

    // Get human-readable file type name
    static std::string file_type_to_string(FileType type);

    // Get MIME type for file
    static std::string get_mime_type(const std::string& filename);

    // Format file size as human-readable string
    static std::string format_file_size(size_t bytes);

    // Strip any directory part (both '/' and '\' separators). Returns empty
    // for names that reduce to nothing usable ("", ".", "..").
    static std::string sanitize_filename(const std::string& filename);

    // Extension (without dot, case-insensitive) is in allowed
    static bool has_allowed_extension(const std::string& filename,
                                      const std::set<std::string>& allowed);

    // Regular files directly inside dirpath, sorted by name. Empty if the
    // directory is missing.
    static std::vector<std::string> list_files(const std::string& dirpath);

    // Hash utilities
    static std::string sha256_file(const std::string& filepath);
    static std::string sha256_string(const std::string& data);
    static std::string bytes_to_hex(const unsigned char* data, size_t len);

    // Get file metadata with hash
    static FileMetadata get_file_metadata(const std::string& filepath);

private:
    static const std::map<std::string, FileType> extension_map_;
    static const std::map<FileType, std::string> type_name_map_;
    static const std::map<std::string, std::string> mime_type_map_;
};

} // namespace tabrun
