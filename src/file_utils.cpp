#include "file_utils.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <openssl/evp.h>

namespace tabrun {

const std::map<std::string, FileType> FileUtils::extension_map_ = {
    {".csv", FileType::CSV},
    {".xlsx", FileType::EXCEL},
    {".xls", FileType::EXCEL},
    {".json", FileType::JSON},
    {".txt", FileType::TEXT},
    {".log", FileType::TEXT},
    {".md", FileType::TEXT},
};

const std::map<FileType, std::string> FileUtils::type_name_map_ = {
    {FileType::CSV, "csv"},
    {FileType::EXCEL, "excel"},
    {FileType::JSON, "json"},
    {FileType::TEXT, "text"},
    {FileType::OTHER, "other"},
};

const std::map<std::string, std::string> FileUtils::mime_type_map_ = {
    {".csv", "text/csv"},
    {".json", "application/json"},
    {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
    {".xls", "application/vnd.ms-excel"},
    {".txt", "text/plain"},
    {".log", "text/plain"},
    {".md", "text/markdown"},
    {".parquet", "application/octet-stream"},
    {".png", "image/png"},
    {".pdf", "application/pdf"},
};

std::string FileUtils::extension_of(const std::string& filename) {
    std::string base = std::filesystem::path(filename).filename().string();
    size_t dot_pos = base.rfind('.');
    if (dot_pos == std::string::npos || dot_pos == 0) {
        return "";
    }
    std::string ext = base.substr(dot_pos);
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    return ext;
}

FileType FileUtils::detect_file_type(const std::string& filename) {
    auto it = extension_map_.find(extension_of(filename));
    if (it != extension_map_.end()) {
        return it->second;
    }
    return FileType::OTHER;
}

std::string FileUtils::file_type_to_string(FileType type) {
    auto it = type_name_map_.find(type);
    if (it != type_name_map_.end()) {
        return it->second;
    }
    return "other";
}

std::string FileUtils::get_mime_type(const std::string& filename) {
    auto it = mime_type_map_.find(extension_of(filename));
    if (it != mime_type_map_.end()) {
        return it->second;
    }
    return "application/octet-stream";
}

std::string FileUtils::format_file_size(size_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit_index < 4) {
        size /= 1024.0;
        unit_index++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << size << " " << units[unit_index];
    return oss.str();
}

std::string FileUtils::sanitize_filename(const std::string& filename) {
    // Windows clients send backslash paths; treat them as separators too
    size_t cut = filename.find_last_of("/\\");
    std::string base = (cut == std::string::npos) ? filename : filename.substr(cut + 1);

    // Drop a drive prefix left over from "C:name"
    size_t colon = base.rfind(':');
    if (colon != std::string::npos) {
        base = base.substr(colon + 1);
    }

    if (base.empty() || base == "." || base == "..") {
        return "";
    }
    return base;
}

bool FileUtils::has_allowed_extension(const std::string& filename,
                                      const std::set<std::string>& allowed) {
    std::string ext = extension_of(filename);
    if (ext.size() < 2) {
        return false;
    }
    return allowed.count(ext.substr(1)) > 0;
}

std::vector<std::string> FileUtils::list_files(const std::string& dirpath) {
    namespace fs = std::filesystem;
    std::vector<std::string> names;

    std::error_code ec;
    if (!fs::is_directory(dirpath, ec)) {
        return names;
    }

    for (const auto& entry : fs::directory_iterator(dirpath, ec)) {
        if (entry.is_regular_file(ec)) {
            names.push_back(entry.path().filename().string());
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

// Hash utilities implementation

std::string FileUtils::bytes_to_hex(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string FileUtils::sha256_string(const std::string& data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_Digest(data.data(), data.size(), hash, &hash_len, EVP_sha256(), nullptr) != 1) {
        return "";
    }
    return bytes_to_hex(hash, hash_len);
}

std::string FileUtils::sha256_file(const std::string& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        return "";  // Return empty string on error
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        return "";
    }
    EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr);

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        EVP_DigestUpdate(ctx, buffer, static_cast<size_t>(file.gcount()));
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    EVP_DigestFinal_ex(ctx, hash, &hash_len);
    EVP_MD_CTX_free(ctx);

    return bytes_to_hex(hash, hash_len);
}

FileMetadata FileUtils::get_file_metadata(const std::string& filepath) {
    FileMetadata metadata;
    metadata.path = filepath;

    namespace fs = std::filesystem;

    std::error_code ec;
    if (!fs::is_regular_file(filepath, ec)) {
        return metadata;
    }

    metadata.size_bytes = static_cast<size_t>(fs::file_size(filepath, ec));
    metadata.sha256_hash = sha256_file(filepath);
    metadata.type = detect_file_type(filepath);

    return metadata;
}

} // namespace tabrun
