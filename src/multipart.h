#pragma once

#include <string>
#include <vector>
#include <map>

namespace tabrun {

// One part of a multipart/form-data body
struct MultipartPart {
    std::map<std::string, std::string> headers;
    std::string name;
    std::string filename;
    std::string data;       // Raw bytes, may contain NUL
};

// multipart/form-data parser for uploads. Binary safe.
class MultipartParser {
public:
    static std::vector<MultipartPart> parse(const std::string& content_type,
                                            const std::string& body);

    // First part whose form field name is name, nullptr if none
    static const MultipartPart* find(const std::vector<MultipartPart>& parts,
                                     const std::string& name);

    static std::string extract_boundary(const std::string& content_type);

private:
    static MultipartPart parse_part(const std::string& part_data);
    static std::string disposition_param(const std::string& disposition,
                                         const std::string& param);
};

} // namespace tabrun
