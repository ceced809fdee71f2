#include "multipart.h"
#include <sstream>

namespace tabrun {

std::vector<MultipartPart> MultipartParser::parse(const std::string& content_type,
                                                  const std::string& body) {
    std::vector<MultipartPart> parts;

    std::string boundary = extract_boundary(content_type);
    if (boundary.empty()) return parts;

    const std::string delimiter = "--" + boundary;

    size_t start = body.find(delimiter);
    if (start == std::string::npos) return parts;

    while (true) {
        size_t after = start + delimiter.size();
        // "--" after the delimiter closes the body
        if (body.compare(after, 2, "--") == 0) break;
        if (body.compare(after, 2, "\r\n") != 0) break;
        after += 2;

        size_t end = body.find("\r\n" + delimiter, after);
        if (end == std::string::npos) break;

        MultipartPart part = parse_part(body.substr(after, end - after));
        if (!part.name.empty()) {
            parts.push_back(std::move(part));
        }

        start = end + 2;
    }

    return parts;
}

const MultipartPart* MultipartParser::find(const std::vector<MultipartPart>& parts,
                                           const std::string& name) {
    for (const auto& part : parts) {
        if (part.name == name) return &part;
    }
    return nullptr;
}

std::string MultipartParser::extract_boundary(const std::string& content_type) {
    const std::string prefix = "boundary=";
    size_t pos = content_type.find(prefix);
    if (pos == std::string::npos) return "";

    pos += prefix.size();
    size_t end = content_type.find(';', pos);
    if (end == std::string::npos) end = content_type.size();

    std::string boundary = content_type.substr(pos, end - pos);
    if (boundary.size() >= 2 && boundary.front() == '"' && boundary.back() == '"') {
        boundary = boundary.substr(1, boundary.size() - 2);
    }
    return boundary;
}

MultipartPart MultipartParser::parse_part(const std::string& part_data) {
    MultipartPart part;

    size_t headers_end = part_data.find("\r\n\r\n");
    if (headers_end == std::string::npos) return part;

    std::istringstream headers_stream(part_data.substr(0, headers_end));
    std::string line;
    while (std::getline(headers_stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string key = line.substr(0, colon);
        size_t value_start = line.find_first_not_of(' ', colon + 1);
        std::string value = value_start == std::string::npos ? "" : line.substr(value_start);
        part.headers[key] = value;

        if (key == "Content-Disposition" || key == "content-disposition") {
            part.name = disposition_param(value, "name");
            part.filename = disposition_param(value, "filename");
        }
    }

    part.data = part_data.substr(headers_end + 4);
    return part;
}

// Value of param="..." in a Content-Disposition header. Matches whole
// parameter names only, so "name" never picks up "filename".
std::string MultipartParser::disposition_param(const std::string& disposition,
                                               const std::string& param) {
    const std::string needle = param + "=\"";
    size_t pos = 0;
    while ((pos = disposition.find(needle, pos)) != std::string::npos) {
        bool whole_word = pos == 0 || disposition[pos - 1] == ' ' || disposition[pos - 1] == ';';
        if (whole_word) {
            size_t value_start = pos + needle.size();
            size_t value_end = disposition.find('"', value_start);
            if (value_end == std::string::npos) return "";
            return disposition.substr(value_start, value_end - value_start);
        }
        pos += needle.size();
    }
    return "";
}

} // namespace tabrun
