#include "code_filter.h"

namespace tabrun {

const std::vector<std::string>& CodeFilter::denylist() {
    static const std::vector<std::string> tokens = {
        "subprocess", "os.system", "eval(", "exec(", "importlib",
        "sys.modules", "__import__", "open(", "file(",
        "execfile(", "compile(", "pty", "popen", "system"
    };
    return tokens;
}

FilterResult CodeFilter::validate(const std::string& source) {
    FilterResult result;
    for (const auto& token : denylist()) {
        if (source.find(token) != std::string::npos) {
            result.ok = false;
            result.token = token;
            break;
        }
    }
    return result;
}

} // namespace tabrun
