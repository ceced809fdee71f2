#pragma once

#include <string>
#include <vector>

namespace tabrun {

struct FilterResult {
    bool ok = true;
    std::string token;    // First denylisted token found when !ok
};

// Static pre-execution check on submitted code.
//
// This is a substring denylist, nothing more. It catches the obvious ways
// to spawn processes, evaluate strings, import modules dynamically or open
// arbitrary files, and it is trivially bypassed by anyone who tries.
// Isolation is provided by the container runtime, never by this filter;
// do not weaken container limits on the grounds that code passed here.
class CodeFilter {
public:
    // Matching is exact and case-sensitive. Tokens are checked in
    // denylist() order and the first hit is reported.
    static FilterResult validate(const std::string& source);

    static const std::vector<std::string>& denylist();
};

} // namespace tabrun
