#pragma once
#include <string>

namespace tabrun {

// Random RFC 4122 version 4 identifier, e.g. "3f2b8c1e-9a4d-4f6b-8e21-5c0d7a9b1e42".
// 122 random bits from the OpenSSL CSPRNG, so ids are never reused in practice.
// Throws std::runtime_error if the CSPRNG cannot be seeded.
std::string generate_job_id();

// True for the canonical lowercase 8-4-4-4-12 form produced above
bool is_valid_job_id(const std::string& id);

} // namespace tabrun
