/**
 * MAILRLM - Resumable Email Analysis Toolkit
 * Fingerprint Implementation
 */

#include "util/fingerprint.hpp"

#include <xxhash.h>

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace mailrlm::util {

namespace {

std::string to_hex(XXH64_hash_t hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << hash;
    return oss.str();
}

} // namespace

std::string fingerprint(std::string_view text) {
    return to_hex(XXH64(text.data(), text.size(), 0));
}

std::string fingerprint_identifiers(const std::vector<std::optional<std::string>>& ids) {
    std::vector<std::string> keys;
    keys.reserve(ids.size());
    for (std::size_t i = 0; i < ids.size(); ++i) {
        keys.push_back(ids[i] ? *ids[i] : std::to_string(i));
    }
    std::sort(keys.begin(), keys.end());

    // Incremental hashing avoids materializing the joined string
    XXH64_state_t* state = XXH64_createState();
    XXH64_reset(state, 0);
    for (std::size_t i = 0; i < keys.size(); ++i) {
        if (i > 0) {
            XXH64_update(state, "|", 1);
        }
        XXH64_update(state, keys[i].data(), keys[i].size());
    }
    XXH64_hash_t hash = XXH64_digest(state);
    XXH64_freeState(state);

    return to_hex(hash);
}

} // namespace mailrlm::util
