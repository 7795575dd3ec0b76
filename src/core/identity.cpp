#include "chunkvault/core/identity.hpp"
#include "chunkvault/core/logger.hpp"
#include "chunkvault/core/utils.hpp"

namespace chunkvault::core {

StaticTokenIdentityProvider StaticTokenIdentityProvider::from_string(const std::string& table) {
    StaticTokenIdentityProvider provider;

    for (const auto& entry : utils::StringUtils::split(table, ',')) {
        auto trimmed = utils::StringUtils::trim(entry);
        if (trimmed.empty()) {
            continue;
        }

        auto colon = trimmed.find(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 == trimmed.size()) {
            LOG_WARN("Ignoring malformed auth token entry");
            continue;
        }

        provider.add_token(trimmed.substr(colon + 1), trimmed.substr(0, colon));
    }

    return provider;
}

void StaticTokenIdentityProvider::add_token(const std::string& token, const std::string& user_id) {
    tokens_[token] = user_id;
}

std::optional<Principal> StaticTokenIdentityProvider::authenticate(const std::string& token) const {
    if (token.empty()) {
        return std::nullopt;
    }

    auto it = tokens_.find(token);
    if (it == tokens_.end()) {
        return std::nullopt;
    }
    return Principal{it->second};
}

}
