#pragma once

#include <map>
#include <optional>
#include <string>

namespace chunkvault::core {

// Authenticated caller identity handed to the upload engine.
struct Principal {
    std::string user_id;

    bool operator==(const Principal& other) const = default;
};

class IdentityProvider {
public:
    virtual ~IdentityProvider() = default;

    virtual std::optional<Principal> authenticate(const std::string& token) const = 0;
};

// Tokens come from the "auth.tokens" setting: user:token[,user:token...]
class StaticTokenIdentityProvider : public IdentityProvider {
public:
    StaticTokenIdentityProvider() = default;

    static StaticTokenIdentityProvider from_string(const std::string& table);

    void add_token(const std::string& token, const std::string& user_id);
    size_t token_count() const { return tokens_.size(); }

    std::optional<Principal> authenticate(const std::string& token) const override;

private:
    std::map<std::string, std::string> tokens_;
};

}
