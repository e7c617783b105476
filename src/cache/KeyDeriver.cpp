#include "KeyDeriver.hpp"

#include <regex>
#include <stdexcept>
#include <utility>

#include "../config/AppConfig.hpp"

KeyDeriver::KeyDeriver(std::string prefix) : prefix_(std::move(prefix)) {
    validatePrefix(prefix_);
    scope_ = scopeOf(prefix_);
}

std::string KeyDeriver::compose(const std::string& identity, const Bytes& encoded_arguments) const {
    if (identity.empty()) {
        throw std::invalid_argument("Function identity cannot be empty");
    }
    std::string key;
    key.reserve(scope_.size() + identity.size() + 2 + encoded_arguments.size() * 2);
    key += scope_;
    key += identity;
    key += Constants::KEY_SEPARATOR;
    key += toHex(encoded_arguments);
    return key;
}

bool KeyDeriver::owns(const std::string& key) const {
    return key.compare(0, scope_.size(), scope_) == 0;
}

std::string KeyDeriver::scopeOf(const std::string& prefix) {
    return prefix + Constants::KEY_SEPARATOR;
}

void KeyDeriver::validatePrefix(const std::string& prefix) {
    if (!std::regex_match(prefix, Constants::prefix_regex)) {
        throw std::invalid_argument("Invalid key prefix '" + prefix +
                                    "': expected one or more of [A-Za-z0-9_.-]");
    }
}

std::string KeyDeriver::toHex(const Bytes& bytes) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (auto b : bytes) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}
