#ifndef KEYDERIVER_HPP
#define KEYDERIVER_HPP

#include <string>

#include "Serializer.hpp"
#include "../interfaces/StorageInterface.hpp"

// Builds cache keys of the form
//
//     <prefix>::<identity>::<hex of CBOR-encoded argument array>
//
// The prefix is restricted to [A-Za-z0-9_.-] so that "<prefix>::" is an
// unambiguous namespace boundary for file name filtering and Redis SCAN
// patterns. The hex tail contains no ':', so identity and arguments can
// not alias each other.
class KeyDeriver {
public:
    explicit KeyDeriver(std::string prefix);

    template <typename... Args>
    std::string derive(const std::string& identity, const Args&... args) const {
        return compose(identity, Serializer::encodeArguments(args...));
    }

    std::string compose(const std::string& identity, const Bytes& encoded_arguments) const;

    // True if key lives in this deriver's namespace.
    bool owns(const std::string& key) const;

    const std::string& prefix() const { return prefix_; }

    // "<prefix>::", the leading part shared by every key of a prefix.
    static std::string scopeOf(const std::string& prefix);
    // Throws std::invalid_argument for an empty or non-reserved-safe prefix.
    static void validatePrefix(const std::string& prefix);
    static std::string toHex(const Bytes& bytes);

private:
    std::string prefix_;
    std::string scope_;
};

#endif // KEYDERIVER_HPP
