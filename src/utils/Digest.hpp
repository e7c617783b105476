#ifndef DIGEST_HPP
#define DIGEST_HPP

#include <string>

class Digest {
public:
    // Lowercase hex SHA-256 of data.
    static std::string sha256Hex(const std::string& data);
};

#endif // DIGEST_HPP
