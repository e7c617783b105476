#ifndef SERIALIZER_HPP
#define SERIALIZER_HPP

#include <string>

#include <nlohmann/json.hpp>

#include "../errors/CacheErrors.hpp"
#include "../interfaces/StorageInterface.hpp"

using json = nlohmann::json;

// Binary codec for cached values and argument tuples. Any type with a
// nlohmann::json conversion (builtins, std containers, or user types with
// to_json/from_json) can be stored. CBOR tags every item with its major
// type and objects carry their field names, so equal encodings imply equal
// values.
class Serializer {
public:
    template <typename T>
    static Bytes encode(const T& value) {
        try {
            return json::to_cbor(json(value));
        } catch (const json::exception& e) {
            throw SerializationError(std::string("Failed to encode value: ") + e.what());
        }
    }

    template <typename T>
    static T decode(const Bytes& bytes) {
        try {
            return json::from_cbor(bytes).get<T>();
        } catch (const json::exception& e) {
            throw DeserializationError(std::string("Failed to decode value of ") +
                                       std::to_string(bytes.size()) + " bytes: " + e.what());
        }
    }

    // Encodes the arguments as a CBOR array in call order.
    template <typename... Args>
    static Bytes encodeArguments(const Args&... args) {
        try {
            json tuple = json::array();
            (tuple.push_back(json(args)), ...);
            return json::to_cbor(tuple);
        } catch (const json::exception& e) {
            throw SerializationError(std::string("Failed to encode arguments: ") + e.what());
        }
    }
};

#endif // SERIALIZER_HPP
