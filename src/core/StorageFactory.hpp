#ifndef STORAGEFACTORY_HPP
#define STORAGEFACTORY_HPP

#include <memory>

#include "../interfaces/ILogger.hpp"
#include "../interfaces/StorageInterface.hpp"
#include "../models/StorageConfig.hpp"

class StorageFactory {
public:
    // Builds the backend described by config. Errors reaching the backend
    // (ConnectionError) propagate; there is no silent fallback to another kind.
    static std::shared_ptr<StorageInterface> create(const StorageConfig& config,
                                                    std::shared_ptr<ILogger> logger);
};

#endif // STORAGEFACTORY_HPP
