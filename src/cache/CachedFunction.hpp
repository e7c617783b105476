#pragma once

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include "CacheEngine.hpp"

// Parameters a cached function may take: values or const lvalue references.
// Arguments are also encoded into the key, so the function must not be able
// to modify them.
template <typename T>
inline constexpr bool is_cacheable_parameter_v =
    !std::is_reference_v<T> ||
    (std::is_lvalue_reference_v<T> && std::is_const_v<std::remove_reference_t<T>>);

// Memoizes fn through a CacheEngine. Keys come from identity plus the
// call's arguments, so identity must stay the same across builds for
// entries to be reused and must differ between functions that share a
// prefix. Recursive functions get cached sub-calls if they recurse through
// the wrapper.
template <typename R, typename... Args>
class CachedFunction {
    static_assert((is_cacheable_parameter_v<Args> && ...),
                  "cached functions take parameters by value or by const reference");

public:
    CachedFunction(std::shared_ptr<CacheEngine> engine, std::string identity, std::function<R(Args...)> fn)
        : engine_(std::move(engine)), identity_(std::move(identity)), fn_(std::move(fn)) {
        if (!engine_) {
            throw std::invalid_argument("CacheEngine pointer cannot be null");
        }
        if (identity_.empty()) {
            throw std::invalid_argument("Function identity cannot be empty");
        }
        if (!fn_) {
            throw std::invalid_argument("Cached function cannot be empty");
        }
    }

    R operator()(const std::decay_t<Args>&... args) const {
        return engine_->lookupOr<R>(keyFor(args...), [&]() { return fn_(args...); });
    }

    // Calls fn directly; the cache is neither read nor written.
    R uncached(const std::decay_t<Args>&... args) const {
        return fn_(args...);
    }

    // Recomputes and overwrites the entry for these arguments.
    R refresh(const std::decay_t<Args>&... args) const {
        return engine_->recompute<R>(keyFor(args...), [&]() { return fn_(args...); });
    }

    void forget(const std::decay_t<Args>&... args) const {
        engine_->flush(keyFor(args...));
    }

    std::string keyFor(const std::decay_t<Args>&... args) const {
        return engine_->keys().derive(identity_, args...);
    }

    const std::string& identity() const { return identity_; }

private:
    std::shared_ptr<CacheEngine> engine_;
    std::string identity_;
    std::function<R(Args...)> fn_;
};

template <typename R, typename... Args>
CachedFunction<R, Args...> makeCached(std::shared_ptr<CacheEngine> engine, std::string identity, R (*fn)(Args...)) {
    return CachedFunction<R, Args...>(std::move(engine), std::move(identity), std::function<R(Args...)>(fn));
}
