#pragma once

#include <functional>
#include <memory>
#include <utility>

namespace philoglot::core
{

/**
 * @brief Resolve-once holder for a lazily constructed handle.
 *
 * The factory runs on the first get() and never again; its result is owned
 * here for the lifetime of the resolver. A factory may legitimately return
 * nullptr ("no handle"), which is cached like any other result. If the factory
 * throws, nothing is cached and the exception reaches the caller unchanged, so
 * the next get() tries again.
 *
 * Not synchronized: one owner, one thread.
 */
template<typename T>
class CachedResolver
{
public:
    using Factory = std::function<std::unique_ptr<T>()>;

    explicit CachedResolver(Factory factory)
        : factory_(std::move(factory))
    {
    }

    CachedResolver(const CachedResolver&) = delete;
    CachedResolver& operator=(const CachedResolver&) = delete;
    CachedResolver(CachedResolver&&) = default;
    CachedResolver& operator=(CachedResolver&&) = default;

    [[nodiscard]] bool isResolved() const noexcept { return resolved_; }

    T* get()
    {
        if (!resolved_)
        {
            handle_ = factory_ ? factory_() : nullptr;
            resolved_ = true;
        }
        return handle_.get();
    }

    // Cached handle without resolving; nullptr before the first get().
    [[nodiscard]] T* peek() const noexcept { return handle_.get(); }

private:
    Factory factory_;
    std::unique_ptr<T> handle_;
    bool resolved_ = false;
};

} // namespace philoglot::core
