#pragma once

/// @file service_locator.hpp
/// @brief Type-keyed registry of shared services handed to plugins.

#include <memory>
#include <typeindex>
#include <unordered_map>

namespace lbx::foundation {

/// Lightweight service locator for runtime dependency injection.
///
/// Services are registered under their interface type and looked up
/// with get<T>().  The locator shares ownership of every service it
/// holds, so a host may keep its own handle to a registered service.
///
/// Example:
/// @code
///   ServiceLocator locator;
///   locator.add<ConfigManager>(std::make_shared<ConfigManager>());
///
///   if (auto* config = locator.get<ConfigManager>()) {
///       auto capacity = config->get<int>("pool.capacity");
///   }
/// @endcode
class ServiceLocator {
public:
    ServiceLocator() = default;
    ~ServiceLocator() = default;

    ServiceLocator(const ServiceLocator&) = delete;
    ServiceLocator& operator=(const ServiceLocator&) = delete;
    ServiceLocator(ServiceLocator&&) = default;
    ServiceLocator& operator=(ServiceLocator&&) = default;

    /// Register a service by its interface type T, replacing any previous one.
    template <typename T>
    void add(std::shared_ptr<T> service) {
        services_[std::type_index(typeid(T))] = std::move(service);
    }

    /// Retrieve a registered service (nullptr if not found).
    template <typename T>
    [[nodiscard]] T* get() const {
        auto it = services_.find(std::type_index(typeid(T)));
        if (it == services_.end()) {
            return nullptr;
        }
        return static_cast<T*>(it->second.get());
    }

    template <typename T>
    [[nodiscard]] bool has() const {
        return services_.count(std::type_index(typeid(T))) > 0;
    }

    template <typename T>
    void remove() {
        services_.erase(std::type_index(typeid(T)));
    }

    void clear() { services_.clear(); }

    [[nodiscard]] std::size_t size() const noexcept { return services_.size(); }

private:
    // shared_ptr<void> keeps the deleter of the concrete type.
    std::unordered_map<std::type_index, std::shared_ptr<void>> services_;
};

} // namespace lbx::foundation
