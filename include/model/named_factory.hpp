//! # Named Factory
//!
//! Create-or-fetch registry for symbols identified by name. One factory
//! per symbol kind guarantees a single `EnumType` per enum name and a
//! single `Extension` per extension name across every loaded document.
//!
//! ## Example
//!
//! ```cpp
//! NamedFactory<Extension> extensions;
//! auto& ext = extensions.get_or_create("VK_KHR_swapchain", 2);
//! extensions.get_or_create("VK_KHR_swapchain", 99).number(); // still 2
//! ```
//!
//! The registry is unordered; callers that need an order use `sorted()`.

#ifndef ENUMGEN_MODEL_NAMED_FACTORY_HPP
#define ENUMGEN_MODEL_NAMED_FACTORY_HPP

#include "common.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>
#include <vector>

namespace enumgen::model {

template <typename T> class NamedFactory {
public:
    NamedFactory() = default;
    NamedFactory(const NamedFactory&) = delete;
    NamedFactory& operator=(const NamedFactory&) = delete;
    NamedFactory(NamedFactory&&) = default;
    NamedFactory& operator=(NamedFactory&&) = default;

    /// Returns the object registered under `name`, constructing
    /// `T(name, args...)` on first use. `args` are ignored on a hit.
    template <typename... Args> T& get_or_create(const std::string& name, Args&&... args) {
        auto it = registry_.find(name);
        if (it != registry_.end())
            return *it->second;

        auto [inserted, _] =
            registry_.emplace(name, make_box<T>(name, std::forward<Args>(args)...));
        return *inserted->second;
    }

    /// Non-creating lookup. Returns nullptr when `name` is unknown.
    T* lookup(const std::string& name) {
        auto it = registry_.find(name);
        return it == registry_.end() ? nullptr : it->second.get();
    }

    const T* lookup(const std::string& name) const {
        auto it = registry_.find(name);
        return it == registry_.end() ? nullptr : it->second.get();
    }

    bool contains(const std::string& name) const {
        return registry_.count(name) != 0;
    }

    size_t size() const {
        return registry_.size();
    }

    /// All registered objects ordered by name.
    std::vector<const T*> sorted() const {
        std::vector<const T*> out;
        out.reserve(registry_.size());
        for (const auto& [_, object] : registry_)
            out.push_back(object.get());
        std::sort(out.begin(), out.end(),
                  [](const T* a, const T* b) { return a->name() < b->name(); });
        return out;
    }

private:
    std::unordered_map<std::string, Box<T>> registry_;
};

} // namespace enumgen::model

#endif // ENUMGEN_MODEL_NAMED_FACTORY_HPP
