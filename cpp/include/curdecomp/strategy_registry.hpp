#pragma once

#include "curdecomp/selection.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace curdecomp {

/**
 * Name -> SelectionStrategy factory.
 *
 * "svd" and "pcovr" are registered when the registry is first used.
 * Callers may add their own strategies under new names (or replace a
 * built-in) and refer to them through CurOptions::pi_function.
 */
class StrategyRegistry {
public:
    using CreatorFunction = std::function<std::shared_ptr<const SelectionStrategy>()>;

    static StrategyRegistry& instance();

    template<typename DerivedType>
    void register_type(const std::string& name) {
        register_creator(name, []() -> std::shared_ptr<const SelectionStrategy> {
            return std::make_shared<DerivedType>();
        });
    }

    void register_creator(const std::string& name, CreatorFunction creator);

    /**
     * @throws ConfigurationError for an unknown name
     */
    std::shared_ptr<const SelectionStrategy> create(const std::string& name) const;

    std::vector<std::string> get_registered_types() const;

    bool is_registered(const std::string& name) const;

private:
    StrategyRegistry();
    StrategyRegistry(const StrategyRegistry&) = delete;
    StrategyRegistry& operator=(const StrategyRegistry&) = delete;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, CreatorFunction> creators_;
};

} // namespace curdecomp
