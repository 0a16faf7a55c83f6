#include "curdecomp/strategy_registry.hpp"
#include "curdecomp/error.hpp"

#include <algorithm>

namespace curdecomp {

StrategyRegistry& StrategyRegistry::instance() {
    static StrategyRegistry registry;
    return registry;
}

StrategyRegistry::StrategyRegistry() {
    register_type<SvdLeverageSelection>("svd");
    register_type<PcovrSelection>("pcovr");
}

void StrategyRegistry::register_creator(const std::string& name, CreatorFunction creator) {
    CURDECOMP_CHECK_ARGUMENT(!name.empty(), "Strategy name must not be empty");
    CURDECOMP_CHECK_ARGUMENT(static_cast<bool>(creator), "Strategy creator must be callable");
    std::lock_guard<std::mutex> lock(mutex_);
    creators_[name] = std::move(creator);
}

std::shared_ptr<const SelectionStrategy> StrategyRegistry::create(const std::string& name) const {
    CreatorFunction creator;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = creators_.find(name);
        if (it == creators_.end()) {
            throw ConfigurationError("Unknown selection strategy: " + name, __func__,
                                     "Built-in strategies are \"svd\" and \"pcovr\"");
        }
        creator = it->second;
    }
    return creator();
}

std::vector<std::string> StrategyRegistry::get_registered_types() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> types;
    types.reserve(creators_.size());
    for (const auto& pair : creators_) {
        types.push_back(pair.first);
    }
    std::sort(types.begin(), types.end());
    return types;
}

bool StrategyRegistry::is_registered(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return creators_.find(name) != creators_.end();
}

} // namespace curdecomp
