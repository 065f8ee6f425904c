// include/tempo_ngin/allocation/allocator_registry.hpp
#pragma once

#include <functional>
#include <map>
#include <memory>
#include <vector>
#include "tempo_ngin/allocation/allocator.hpp"
#include "tempo_ngin/allocation/allocator_config.hpp"

namespace tempo_ngin {

/**
 * @brief Maps allocator types to factories and builds fallback chains
 */
class AllocatorRegistry {
public:
    using Factory = std::function<std::shared_ptr<Allocator>(const AllocatorConfig&)>;

    /**
     * @brief Registry with the built-in allocators registered
     */
    AllocatorRegistry();

    /**
     * @brief Register or replace the factory of a type
     */
    void register_factory(AllocatorType type, Factory factory);

    bool has_factory(AllocatorType type) const {
        return factories_.count(type) > 0;
    }

    /**
     * @brief Check a configuration can be built: valid fields and a factory
     *        for every link of its chain
     */
    Result<void> validate(const AllocatorConfig& config) const;

    /**
     * @brief Links tried in order: the configured type, then the entries of
     *        fallback_order after it (all of them if it is not listed)
     */
    std::vector<AllocatorType> resolve_chain(const AllocatorConfig& config) const;

    /**
     * @brief Build the configured allocator with its fallback chain attached
     */
    Result<std::shared_ptr<const Allocator>> create(const AllocatorConfig& config) const;

private:
    std::map<AllocatorType, Factory> factories_;
};

}  // namespace tempo_ngin
