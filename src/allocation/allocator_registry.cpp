#include "tempo_ngin/allocation/allocator_registry.hpp"
#include <algorithm>
#include "tempo_ngin/allocation/equal_weight.hpp"
#include "tempo_ngin/allocation/inverse_volatility.hpp"
#include "tempo_ngin/allocation/mean_variance.hpp"
#include "tempo_ngin/allocation/risk_parity.hpp"
#include "tempo_ngin/core/logger.hpp"

namespace tempo_ngin {

AllocatorRegistry::AllocatorRegistry() {
    register_factory(AllocatorType::EQUAL_WEIGHT, [](const AllocatorConfig& config) {
        return std::make_shared<EqualWeightAllocator>(config);
    });
    register_factory(AllocatorType::INVERSE_VOLATILITY, [](const AllocatorConfig& config) {
        return std::make_shared<InverseVolatilityAllocator>(config);
    });
    register_factory(AllocatorType::MEAN_VARIANCE, [](const AllocatorConfig& config) {
        return std::make_shared<MeanVarianceAllocator>(config);
    });
    register_factory(AllocatorType::RISK_PARITY, [](const AllocatorConfig& config) {
        return std::make_shared<RiskParityAllocator>(config);
    });
}

void AllocatorRegistry::register_factory(AllocatorType type, Factory factory) {
    factories_[type] = std::move(factory);
}

std::vector<AllocatorType> AllocatorRegistry::resolve_chain(const AllocatorConfig& config) const {
    std::vector<AllocatorType> chain{config.type};
    auto it = std::find(config.fallback_order.begin(), config.fallback_order.end(), config.type);
    auto start = it == config.fallback_order.end() ? config.fallback_order.begin() : it + 1;
    for (; start != config.fallback_order.end(); ++start) {
        chain.push_back(*start);
    }
    return chain;
}

Result<void> AllocatorRegistry::validate(const AllocatorConfig& config) const {
    auto valid = config.validate();
    if (valid.is_error()) {
        return valid;
    }
    for (auto link : resolve_chain(config)) {
        if (!has_factory(link)) {
            return make_error<void>(ErrorCode::INVALID_CONFIG,
                                    "No factory registered for " + allocator_type_to_string(link),
                                    "AllocatorRegistry");
        }
    }
    return Result<void>();
}

Result<std::shared_ptr<const Allocator>> AllocatorRegistry::create(
    const AllocatorConfig& config) const {
    auto valid = validate(config);
    if (valid.is_error()) {
        return forward_error<std::shared_ptr<const Allocator>>(valid.error());
    }

    auto chain = resolve_chain(config);
    std::shared_ptr<const Allocator> next;
    std::string description;
    for (auto link = chain.rbegin(); link != chain.rend(); ++link) {
        auto allocator = factories_.at(*link)(config);
        if (!allocator) {
            return make_error<std::shared_ptr<const Allocator>>(
                ErrorCode::INVALID_CONFIG,
                "Factory for " + allocator_type_to_string(*link) + " returned nothing",
                "AllocatorRegistry");
        }
        allocator->set_fallback(next);
        next = allocator;
        description = description.empty() ? allocator_type_to_string(*link)
                                          : allocator_type_to_string(*link) + " -> " + description;
    }

    INFO("Allocator chain: " << description);
    return next;
}

}  // namespace tempo_ngin
