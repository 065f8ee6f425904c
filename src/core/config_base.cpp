#include "tempo_ngin/core/config_base.hpp"

namespace tempo_ngin {

Result<void> ConfigBase::load_json(const nlohmann::json& j) {
    try {
        from_json(j);
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::INVALID_CONFIG,
                                std::string("Error loading config: ") + e.what(), "ConfigBase");
    }
    return validate();
}

}  // namespace tempo_ngin
