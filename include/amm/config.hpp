#ifndef AMM_CONFIG_HPP
#define AMM_CONFIG_HPP

#include <string>
#include <string_view>

#include "types.hpp"

namespace amm {

// =============================================================================
// Engine Configuration
// =============================================================================
//
// TOML:
//   [engine]
//   address = "0x..."
//   protocol_fee_controller = "0x..."
//
//   [logging]
//   level = "info"
//
// JSON uses the same sections as nested objects.

struct EngineConfig {
    std::string log_level = "info";
    Address engine_address = address_from_u64(0xE4E);    // Custody account of the engine
    Address protocol_fee_controller{};                    // Zero: nobody may set protocol fees

    static EngineConfig from_file(std::string_view path);
    static EngineConfig from_toml(std::string_view content);
    static EngineConfig from_json(std::string_view content);
};

// Apply a level name ("trace" .. "off") to the default spdlog logger.
// Unknown names throw std::invalid_argument.
void init_logging(const std::string& level);

} // namespace amm

#endif // AMM_CONFIG_HPP
