#pragma once
#include "core/Error.hpp"
#include "core/PoolConfig.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace WP {

// Parses a JSON document into a PoolConfig. Missing keys keep their defaults;
// unknown keys are ignored. The result is validated before it is returned.
[[nodiscard]] auto parsePoolConfig(std::string_view text) -> Expected<PoolConfig>;

[[nodiscard]] auto loadPoolConfig(std::filesystem::path const& path) -> Expected<PoolConfig>;

// Serialises the value fields of a config. Injected strategy objects are not representable and are skipped.
[[nodiscard]] auto poolConfigToJson(PoolConfig const& config) -> std::string;

} // namespace WP
