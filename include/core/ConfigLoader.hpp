#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads soft AP configuration, capability and device overlay (JSON)
 *         from the host FS.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include <nlohmann/json_fwd.hpp>

#include "core/DeviceOverlay.hpp"
#include "model/ApConfiguration.hpp"
#include "model/Capability.hpp"

namespace apctl::core {

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file and maps it onto the model types.
 *
 *  * No caching: every call to `load()` re-reads the file.
 *  * Missing keys keep the model defaults; wrongly typed or unknown enum
 *    values throw `std::runtime_error`.
 */
  class ConfigLoader {
  public:
    /// @param configPath  Absolute or relative path on the host FS.
    explicit ConfigLoader(std::string configPath);

    /// Parse the file into a nlohmann::json object or throw `std::runtime_error`.
    nlohmann::json load() const;

    model::DesiredConfiguration loadDesiredConfiguration() const;
    model::CapabilitySnapshot loadCapability() const;
    DeviceOverlay loadOverlay() const;

    static model::DesiredConfiguration parseDesiredConfiguration(const nlohmann::json& j);
    static model::CapabilitySnapshot parseCapability(const nlohmann::json& j);
    static DeviceOverlay parseOverlay(const nlohmann::json& j);

    /// "2g", "5g", "6g", "60g" joined by '|'.
    static model::Band parseBand(const std::string& text);
    /// Same spelling as model::toString(SecurityType).
    static model::SecurityType parseSecurityType(const std::string& text);
    /// Upper-case feature names, e.g. "ACS_OFFLOAD".
    static model::Feature parseFeature(const std::string& text);

    const std::string& path() const { return path_; }

  private:
    std::string path_;
  };

} // namespace apctl::core
