#pragma once

#include "PluginConfig.hpp"
#include "PluginLanguage.hpp"
#include <QString>

namespace rkl {

/// One plugin found in a repository: a non-hidden directory directly under
/// the repository root.
struct Plugin {
    QString name;       // directory name
    QString path;       // absolute path of the plugin directory
    PluginLanguage language = PluginLanguage::Unknown;
    PluginConfig config;    // isNull() when no reckless.yaml/.yml exists

    bool hasConfig() const { return !config.isNull(); }

    /// False for the value returned by a failed lookup.
    bool isValid() const { return !name.isEmpty() && !path.isEmpty(); }
};

} // namespace rkl
