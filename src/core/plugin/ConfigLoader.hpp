#pragma once

#include "PluginConfig.hpp"
#include "core/IndexError.hpp"
#include <QString>
#include <QStringList>
#include <functional>
#include <utility>

namespace rkl {

/// Looks for reckless.yaml and reckless.yml inside a plugin directory and
/// parses what it finds.
class ConfigLoader {
public:
    /// Parse capability: text in, config out; false plus a message on error.
    using Parser = std::function<bool(const QString& text, PluginConfig* config, QString* errorMessage)>;

    /// Uses PluginConfig::parse when `parser` is empty.
    explicit ConfigLoader(Parser parser = {});

    /// Candidate names in the order they are tried.
    static QStringList candidateFileNames();

    /// Every existing candidate is read and parsed in order; a later one
    /// replaces an earlier result, so reckless.yml wins over reckless.yaml.
    /// No candidate is not an error: `config` is reset to a null config.
    /// A read failure (FilesystemError) or parse failure (ConfigParseError)
    /// aborts and leaves `config` untouched.
    bool load(const QString& pluginDir, PluginConfig& config, IndexError* error = nullptr) const;

private:
    Parser parser_;
};

} // namespace rkl
