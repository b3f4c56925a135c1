#pragma once

#include "PluginLanguage.hpp"
#include <QString>
#include <QStringList>
#include <yaml-cpp/yaml.h>

namespace rkl {

/// Optional per-plugin override read from reckless.yaml / reckless.yml.
///
/// The whole document is kept (node()) for downstream tools; the
/// recognised `plugin:` section is also exposed through typed accessors:
///
///   plugin:
///     name: my-plugin
///     version: 0.1.0
///     description: Does things
///     lang: python
///     main: main.py
///     deps: [pip]
///     build:
///       - pip install -r requirements.txt
class PluginConfig {
public:
    PluginConfig() = default;
    PluginConfig(const PluginConfig&) = default;
    // YAML::Node::operator= rewrites the node shared with other copies;
    // rebind instead.
    PluginConfig& operator=(const PluginConfig& other);

    /// True for a default-constructed config (no file was found).
    bool isNull() const { return null_; }

    QString name() const { return name_; }
    QString version() const { return version_; }
    QString description() const { return description_; }
    QString main() const { return main_; }
    QStringList deps() const { return deps_; }
    QStringList build() const { return build_; }

    /// Raw `lang` value as written.
    QString declaredLanguage() const { return lang_; }
    /// `lang` mapped onto the closed language set (Unknown if absent or
    /// unrecognised).
    PluginLanguage language() const { return languageFromString(lang_); }

    const YAML::Node& node() const { return root_; }

    /// Default text-parsing capability used by ConfigLoader.
    /// The root must be a mapping; a `plugin` entry, when present, must be a
    /// mapping whose scalar fields are scalars and whose `deps`/`build`
    /// entries are sequences of scalars. On failure `config` is untouched
    /// and `errorMessage` (when given) explains why.
    static bool parse(const QString& text, PluginConfig* config, QString* errorMessage = nullptr);

private:
    bool null_ = true;
    YAML::Node root_;
    QString name_;
    QString version_;
    QString description_;
    QString lang_;
    QString main_;
    QStringList deps_;
    QStringList build_;
};

} // namespace rkl
