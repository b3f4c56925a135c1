#pragma once

#include "ConfigLoader.hpp"
#include "Plugin.hpp"
#include "core/IndexError.hpp"
#include <QList>
#include <QString>

namespace rkl {

/// Which language wins when a plugin's configuration declares one.
enum class LanguagePolicy {
    PreferDetected,   // marker files decide; the config's `lang` is ignored
    PreferConfig      // a recognised `lang` in the config overrides detection
};

LanguagePolicy languagePolicyFromString(const QString& text, bool* ok = nullptr);
QString languagePolicyName(LanguagePolicy policy);

/// Turns a repository tree into Plugin records: one per non-hidden
/// directory directly below the root, in walker order.
/// Pure file scanning and parsing, fully unit-testable.
class PluginIndexBuilder {
public:
    explicit PluginIndexBuilder(ConfigLoader loader = ConfigLoader());

    void setLanguagePolicy(LanguagePolicy policy) { policy_ = policy; }
    LanguagePolicy languagePolicy() const { return policy_; }

    /// Index `root`. All-or-nothing: the first walk, read or parse error
    /// aborts the pass and `plugins` is left untouched; on success
    /// `plugins` is replaced by the new collection.
    bool index(const QString& root, QList<Plugin>& plugins, IndexError* error = nullptr) const;

    /// Build the record for a single plugin directory.
    bool indexPlugin(const QString& pluginDir, Plugin& plugin, IndexError* error = nullptr) const;

private:
    ConfigLoader loader_;
    LanguagePolicy policy_ = LanguagePolicy::PreferDetected;
};

} // namespace rkl
