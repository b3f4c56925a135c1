#include "PluginConfig.hpp"
#include <boost/log/trivial.hpp>

namespace rkl {

namespace {

bool readScalar(const YAML::Node& section, const char* key, QString& out, QString* errorMessage)
{
    const YAML::Node value = section[key];
    if (!value.IsDefined() || value.IsNull())
        return true;
    if (!value.IsScalar()) {
        if (errorMessage)
            *errorMessage = QString("plugin.%1 must be a scalar").arg(key);
        return false;
    }
    out = QString::fromStdString(value.as<std::string>());
    return true;
}

bool readList(const YAML::Node& section, const char* key, QStringList& out, QString* errorMessage)
{
    const YAML::Node value = section[key];
    if (!value.IsDefined() || value.IsNull())
        return true;
    if (!value.IsSequence()) {
        if (errorMessage)
            *errorMessage = QString("plugin.%1 must be a sequence").arg(key);
        return false;
    }
    for (const auto& item : value) {
        if (!item.IsScalar()) {
            if (errorMessage)
                *errorMessage = QString("plugin.%1 entries must be scalars").arg(key);
            return false;
        }
        out.append(QString::fromStdString(item.as<std::string>()));
    }
    return true;
}

} // namespace

PluginConfig& PluginConfig::operator=(const PluginConfig& other)
{
    if (this == &other)
        return *this;

    null_ = other.null_;
    root_.reset(other.root_);
    name_ = other.name_;
    version_ = other.version_;
    description_ = other.description_;
    lang_ = other.lang_;
    main_ = other.main_;
    deps_ = other.deps_;
    build_ = other.build_;
    return *this;
}

bool PluginConfig::parse(const QString& text, PluginConfig* config, QString* errorMessage)
{
    PluginConfig parsed;

    try {
        parsed.root_ = YAML::Load(text.toStdString());
    } catch (const YAML::Exception& e) {
        if (errorMessage)
            *errorMessage = QString::fromStdString(e.what());
        return false;
    }

    if (!parsed.root_.IsMap()) {
        if (errorMessage)
            *errorMessage = QStringLiteral("top-level value must be a mapping");
        return false;
    }

    const YAML::Node section = parsed.root_["plugin"];
    if (section.IsDefined() && !section.IsNull()) {
        if (!section.IsMap()) {
            if (errorMessage)
                *errorMessage = QStringLiteral("plugin must be a mapping");
            return false;
        }

        try {
            if (!readScalar(section, "name", parsed.name_, errorMessage)
                || !readScalar(section, "version", parsed.version_, errorMessage)
                || !readScalar(section, "description", parsed.description_, errorMessage)
                || !readScalar(section, "lang", parsed.lang_, errorMessage)
                || !readScalar(section, "main", parsed.main_, errorMessage)
                || !readList(section, "deps", parsed.deps_, errorMessage)
                || !readList(section, "build", parsed.build_, errorMessage))
                return false;
        } catch (const YAML::Exception& e) {
            if (errorMessage)
                *errorMessage = QString::fromStdString(e.what());
            return false;
        }
    }

    parsed.null_ = false;
    BOOST_LOG_TRIVIAL(debug) << "Parsed plugin configuration"
                             << (parsed.name_.isEmpty() ? std::string() : " for " + parsed.name_.toStdString());

    if (config)
        *config = parsed;
    return true;
}

} // namespace rkl
