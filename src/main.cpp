#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QTextStream>
#include <boost/log/trivial.hpp>
#include "core/IndexerConfig.hpp"
#include "core/Logging.hpp"
#include "core/repository/RepositoryManager.hpp"

namespace {

enum ExitCode {
    ExitOk = 0,
    ExitNotFound = 1,
    ExitConfigError = 2,
    ExitRepositoryFailed = 3
};

void printPlugin(QTextStream& out, const QString& repoName, const rkl::Plugin& plugin)
{
    out << repoName << '\t' << plugin.name << '\t' << rkl::languageName(plugin.language) << '\t'
        << (plugin.hasConfig() ? "configured" : "-") << '\t' << plugin.path << '\n';
}

void printPluginDetails(QTextStream& out, const QString& repoName, const rkl::Plugin& plugin)
{
    out << "name:        " << plugin.name << '\n'
        << "repository:  " << repoName << '\n'
        << "path:        " << plugin.path << '\n'
        << "language:    " << rkl::languageName(plugin.language) << '\n';

    if (!plugin.hasConfig()) {
        out << "config:      none\n";
        return;
    }

    const auto& config = plugin.config;
    out << "config:      yes\n";
    if (!config.version().isEmpty())
        out << "  version:   " << config.version() << '\n';
    if (!config.declaredLanguage().isEmpty())
        out << "  lang:      " << config.declaredLanguage() << '\n';
    if (!config.main().isEmpty())
        out << "  main:      " << config.main() << '\n';
    if (!config.deps().isEmpty())
        out << "  deps:      " << config.deps().join(", ") << '\n';
    for (const auto& step : config.build())
        out << "  build:     " << step << '\n';
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("reckless-index");
    app.setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Discover the plugins published in plugin repositories.");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOption(QStringList{"c", "config"}, "Configuration file.", "file",
                                    rkl::IndexerConfig::defaultPath());
    QCommandLineOption verboseOption(QStringList{"v", "verbose"}, "Enable debug logging.");
    QCommandLineOption policyOption("policy", "Language precedence: detected or config.", "policy");
    QCommandLineOption repoOption("repo", "Add a repository (repeatable).", "name=url-or-path");
    parser.addOption(configOption);
    parser.addOption(verboseOption);
    parser.addOption(policyOption);
    parser.addOption(repoOption);
    parser.addPositionalArgument("command", "list (default) or show <plugin>.");
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    rkl::IndexerConfig config;
    const QString configPath = parser.value(configOption);
    // The default file is optional; an explicitly named one is not.
    if (parser.isSet(configOption) || QFile::exists(configPath)) {
        QString message;
        if (!config.load(configPath, &message)) {
            err << "error: cannot load " << configPath << ": " << message << '\n';
            return ExitConfigError;
        }
    }

    rkl::initLogging(parser.isSet(verboseOption) ? rkl::LogLevel::Debug : config.logLevel());

    if (parser.isSet(policyOption)) {
        bool ok = false;
        const auto policy = rkl::languagePolicyFromString(parser.value(policyOption), &ok);
        if (!ok) {
            err << "error: unknown policy " << parser.value(policyOption) << '\n';
            return ExitNotFound;
        }
        config.setLanguagePolicy(policy);
    }

    for (const auto& repoArg : parser.values(repoOption)) {
        const int eq = repoArg.indexOf('=');
        if (eq <= 0) {
            err << "error: --repo expects name=url-or-path, got " << repoArg << '\n';
            return ExitNotFound;
        }
        rkl::RepositoryEntry entry;
        entry.name = repoArg.left(eq);
        entry.url = repoArg.mid(eq + 1);
        entry.path = config.storageRoot() + "/" + entry.name;
        config.addRepository(entry);
    }

    const QStringList args = parser.positionalArguments();
    const QString command = args.value(0, "list");
    if (command != "list" && command != "show") {
        err << "error: unknown command " << command << '\n';
        parser.showHelp(ExitNotFound);
    }
    if (command == "show" && args.size() < 2) {
        err << "error: show needs a plugin name\n";
        return ExitNotFound;
    }

    const rkl::RepositoryOptions options = config.repositoryOptions();
    rkl::RepositoryManager manager;
    for (const auto& entry : config.repositories()) {
        manager.addRepository(rkl::createRepository(entry.name, entry.url, entry.path, options));
    }

    if (manager.count() == 0) {
        BOOST_LOG_TRIVIAL(warning) << "No repositories configured";
    }

    bool anyFailed = false;
    QObject::connect(&manager, &rkl::RepositoryManager::repositoryFailed,
                     [&](const QString& name, const QString& reason) {
        anyFailed = true;
        err << "error: repository " << name << ": " << reason << '\n';
    });
    manager.initializeAll();
    err.flush();

    if (command == "show") {
        QString repoName;
        const auto plugin = manager.findPlugin(args.at(1), &repoName);
        if (!plugin.isValid()) {
            err << "error: plugin " << args.at(1) << " not found\n";
            return anyFailed ? ExitRepositoryFailed : ExitNotFound;
        }
        printPluginDetails(out, repoName, plugin);
        return anyFailed ? ExitRepositoryFailed : ExitOk;
    }

    for (const auto* repository : manager.repositories()) {
        for (const auto& plugin : repository->list())
            printPlugin(out, repository->name(), plugin);
    }

    return anyFailed ? ExitRepositoryFailed : ExitOk;
}
