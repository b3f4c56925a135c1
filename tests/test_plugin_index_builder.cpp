#include <QtTest>
#include <QTemporaryDir>
#include "core/plugin/PluginIndexBuilder.hpp"

using rkl::LanguagePolicy;
using rkl::Plugin;
using rkl::PluginIndexBuilder;
using rkl::PluginLanguage;

namespace {

void writeFile(const QString& path, const QByteArray& content = {})
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile f(path);
    f.open(QIODevice::WriteOnly);
    f.write(content);
    f.close();
}

QStringList pluginNames(const QList<Plugin>& plugins)
{
    QStringList names;
    for (const auto& p : plugins)
        names.append(p.name);
    return names;
}

} // namespace

class TestPluginIndexBuilder : public QObject {
    Q_OBJECT
private slots:
    void testEmptyRoot();
    void testAllHiddenRoot();
    void testAlphaBetaHiddenExample();
    void testEnumerationOrder();
    void testRootFilesAreNotPlugins();
    void testConfigAttached();
    void testMissingRootFails();
    void testBrokenConfigAbortsWholePass();
    void testIdempotent();
    void testDetectedLanguageWinsByDefault();
    void testPreferConfigPolicy();
    void testPreferConfigFallsBackOnUnknownLang();
    void testPolicyNames();
    void testStaticFixture();
};

void TestPluginIndexBuilder::testEmptyRoot()
{
    QTemporaryDir tmp;
    QList<Plugin> plugins;
    rkl::IndexError error;
    QVERIFY(PluginIndexBuilder().index(tmp.path(), plugins, &error));
    QVERIFY(plugins.isEmpty());
    QVERIFY(!error.isError());
}

void TestPluginIndexBuilder::testAllHiddenRoot()
{
    QTemporaryDir tmp;
    writeFile(tmp.filePath(".git/config"));
    writeFile(tmp.filePath(".github/workflows/ci.yml"));
    writeFile(tmp.filePath(".tool/go.mod"));

    QList<Plugin> plugins;
    QVERIFY(PluginIndexBuilder().index(tmp.path(), plugins));
    QVERIFY(plugins.isEmpty());
}

void TestPluginIndexBuilder::testAlphaBetaHiddenExample()
{
    QTemporaryDir tmp;
    writeFile(tmp.filePath("alpha/go.mod"), "module alpha\n");
    QDir(tmp.path()).mkpath(".hidden");
    QDir(tmp.path()).mkpath("beta");

    QList<Plugin> plugins;
    QVERIFY(PluginIndexBuilder().index(tmp.path(), plugins));
    QCOMPARE(plugins.size(), 2);

    QCOMPARE(plugins[0].name, QString("alpha"));
    QCOMPARE(plugins[0].path, QDir::cleanPath(tmp.filePath("alpha")));
    QCOMPARE(plugins[0].language, PluginLanguage::Go);
    QVERIFY(!plugins[0].hasConfig());

    QCOMPARE(plugins[1].name, QString("beta"));
    QCOMPARE(plugins[1].language, PluginLanguage::Unknown);
    QVERIFY(!plugins[1].hasConfig());
}

void TestPluginIndexBuilder::testEnumerationOrder()
{
    QTemporaryDir tmp;
    for (const char* name : {"summary", "autopilot", "rebalance", "feeadjuster"})
        QDir(tmp.path()).mkpath(name);

    QList<Plugin> plugins;
    QVERIFY(PluginIndexBuilder().index(tmp.path(), plugins));
    QCOMPARE(pluginNames(plugins), QStringList({"autopilot", "feeadjuster", "rebalance", "summary"}));
}

void TestPluginIndexBuilder::testRootFilesAreNotPlugins()
{
    QTemporaryDir tmp;
    writeFile(tmp.filePath("README.md"));
    writeFile(tmp.filePath("requirements.txt"));
    writeFile(tmp.filePath("plugin/requirements.txt"));

    QList<Plugin> plugins;
    QVERIFY(PluginIndexBuilder().index(tmp.path(), plugins));
    QCOMPARE(pluginNames(plugins), QStringList({"plugin"}));
    QCOMPARE(plugins[0].language, PluginLanguage::Python);
}

void TestPluginIndexBuilder::testConfigAttached()
{
    QTemporaryDir tmp;
    writeFile(tmp.filePath("summary/requirements.txt"));
    writeFile(tmp.filePath("summary/reckless.yml"), "plugin:\n  name: summary\n  version: 1.0\n");

    QList<Plugin> plugins;
    QVERIFY(PluginIndexBuilder().index(tmp.path(), plugins));
    QCOMPARE(plugins.size(), 1);
    QVERIFY(plugins[0].hasConfig());
    QCOMPARE(plugins[0].config.version(), QString("1.0"));
}

void TestPluginIndexBuilder::testMissingRootFails()
{
    QList<Plugin> plugins;
    rkl::IndexError error;
    QVERIFY(!PluginIndexBuilder().index("/nonexistent/reckless/repo", plugins, &error));
    QCOMPARE(error.kind, rkl::IndexError::FilesystemError);
}

void TestPluginIndexBuilder::testBrokenConfigAbortsWholePass()
{
    QTemporaryDir tmp;
    writeFile(tmp.filePath("a-good/go.mod"));
    writeFile(tmp.filePath("b-broken/reckless.yaml"), "plugin: [\n");
    writeFile(tmp.filePath("c-good/go.mod"));

    QList<Plugin> plugins;
    Plugin previous;
    previous.name = "previous";
    previous.path = "/previous";
    plugins.append(previous);

    rkl::IndexError error;
    QVERIFY(!PluginIndexBuilder().index(tmp.path(), plugins, &error));
    QCOMPARE(error.kind, rkl::IndexError::ConfigParseError);
    QVERIFY(error.path.contains("b-broken"));

    // No partial index
    QCOMPARE(pluginNames(plugins), QStringList({"previous"}));
}

void TestPluginIndexBuilder::testIdempotent()
{
    QTemporaryDir tmp;
    writeFile(tmp.filePath("one/package.json"));
    writeFile(tmp.filePath("two/cargo.toml"));
    writeFile(tmp.filePath("two/reckless.yaml"), "plugin:\n  name: two\n");

    PluginIndexBuilder builder;
    QList<Plugin> first;
    QList<Plugin> second;
    QVERIFY(builder.index(tmp.path(), first));
    QVERIFY(builder.index(tmp.path(), second));

    QCOMPARE(first.size(), second.size());
    for (int i = 0; i < first.size(); ++i) {
        QCOMPARE(first[i].name, second[i].name);
        QCOMPARE(first[i].path, second[i].path);
        QCOMPARE(first[i].language, second[i].language);
        QCOMPARE(first[i].hasConfig(), second[i].hasConfig());
        QCOMPARE(first[i].config.name(), second[i].config.name());
    }
}

void TestPluginIndexBuilder::testDetectedLanguageWinsByDefault()
{
    QTemporaryDir tmp;
    writeFile(tmp.filePath("plugin/go.mod"));
    writeFile(tmp.filePath("plugin/reckless.yaml"), "plugin:\n  lang: python\n");

    PluginIndexBuilder builder;
    QCOMPARE(builder.languagePolicy(), LanguagePolicy::PreferDetected);

    QList<Plugin> plugins;
    QVERIFY(builder.index(tmp.path(), plugins));
    QCOMPARE(plugins[0].language, PluginLanguage::Go);
    QCOMPARE(plugins[0].config.language(), PluginLanguage::Python);
}

void TestPluginIndexBuilder::testPreferConfigPolicy()
{
    QTemporaryDir tmp;
    writeFile(tmp.filePath("declared/go.mod"));
    writeFile(tmp.filePath("declared/reckless.yaml"), "plugin:\n  lang: python\n");
    writeFile(tmp.filePath("undeclared/go.mod"));
    writeFile(tmp.filePath("unconfigured/cargo.toml"));
    writeFile(tmp.filePath("undeclared/reckless.yaml"), "plugin:\n  name: undeclared\n");

    PluginIndexBuilder builder;
    builder.setLanguagePolicy(LanguagePolicy::PreferConfig);

    QList<Plugin> plugins;
    QVERIFY(builder.index(tmp.path(), plugins));
    QCOMPARE(pluginNames(plugins), QStringList({"declared", "unconfigured", "undeclared"}));
    QCOMPARE(plugins[0].language, PluginLanguage::Python);
    QCOMPARE(plugins[1].language, PluginLanguage::Rust);
    QCOMPARE(plugins[2].language, PluginLanguage::Go);
}

void TestPluginIndexBuilder::testPreferConfigFallsBackOnUnknownLang()
{
    QTemporaryDir tmp;
    writeFile(tmp.filePath("plugin/package.json"));
    writeFile(tmp.filePath("plugin/reckless.yaml"), "plugin:\n  lang: cobol\n");

    PluginIndexBuilder builder;
    builder.setLanguagePolicy(LanguagePolicy::PreferConfig);

    QList<Plugin> plugins;
    QVERIFY(builder.index(tmp.path(), plugins));
    QCOMPARE(plugins[0].language, PluginLanguage::JavaScript);
}

void TestPluginIndexBuilder::testPolicyNames()
{
    bool ok = false;
    QCOMPARE(rkl::languagePolicyFromString("config", &ok), LanguagePolicy::PreferConfig);
    QVERIFY(ok);
    QCOMPARE(rkl::languagePolicyFromString(" Detected ", &ok), LanguagePolicy::PreferDetected);
    QVERIFY(ok);
    QCOMPARE(rkl::languagePolicyFromString("bogus", &ok), LanguagePolicy::PreferDetected);
    QVERIFY(!ok);
    QCOMPARE(rkl::languagePolicyName(LanguagePolicy::PreferConfig), QString("config"));
}

void TestPluginIndexBuilder::testStaticFixture()
{
    QList<Plugin> plugins;
    QVERIFY(PluginIndexBuilder().index(QString(TEST_DATA_DIR) + "/config_repo", plugins));
    QCOMPARE(pluginNames(plugins), QStringList({"alpha", "beta"}));
    QCOMPARE(plugins[0].language, PluginLanguage::Python);
    QVERIFY(plugins[0].hasConfig());
    QCOMPARE(plugins[0].config.name(), QString("alpha"));
    QCOMPARE(plugins[1].language, PluginLanguage::Go);
    QVERIFY(!plugins[1].hasConfig());
}

QTEST_MAIN(TestPluginIndexBuilder)
#include "test_plugin_index_builder.moc"
