#include <QtTest>
#include "core/plugin/PluginLanguage.hpp"

using rkl::PluginLanguage;

Q_DECLARE_METATYPE(rkl::PluginLanguage)

class TestPluginLanguage : public QObject {
    Q_OBJECT
private slots:
    void testMarkerTable_data();
    void testMarkerTable();
    void testMarkerMatchIsExact();
    void testMarkerFileNamesOrder();
    void testLanguageNames();
    void testLanguageFromString();
};

void TestPluginLanguage::testMarkerTable_data()
{
    QTest::addColumn<QString>("fileName");
    QTest::addColumn<PluginLanguage>("language");

    QTest::newRow("python") << "requirements.txt" << PluginLanguage::Python;
    QTest::newRow("go") << "go.mod" << PluginLanguage::Go;
    QTest::newRow("rust") << "cargo.toml" << PluginLanguage::Rust;
    QTest::newRow("dart") << "pubspec.yaml" << PluginLanguage::Dart;
    QTest::newRow("javascript") << "package.json" << PluginLanguage::JavaScript;
    QTest::newRow("typescript") << "tsconfig.json" << PluginLanguage::TypeScript;
    QTest::newRow("readme") << "README.md" << PluginLanguage::Unknown;
}

void TestPluginLanguage::testMarkerTable()
{
    QFETCH(QString, fileName);
    QFETCH(PluginLanguage, language);
    QCOMPARE(rkl::markerLanguage(fileName), language);
}

void TestPluginLanguage::testMarkerMatchIsExact()
{
    // Case and surrounding text matter
    QCOMPARE(rkl::markerLanguage("Cargo.toml"), PluginLanguage::Unknown);
    QCOMPARE(rkl::markerLanguage("GO.MOD"), PluginLanguage::Unknown);
    QCOMPARE(rkl::markerLanguage("go.mod.bak"), PluginLanguage::Unknown);
    QCOMPARE(rkl::markerLanguage("dev-requirements.txt"), PluginLanguage::Unknown);
    QCOMPARE(rkl::markerLanguage(""), PluginLanguage::Unknown);
}

void TestPluginLanguage::testMarkerFileNamesOrder()
{
    const QStringList names = rkl::markerFileNames();
    QCOMPARE(names.size(), 6);
    QCOMPARE(names.first(), QString("requirements.txt"));
    QCOMPARE(names.last(), QString("tsconfig.json"));
    for (const auto& name : names)
        QVERIFY(rkl::markerLanguage(name) != PluginLanguage::Unknown);
}

void TestPluginLanguage::testLanguageNames()
{
    QCOMPARE(rkl::languageName(PluginLanguage::Python), QString("python"));
    QCOMPARE(rkl::languageName(PluginLanguage::JavaScript), QString("javascript"));
    QCOMPARE(rkl::languageName(PluginLanguage::Unknown), QString("unknown"));
}

void TestPluginLanguage::testLanguageFromString()
{
    QCOMPARE(rkl::languageFromString("python"), PluginLanguage::Python);
    QCOMPARE(rkl::languageFromString(" Py "), PluginLanguage::Python);
    QCOMPARE(rkl::languageFromString("golang"), PluginLanguage::Go);
    QCOMPARE(rkl::languageFromString("RS"), PluginLanguage::Rust);
    QCOMPARE(rkl::languageFromString("node"), PluginLanguage::JavaScript);
    QCOMPARE(rkl::languageFromString("ts"), PluginLanguage::TypeScript);
    QCOMPARE(rkl::languageFromString("dart"), PluginLanguage::Dart);
    QCOMPARE(rkl::languageFromString("java"), PluginLanguage::Unknown);
    QCOMPARE(rkl::languageFromString(""), PluginLanguage::Unknown);

    // Every canonical name parses back
    for (auto lang : {PluginLanguage::Python, PluginLanguage::Go, PluginLanguage::Rust,
                      PluginLanguage::Dart, PluginLanguage::JavaScript, PluginLanguage::TypeScript})
        QCOMPARE(rkl::languageFromString(rkl::languageName(lang)), lang);
}

QTEST_MAIN(TestPluginLanguage)
#include "test_plugin_language.moc"
