#include <QtTest/QtTest>

#include "parking/data/Space.hpp"

using namespace parking::data;

class SpaceTest : public QObject
{
    Q_OBJECT

private slots:
    void typeNamesParseBack();
    void parsesLooseTypeNames();
};

void SpaceTest::typeNamesParseBack()
{
    const SpaceType types[] = {SpaceType::Regular, SpaceType::Visitor, SpaceType::Handicapped, SpaceType::Authorized};
    for (const SpaceType type : types) {
        QCOMPARE(spaceTypeFromString(spaceTypeToString(type)), type);
    }
    QCOMPARE(spaceTypeToString(SpaceType::Authorized), QStringLiteral("authorized personnel"));
}

void SpaceTest::parsesLooseTypeNames()
{
    QCOMPARE(spaceTypeFromString(QStringLiteral("Authorized")), SpaceType::Authorized);
    QCOMPARE(spaceTypeFromString(QStringLiteral("AUTHORIZED PERSONNEL")), SpaceType::Authorized);
    QCOMPARE(spaceTypeFromString(QStringLiteral(" VISITOR ")), SpaceType::Visitor);
    QCOMPARE(spaceTypeFromString(QStringLiteral("garbage")), SpaceType::Regular);
    QCOMPARE(spaceTypeFromString(QString()), SpaceType::Regular);
}

QTEST_GUILESS_MAIN(SpaceTest)
#include "SpaceTest.moc"
