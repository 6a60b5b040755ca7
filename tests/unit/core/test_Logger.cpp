#include <QtTest>
#include "core/Logger.hpp"

class TestLogger : public QObject {
    Q_OBJECT

private slots:
    void initTestCase() {
        babel::Logger::shutdown();
    }

    void testInitialization() {
        babel::Logger::init("babel-test", true);
        QVERIFY(babel::Logger::get() != nullptr);
        QCOMPARE(babel::Logger::get()->level(), spdlog::level::debug);

        LOG_INFO("Test info message");
        LOG_WARN("Test warn message");
        LOG_ERROR("Test error message");

        babel::Logger::shutdown();
    }

    void testDoubleInit() {
        babel::Logger::init("babel-test", false);
        babel::Logger::init("babel-test", false);
        QVERIFY(babel::Logger::get() != nullptr);
        babel::Logger::shutdown();
    }

    void testSetDebugTogglesLevel() {
        babel::Logger::init("babel-test", false);
        QCOMPARE(babel::Logger::get()->level(), spdlog::level::info);

        babel::Logger::setDebug(true);
        QCOMPARE(babel::Logger::get()->level(), spdlog::level::debug);

        babel::Logger::setDebug(false);
        QCOMPARE(babel::Logger::get()->level(), spdlog::level::info);
        babel::Logger::shutdown();
    }

    void testGetInitializesLazily() {
        babel::Logger::shutdown();
        QVERIFY(babel::Logger::get() != nullptr);
        babel::Logger::shutdown();
    }
};

int runTestLogger(int argc, char** argv) {
    TestLogger tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_Logger.moc"
