#include <QtTest/QtTest>

#include "supervisor/state_machine.hpp"

using syncwarden::SupervisorState;
using syncwarden::TransitionOutcome;

Q_DECLARE_METATYPE(syncwarden::TransitionOutcome)

class StateMachineTests : public QObject
{
    Q_OBJECT
private slots:
    void testTransition_data();
    void testTransition();
    void testStoppedNeverReachesRunningDirectly();
    void testSameStateIgnored();
};

void StateMachineTests::testTransition_data()
{
    QTest::addColumn<SupervisorState>("current");
    QTest::addColumn<SupervisorState>("requested");
    QTest::addColumn<TransitionOutcome>("expected");

    QTest::newRow("stopped-starting") << SupervisorState::Stopped << SupervisorState::Starting << TransitionOutcome::Apply;
    QTest::newRow("starting-running") << SupervisorState::Starting << SupervisorState::Running << TransitionOutcome::Apply;
    QTest::newRow("starting-stopped") << SupervisorState::Starting << SupervisorState::Stopped << TransitionOutcome::ApplyAndAbort;
    QTest::newRow("starting-restarting") << SupervisorState::Starting << SupervisorState::Restarting << TransitionOutcome::Apply;
    QTest::newRow("running-stopping") << SupervisorState::Running << SupervisorState::Stopping << TransitionOutcome::ApplyAndAbort;
    QTest::newRow("running-stopped") << SupervisorState::Running << SupervisorState::Stopped << TransitionOutcome::ApplyAndAbort;
    QTest::newRow("running-restarting") << SupervisorState::Running << SupervisorState::Restarting << TransitionOutcome::ApplyAndAbort;
    QTest::newRow("running-starting") << SupervisorState::Running << SupervisorState::Starting << TransitionOutcome::ApplyAndAbort;
    QTest::newRow("stopping-stopped") << SupervisorState::Stopping << SupervisorState::Stopped << TransitionOutcome::Apply;
    QTest::newRow("restarting-starting") << SupervisorState::Restarting << SupervisorState::Starting << TransitionOutcome::Apply;
    QTest::newRow("restarting-stopped") << SupervisorState::Restarting << SupervisorState::Stopped << TransitionOutcome::Apply;
}

void StateMachineTests::testTransition()
{
    QFETCH(SupervisorState, current);
    QFETCH(SupervisorState, requested);
    QFETCH(TransitionOutcome, expected);

    QCOMPARE(syncwarden::evaluateTransition(current, requested), expected);
}

void StateMachineTests::testStoppedNeverReachesRunningDirectly()
{
    QCOMPARE(syncwarden::evaluateTransition(SupervisorState::Stopped, SupervisorState::Running),
             TransitionOutcome::Ignore);

    // Replay every request sequence of length three starting from Stopped;
    // a Running request seen while Stopped must never take effect.
    const SupervisorState all[] = {SupervisorState::Stopped, SupervisorState::Starting,
                                   SupervisorState::Running, SupervisorState::Stopping,
                                   SupervisorState::Restarting};
    for (SupervisorState a : all) {
        for (SupervisorState b : all) {
            for (SupervisorState c : all) {
                SupervisorState state = SupervisorState::Stopped;
                for (SupervisorState requested : {a, b, c}) {
                    const SupervisorState before = state;
                    if (syncwarden::evaluateTransition(state, requested) != TransitionOutcome::Ignore) {
                        state = requested;
                    }
                    if (before == SupervisorState::Stopped && requested == SupervisorState::Running) {
                        QCOMPARE(state, SupervisorState::Stopped);
                    }
                }
            }
        }
    }
}

void StateMachineTests::testSameStateIgnored()
{
    for (SupervisorState state : {SupervisorState::Stopped, SupervisorState::Starting,
                                  SupervisorState::Running, SupervisorState::Stopping,
                                  SupervisorState::Restarting}) {
        QCOMPARE(syncwarden::evaluateTransition(state, state), TransitionOutcome::Ignore);
    }
}

QTEST_MAIN(StateMachineTests)
#include "test_state_machine.moc"
