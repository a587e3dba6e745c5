#pragma once

#include <QCoreApplication>
#include <QElapsedTimer>
#include <QEventLoop>
#include <QTimer>

namespace pp::core::test {

// Runs the event loop for ms milliseconds.
inline void waitMs(int ms) {
    QEventLoop loop;
    QTimer::singleShot(ms, &loop, &QEventLoop::quit);
    loop.exec();
}

// Spins the event loop until pred() holds or timeoutMs elapses.
template <typename Pred>
bool waitUntil(Pred pred, int timeoutMs = 2000) {
    QElapsedTimer timer;
    timer.start();
    while (!pred()) {
        if (timer.elapsed() > timeoutMs) {
            return false;
        }
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
        waitMs(1);
    }
    return true;
}

} // namespace pp::core::test
