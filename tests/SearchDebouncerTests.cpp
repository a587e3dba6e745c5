#include <gtest/gtest.h>

#include <QStringList>

#include "app/SearchDebouncer.hpp"
#include "support/EventLoop.hpp"

using namespace pp::core;

namespace {

constexpr std::chrono::milliseconds kQuiet{40};

} // namespace

TEST(SearchDebouncer, RapidInputCommitsOnlyTheLastValue) {
    app::SearchDebouncer debouncer(kQuiet);
    QStringList commits;
    QObject::connect(&debouncer, &app::SearchDebouncer::queryCommitted,
                     [&commits](const QString& q) { commits << q; });

    debouncer.input("a");
    debouncer.input("ab");
    debouncer.input("ABC ");
    EXPECT_TRUE(commits.isEmpty());
    EXPECT_TRUE(debouncer.hasPendingCommit());

    ASSERT_TRUE(test::waitUntil([&]() { return !commits.isEmpty(); }));
    test::waitMs(2 * static_cast<int>(kQuiet.count()));

    EXPECT_EQ(commits, QStringList{QStringLiteral("abc")});
    EXPECT_EQ(debouncer.committedQuery(), "abc");
    EXPECT_FALSE(debouncer.hasPendingCommit());
}

TEST(SearchDebouncer, ClearingCommitsImmediately) {
    app::SearchDebouncer debouncer(kQuiet);
    QStringList commits;
    QObject::connect(&debouncer, &app::SearchDebouncer::queryCommitted,
                     [&commits](const QString& q) { commits << q; });

    debouncer.input("halo");
    ASSERT_TRUE(test::waitUntil([&]() { return debouncer.committedQuery() == "halo"; }));

    debouncer.input("   ");

    EXPECT_EQ(commits, (QStringList{QStringLiteral("halo"), QString()}));
    EXPECT_EQ(debouncer.committedQuery(), "");
    EXPECT_FALSE(debouncer.hasPendingCommit());
}

TEST(SearchDebouncer, ClearingCancelsPendingCommit) {
    app::SearchDebouncer debouncer(kQuiet);
    QStringList commits;
    QObject::connect(&debouncer, &app::SearchDebouncer::queryCommitted,
                     [&commits](const QString& q) { commits << q; });

    debouncer.input("hal");
    debouncer.input("");
    test::waitMs(2 * static_cast<int>(kQuiet.count()));

    // Committed query was already empty, so nothing is emitted at all.
    EXPECT_TRUE(commits.isEmpty());
    EXPECT_EQ(debouncer.committedQuery(), "");
}

TEST(SearchDebouncer, SameQueryIsNotCommittedTwice) {
    app::SearchDebouncer debouncer(kQuiet);
    int commits = 0;
    QObject::connect(&debouncer, &app::SearchDebouncer::queryCommitted,
                     [&commits](const QString&) { ++commits; });

    debouncer.input("doom");
    ASSERT_TRUE(test::waitUntil([&]() { return commits == 1; }));
    debouncer.input(" DOOM");
    test::waitMs(2 * static_cast<int>(kQuiet.count()));

    EXPECT_EQ(commits, 1);
}

TEST(SearchDebouncer, DefaultQuietPeriod) {
    EXPECT_EQ(app::SearchDebouncer::kDefaultQuietPeriod.count(), 220);
}
