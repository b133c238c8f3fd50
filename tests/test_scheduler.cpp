#include "backup_daemon.hpp"
#include <ctime>
#include <gtest/gtest.h>
#include <stdexcept>

namespace {

std::chrono::system_clock::time_point localTime(int year, int month, int day, int hour, int minute, int second) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

std::tm toLocal(std::chrono::system_clock::time_point time) {
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

void expectLocal(std::chrono::system_clock::time_point time, int year, int month, int day, int hour, int minute) {
    std::tm tm = toLocal(time);
    EXPECT_EQ(tm.tm_year + 1900, year);
    EXPECT_EQ(tm.tm_mon + 1, month);
    EXPECT_EQ(tm.tm_mday, day);
    EXPECT_EQ(tm.tm_hour, hour);
    EXPECT_EQ(tm.tm_min, minute);
    EXPECT_EQ(tm.tm_sec, 0);
}

const ScheduleConfig kSchedule{"02:00:00", "03:00:00", "sunday"};

} // namespace

// 2024-03-05 is a Tuesday; 2024-03-10 is a Sunday.

TEST(NextRunTimeTest, NightlyLaterTodayWhenTriggerAhead) {
    expectLocal(nextRunTime(kSchedule, BackupKind::Nightly, localTime(2024, 3, 5, 1, 0, 0)), 2024, 3, 5, 2, 0);
}

TEST(NextRunTimeTest, NightlyTomorrowWhenTriggerPassedOrDue) {
    expectLocal(nextRunTime(kSchedule, BackupKind::Nightly, localTime(2024, 3, 5, 2, 0, 0)), 2024, 3, 6, 2, 0);
    expectLocal(nextRunTime(kSchedule, BackupKind::Nightly, localTime(2024, 3, 5, 23, 30, 0)), 2024, 3, 6, 2, 0);
}

TEST(NextRunTimeTest, NightlyRollsOverMonthEnd) {
    expectLocal(nextRunTime(kSchedule, BackupKind::Nightly, localTime(2024, 2, 29, 12, 0, 0)), 2024, 3, 1, 2, 0);
}

TEST(NextRunTimeTest, WeeklyOnConfiguredDay) {
    expectLocal(nextRunTime(kSchedule, BackupKind::Weekly, localTime(2024, 3, 5, 12, 0, 0)), 2024, 3, 10, 3, 0);
    expectLocal(nextRunTime(kSchedule, BackupKind::Weekly, localTime(2024, 3, 10, 2, 0, 0)), 2024, 3, 10, 3, 0);
    expectLocal(nextRunTime(kSchedule, BackupKind::Weekly, localTime(2024, 3, 10, 3, 0, 0)), 2024, 3, 17, 3, 0);
}

TEST(NextRunTimeTest, NextRunIsStrictlyAfterNow) {
    auto now = localTime(2024, 3, 10, 3, 0, 0);
    for (BackupKind kind : kAllBackupKinds) {
        EXPECT_GT(nextRunTime(kSchedule, kind, now), now);
    }
}

TEST(NextRunTimeTest, InvalidScheduleThrows) {
    auto now = localTime(2024, 3, 5, 12, 0, 0);
    EXPECT_THROW(nextRunTime(ScheduleConfig{"2am", "03:00:00", "sunday"}, BackupKind::Nightly, now),
                 std::runtime_error);
    EXPECT_THROW(nextRunTime(ScheduleConfig{"02:00:00", "03:00:00", "caturday"}, BackupKind::Weekly, now),
                 std::runtime_error);
}
