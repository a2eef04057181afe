/*
 * jobmgr - Local Background Job Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include <set>
#include <thread>
#include <vector>

#include "jobmgr/daemon_lock.hpp"
#include "jobmgr/job_store.hpp"
#include "test_support.hpp"

using namespace jobmgr;
using jobmgr::testing::TempHome;
using jobmgr::testing::deadPid;
using jobmgr::testing::readFile;
using jobmgr::testing::writeFile;

namespace {

std::vector<Status> statuses(const JobStore& store) {
    std::vector<Status> result;
    ListResult listed = store.list();
    EXPECT_TRUE(listed.ok) << listed.message;
    for (const auto& job : listed.jobs) {
        result.push_back(job.status);
    }
    return result;
}

}

TEST(JobStoreTest, AddAssignsSequentialIds) {
    TempHome home;
    JobStore store(home.path());

    AddResult first = store.add("echo one", home.path());
    AddResult second = store.add("echo two", home.path());
    ASSERT_TRUE(first.ok) << first.message;
    ASSERT_TRUE(second.ok) << second.message;
    EXPECT_EQ(first.id, 1u);
    EXPECT_EQ(second.id, 2u);
    EXPECT_NE(first.uid, second.uid);

    ListResult listed = store.list();
    ASSERT_TRUE(listed.ok);
    ASSERT_EQ(listed.jobs.size(), 2u);
    EXPECT_EQ(listed.jobs[0].command, "echo one");
    EXPECT_EQ(listed.jobs[0].status, Status::Pending);
    EXPECT_EQ(listed.jobs[0].workdir, home.path());
    EXPECT_FALSE(listed.jobs[0].pid.has_value());
    EXPECT_EQ(listed.jobs[1].id, 2u);
}

TEST(JobStoreTest, ListOnEmptyStoreIsEmpty) {
    TempHome home;
    JobStore store(home.path());

    ListResult listed = store.list();
    ASSERT_TRUE(listed.ok);
    EXPECT_TRUE(listed.jobs.empty());
}

TEST(JobStoreTest, ListDoesNotModifyFiles) {
    TempHome home;
    JobStore store(home.path());
    ASSERT_TRUE(store.add("echo hi", home.path()).ok);

    std::string jobsBefore = readFile(home.path() / "jobs.txt");
    std::string statusBefore = readFile(home.path() / "status.txt");
    ASSERT_TRUE(store.list().ok);
    ASSERT_TRUE(store.list().ok);
    EXPECT_EQ(readFile(home.path() / "jobs.txt"), jobsBefore);
    EXPECT_EQ(readFile(home.path() / "status.txt"), statusBefore);
}

TEST(JobStoreTest, RejectsInvalidCommands) {
    TempHome home;
    JobStore store(home.path());

    EXPECT_EQ(store.add("", home.path()).error, JobError::InvalidContent);
    EXPECT_EQ(store.add("echo a\necho b", home.path()).error, JobError::InvalidContent);
    EXPECT_EQ(store.add(std::string("echo ") + JobStore::kFieldDelimiter, home.path()).error,
              JobError::InvalidContent);
    EXPECT_EQ(store.add("echo hi", "relative/dir").error, JobError::InvalidContent);

    EXPECT_TRUE(store.list().jobs.empty());
}

TEST(JobStoreTest, StoredStatusLinesUseCanonicalNames) {
    TempHome home;
    JobStore store(home.path());
    AddResult added = store.add("echo hi", home.path());
    ASSERT_TRUE(added.ok);

    EXPECT_EQ(readFile(home.path() / "status.txt"), "PENDING\n");
    ASSERT_TRUE(store.claim(added.uid).ok);
    ASSERT_TRUE(store.bindPid(added.uid, 4242).ok);
    EXPECT_EQ(readFile(home.path() / "status.txt"), "RUNNING 4242\n");
    ASSERT_TRUE(store.updateStatus(1, Status::Completed).ok);
    EXPECT_EQ(readFile(home.path() / "status.txt"), "COMPLETED\n");
}

TEST(JobStoreTest, DeleteShiftsLaterIdsButKeepsUids) {
    TempHome home;
    JobStore store(home.path());
    ASSERT_TRUE(store.add("echo a", home.path()).ok);
    AddResult b = store.add("echo b", home.path());
    AddResult c = store.add("echo c", home.path());
    ASSERT_TRUE(b.ok && c.ok);

    ASSERT_TRUE(store.remove(1).ok);

    ListResult listed = store.list();
    ASSERT_EQ(listed.jobs.size(), 2u);
    EXPECT_EQ(listed.jobs[0].id, 1u);
    EXPECT_EQ(listed.jobs[0].command, "echo b");
    EXPECT_EQ(listed.jobs[0].uid, b.uid);
    EXPECT_EQ(listed.jobs[1].id, 2u);
    EXPECT_EQ(listed.jobs[1].uid, c.uid);
}

TEST(JobStoreTest, DeleteOutOfRangeLeavesStoreUntouched) {
    TempHome home;
    JobStore store(home.path());
    ASSERT_TRUE(store.add("echo a", home.path()).ok);

    std::string jobsBefore = readFile(home.path() / "jobs.txt");
    std::string statusBefore = readFile(home.path() / "status.txt");

    EXPECT_EQ(store.remove(0).error, JobError::NotFound);
    EXPECT_EQ(store.remove(2).error, JobError::NotFound);
    EXPECT_EQ(readFile(home.path() / "jobs.txt"), jobsBefore);
    EXPECT_EQ(readFile(home.path() / "status.txt"), statusBefore);
}

TEST(JobStoreTest, DeleteRemovesOutput) {
    TempHome home;
    JobStore store(home.path());
    AddResult added = store.add("echo a", home.path());
    ASSERT_TRUE(added.ok);
    ASSERT_TRUE(store.outputs().write(added.uid, "a\n", "").ok);

    ASSERT_TRUE(store.remove(1).ok);
    EXPECT_FALSE(store.outputs().exists(added.uid));
}

TEST(JobStoreTest, UidsAreNeverReused) {
    TempHome home;
    std::set<JobUid> seen;
    {
        JobStore store(home.path());
        for (int i = 0; i < 3; ++i) {
            AddResult added = store.add("echo " + std::to_string(i), home.path());
            ASSERT_TRUE(added.ok);
            seen.insert(added.uid);
        }
        ASSERT_TRUE(store.remove(3).ok);
        ASSERT_TRUE(store.removeAll().ok);
    }

    JobStore reopened(home.path());
    AddResult again = reopened.add("echo again", home.path());
    ASSERT_TRUE(again.ok);
    EXPECT_EQ(again.id, 1u);
    EXPECT_EQ(seen.count(again.uid), 0u);
}

TEST(JobStoreTest, TransitionsOnlyMoveForward) {
    TempHome home;
    JobStore store(home.path());
    AddResult added = store.add("echo hi", home.path());
    ASSERT_TRUE(added.ok);

    EXPECT_EQ(store.updateStatus(1, Status::Paused).error, JobError::InvalidTransition);
    ASSERT_TRUE(store.updateStatus(1, Status::Running).ok);
    ASSERT_TRUE(store.updateStatus(1, Status::Paused).ok);
    ASSERT_TRUE(store.updateStatus(1, Status::Running).ok);
    ASSERT_TRUE(store.updateStatus(1, Status::Completed).ok);

    EXPECT_EQ(store.updateStatus(1, Status::Running).error, JobError::InvalidTransition);
    EXPECT_EQ(store.updateStatus(1, Status::Pending).error, JobError::InvalidTransition);
    EXPECT_EQ(store.updateStatus(1, Status::Error).error, JobError::InvalidTransition);
    EXPECT_EQ(statuses(store), std::vector<Status>{Status::Completed});
}

TEST(JobStoreTest, UpdateUnknownIdIsNotFound) {
    TempHome home;
    JobStore store(home.path());
    EXPECT_EQ(store.updateStatus(1, Status::Running).error, JobError::NotFound);
    EXPECT_EQ(store.updateStatusByUid(99, Status::Running).error, JobError::NotFound);
}

TEST(JobStoreTest, ClaimSucceedsOnlyOnce) {
    TempHome home;
    JobStore store(home.path());
    AddResult added = store.add("echo hi", home.path());
    ASSERT_TRUE(added.ok);

    EXPECT_TRUE(store.claim(added.uid).ok);
    LookupResult second = store.claim(added.uid);
    EXPECT_FALSE(second.ok);
    EXPECT_EQ(second.error, JobError::InvalidTransition);
    EXPECT_EQ(store.claim(added.uid + 100).error, JobError::NotFound);
}

TEST(JobStoreTest, ClaimReturnsClaimedRecord) {
    TempHome home;
    JobStore store(home.path());
    ASSERT_TRUE(store.add("echo first", home.path()).ok);
    AddResult added = store.add("echo second", home.path() / "sub");
    ASSERT_TRUE(added.ok);

    LookupResult claimed = store.claim(added.uid);
    ASSERT_TRUE(claimed.ok) << claimed.message;
    EXPECT_EQ(claimed.job.id, 2u);
    EXPECT_EQ(claimed.job.uid, added.uid);
    EXPECT_EQ(claimed.job.command, "echo second");
    EXPECT_EQ(claimed.job.workdir, home.path() / "sub");
    EXPECT_EQ(claimed.job.status, Status::Running);
    EXPECT_FALSE(claimed.job.pid.has_value());

    LookupResult stored = store.getByUid(added.uid);
    ASSERT_TRUE(stored.ok);
    EXPECT_EQ(stored.job.id, 2u);
    EXPECT_EQ(stored.job.status, Status::Running);
    EXPECT_EQ(store.getByUid(added.uid + 100).error, JobError::NotFound);
}

TEST(JobStoreTest, PidIsClearedOnTerminalStatus) {
    TempHome home;
    JobStore store(home.path());
    AddResult added = store.add("echo hi", home.path());
    ASSERT_TRUE(added.ok);

    EXPECT_EQ(store.bindPid(added.uid, 1234).error, JobError::InvalidTransition);
    ASSERT_TRUE(store.claim(added.uid).ok);
    ASSERT_TRUE(store.bindPid(added.uid, 1234).ok);
    LookupResult running = store.get(1);
    ASSERT_TRUE(running.ok);
    ASSERT_TRUE(running.job.pid.has_value());
    EXPECT_EQ(*running.job.pid, 1234);

    ASSERT_TRUE(store.updateStatusByUid(added.uid, Status::Error).ok);
    LookupResult finished = store.get(1);
    ASSERT_TRUE(finished.ok);
    EXPECT_FALSE(finished.job.pid.has_value());
}

TEST(JobStoreTest, SignalLiveStoresStatusOnlyWhenDelivered) {
    TempHome home;
    JobStore store(home.path());
    AddResult added = store.add("sleep 1", home.path());
    ASSERT_TRUE(added.ok);

    int calls = 0;
    auto ok = [&](pid_t) { ++calls; return Result::success(); };
    auto fail = [&](pid_t) { ++calls; return Result::failure(JobError::SignalFailed, "nope"); };

    EXPECT_EQ(store.signalLive(1, Status::Paused, ok).error, JobError::NotFound);
    ASSERT_TRUE(store.claim(added.uid).ok);
    EXPECT_EQ(store.signalLive(1, Status::Paused, ok).error, JobError::NotFound);
    EXPECT_EQ(calls, 0);

    ASSERT_TRUE(store.bindPid(added.uid, 4242).ok);
    EXPECT_EQ(store.signalLive(1, Status::Paused, fail).error, JobError::SignalFailed);
    EXPECT_EQ(statuses(store), std::vector<Status>{Status::Running});

    EXPECT_TRUE(store.signalLive(1, Status::Paused, ok).ok);
    EXPECT_EQ(statuses(store), std::vector<Status>{Status::Paused});
    EXPECT_EQ(calls, 2);
}

TEST(JobStoreTest, UnknownStatusIsCorrupt) {
    TempHome home;
    JobStore store(home.path());
    ASSERT_TRUE(store.add("echo hi", home.path()).ok);
    writeFile(home.path() / "status.txt", "FINISHED\n");

    ListResult listed = store.list();
    EXPECT_FALSE(listed.ok);
    EXPECT_EQ(listed.error, JobError::Corrupt);
    EXPECT_EQ(store.add("echo more", home.path()).error, JobError::Corrupt);
    EXPECT_EQ(readFile(home.path() / "status.txt"), "FINISHED\n");
}

TEST(JobStoreTest, LengthMismatchIsCorrupt) {
    TempHome home;
    JobStore store(home.path());
    ASSERT_TRUE(store.add("echo a", home.path()).ok);
    ASSERT_TRUE(store.add("echo b", home.path()).ok);
    writeFile(home.path() / "status.txt", "PENDING\n");

    EXPECT_EQ(store.list().error, JobError::Corrupt);
    EXPECT_EQ(store.get(1).error, JobError::Corrupt);
    EXPECT_EQ(store.remove(1).error, JobError::Corrupt);
}

TEST(JobStoreTest, PidOnFinishedJobIsCorrupt) {
    TempHome home;
    JobStore store(home.path());
    ASSERT_TRUE(store.add("echo a", home.path()).ok);
    writeFile(home.path() / "status.txt", "COMPLETED 123\n");

    EXPECT_EQ(store.list().error, JobError::Corrupt);
}

TEST(JobStoreTest, CleanRefusedWhileJobRunningOrPaused) {
    TempHome home;
    JobStore store(home.path());
    AddResult done = store.add("echo done", home.path());
    AddResult added = store.add("sleep 5", home.path());
    ASSERT_TRUE(done.ok && added.ok);
    ASSERT_TRUE(store.claim(done.uid).ok);
    ASSERT_TRUE(store.updateStatusByUid(done.uid, Status::Completed).ok);
    ASSERT_TRUE(store.outputs().write(done.uid, "done\n", "").ok);
    ASSERT_TRUE(store.claim(added.uid).ok);

    const std::string jobsBefore = readFile(home.path() / "jobs.txt");
    const std::string outputBefore = readFile(store.outputs().pathFor(done.uid));

    std::string statusBefore = readFile(home.path() / "status.txt");
    EXPECT_EQ(store.removeAll().error, JobError::Busy);
    EXPECT_EQ(readFile(home.path() / "jobs.txt"), jobsBefore);
    EXPECT_EQ(readFile(home.path() / "status.txt"), statusBefore);
    EXPECT_EQ(readFile(store.outputs().pathFor(done.uid)), outputBefore);

    ASSERT_TRUE(store.updateStatus(2, Status::Paused).ok);
    statusBefore = readFile(home.path() / "status.txt");
    EXPECT_EQ(store.removeAll().error, JobError::Busy);
    EXPECT_EQ(readFile(home.path() / "jobs.txt"), jobsBefore);
    EXPECT_EQ(readFile(home.path() / "status.txt"), statusBefore);
    EXPECT_EQ(readFile(store.outputs().pathFor(done.uid)), outputBefore);
    EXPECT_EQ(store.list().jobs.size(), 2u);
}

TEST(JobStoreTest, CleanRefusedWhileDaemonLockIsLive) {
    TempHome home;
    JobStore store(home.path());
    AddResult added = store.add("echo a", home.path());
    ASSERT_TRUE(added.ok);
    ASSERT_TRUE(store.outputs().write(added.uid, "a\n", "").ok);

    const std::string jobsBefore = readFile(home.path() / "jobs.txt");
    const std::string statusBefore = readFile(home.path() / "status.txt");

    DaemonLock lock(home.path());
    ASSERT_TRUE(lock.acquire(::getpid()).ok);
    EXPECT_EQ(store.removeAll().error, JobError::Busy);
    EXPECT_TRUE(lock.release(::getpid()));

    EXPECT_EQ(readFile(home.path() / "jobs.txt"), jobsBefore);
    EXPECT_EQ(readFile(home.path() / "status.txt"), statusBefore);
    EXPECT_EQ(readFile(store.outputs().pathFor(added.uid)), "a\n");
}

TEST(JobStoreTest, CleanKeepsOutputWhenSaveFails) {
    TempHome home;
    JobStore store(home.path());
    AddResult added = store.add("echo a", home.path());
    ASSERT_TRUE(added.ok);
    ASSERT_TRUE(store.claim(added.uid).ok);
    ASSERT_TRUE(store.updateStatusByUid(added.uid, Status::Completed).ok);
    ASSERT_TRUE(store.outputs().write(added.uid, "a\n", "").ok);

    // The temp path is taken by a directory, so the new table cannot be written
    std::filesystem::create_directories(home.path() / "jobs.txt.tmp" / "blocker");

    Result cleaned = store.removeAll();
    EXPECT_FALSE(cleaned.ok);
    EXPECT_EQ(cleaned.error, JobError::IoError);
    EXPECT_EQ(store.list().jobs.size(), 1u);
    EXPECT_EQ(store.outputs().read(added.uid).text, "a\n");
}

TEST(JobStoreTest, FailedSaveLeavesNoTempFiles) {
    TempHome home;
    JobStore store(home.path());
    ASSERT_TRUE(store.add("echo a", home.path()).ok);

    const std::string jobsBefore = readFile(home.path() / "jobs.txt");
    const std::string statusBefore = readFile(home.path() / "status.txt");
    const std::string counterBefore = readFile(home.path() / "next_id");
    std::filesystem::create_directories(home.path() / "status.txt.tmp" / "blocker");

    EXPECT_EQ(store.add("echo b", home.path()).error, JobError::IoError);
    EXPECT_FALSE(std::filesystem::exists(home.path() / "jobs.txt.tmp"));
    EXPECT_FALSE(std::filesystem::exists(home.path() / "next_id.tmp"));
    EXPECT_FALSE(std::filesystem::exists(home.path() / "jobs.txt.prev"));
    EXPECT_EQ(readFile(home.path() / "jobs.txt"), jobsBefore);
    EXPECT_EQ(readFile(home.path() / "status.txt"), statusBefore);
    EXPECT_EQ(readFile(home.path() / "next_id"), counterBefore);

    std::filesystem::remove_all(home.path() / "status.txt.tmp");
    AddResult retried = store.add("echo b", home.path());
    ASSERT_TRUE(retried.ok) << retried.message;
    EXPECT_EQ(retried.id, 2u);
}

TEST(JobStoreTest, CleanIgnoresStaleDaemonLock) {
    TempHome home;
    JobStore store(home.path());
    ASSERT_TRUE(store.add("echo a", home.path()).ok);

    DaemonLock lock(home.path());
    ASSERT_TRUE(lock.acquire(deadPid()).ok);
    EXPECT_TRUE(store.removeAll().ok);
}

TEST(JobStoreTest, CleanRemovesJobsAndOutput) {
    TempHome home;
    JobStore store(home.path());
    AddResult a = store.add("echo a", home.path());
    AddResult b = store.add("echo b", home.path());
    ASSERT_TRUE(a.ok && b.ok);
    ASSERT_TRUE(store.claim(a.uid).ok);
    ASSERT_TRUE(store.updateStatusByUid(a.uid, Status::Completed).ok);
    ASSERT_TRUE(store.outputs().write(a.uid, "a\n", "").ok);

    ASSERT_TRUE(store.removeAll().ok);
    EXPECT_TRUE(store.list().jobs.empty());
    EXPECT_FALSE(store.outputs().exists(a.uid));
    EXPECT_EQ(readFile(home.path() / "jobs.txt"), "");
    EXPECT_EQ(readFile(home.path() / "status.txt"), "");
}

TEST(JobStoreTest, PruneKeepsUnfinishedJobs) {
    TempHome home;
    JobStore store(home.path());
    AddResult done = store.add("echo done", home.path());
    AddResult failed = store.add("exit 1", home.path());
    AddResult waiting = store.add("echo later", home.path());
    ASSERT_TRUE(done.ok && failed.ok && waiting.ok);

    ASSERT_TRUE(store.claim(done.uid).ok);
    ASSERT_TRUE(store.updateStatusByUid(done.uid, Status::Completed).ok);
    ASSERT_TRUE(store.updateStatusByUid(failed.uid, Status::Error).ok);
    ASSERT_TRUE(store.outputs().write(done.uid, "done\n", "").ok);

    ASSERT_TRUE(store.removeFinished().ok);
    ListResult listed = store.list();
    ASSERT_EQ(listed.jobs.size(), 1u);
    EXPECT_EQ(listed.jobs[0].uid, waiting.uid);
    EXPECT_EQ(listed.jobs[0].id, 1u);
    EXPECT_FALSE(store.outputs().exists(done.uid));
}

TEST(JobStoreTest, ConcurrentUpdatesAreNotLost) {
    TempHome home;
    JobStore store(home.path());
    constexpr int kJobs = 24;
    std::vector<JobUid> uids;
    for (int i = 0; i < kJobs; ++i) {
        AddResult added = store.add("echo " + std::to_string(i), home.path());
        ASSERT_TRUE(added.ok);
        uids.push_back(added.uid);
    }

    std::vector<std::thread> threads;
    for (JobUid uid : uids) {
        threads.emplace_back([&store, uid] {
            JobStore view(store.home());
            if (view.claim(uid).ok) {
                (void)view.updateStatusByUid(uid, Status::Completed);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::vector<Status> expected(kJobs, Status::Completed);
    EXPECT_EQ(statuses(store), expected);
}
