/*
 * jobmgr - Local Background Job Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "jobmgr/output_sink.hpp"
#include "test_support.hpp"

using namespace jobmgr;
using jobmgr::testing::TempHome;
using jobmgr::testing::readFile;

TEST(OutputSinkTest, WritesStdoutOnly) {
    TempHome home;
    OutputSink sink(home.path());

    ASSERT_TRUE(sink.write(7, "hi\n", "").ok);
    EXPECT_EQ(sink.pathFor(7), home.path() / "output" / "job_7.txt");

    OutputResult read = sink.read(7);
    ASSERT_TRUE(read.ok);
    EXPECT_EQ(read.text, "hi\n");
}

TEST(OutputSinkTest, AppendsStderrAfterSeparator) {
    TempHome home;
    OutputSink sink(home.path());

    ASSERT_TRUE(sink.write(1, "out\n", "oops\n").ok);
    EXPECT_EQ(readFile(sink.pathFor(1)), std::string("out\n") + OutputSink::kErrorSeparator + "oops\n");
}

TEST(OutputSinkTest, MissingOutputIsNotFound) {
    TempHome home;
    OutputSink sink(home.path());

    OutputResult read = sink.read(3);
    EXPECT_FALSE(read.ok);
    EXPECT_EQ(read.error, JobError::NotFound);
    EXPECT_FALSE(sink.exists(3));
}

TEST(OutputSinkTest, LastWriteWins) {
    TempHome home;
    OutputSink sink(home.path());

    ASSERT_TRUE(sink.write(2, "first run with a long line\n", "warning\n").ok);
    ASSERT_TRUE(sink.write(2, "second\n", "").ok);
    EXPECT_EQ(sink.read(2).text, "second\n");
}

TEST(OutputSinkTest, RemoveAndClear) {
    TempHome home;
    OutputSink sink(home.path());
    ASSERT_TRUE(sink.write(1, "a", "").ok);
    ASSERT_TRUE(sink.write(2, "b", "").ok);
    ASSERT_TRUE(sink.write(3, "c", "").ok);

    EXPECT_TRUE(sink.remove(1));
    EXPECT_FALSE(sink.remove(1));
    EXPECT_FALSE(sink.exists(1));

    ASSERT_TRUE(sink.clear().ok);
    EXPECT_FALSE(sink.exists(2));
    EXPECT_FALSE(sink.exists(3));
    EXPECT_TRUE(std::filesystem::is_directory(sink.directory()));
}
