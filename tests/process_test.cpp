#include <chrono>
#include <thread>

#include <gtest/gtest.h>

#include "process.h"

TEST(Process, CapturesStdoutAndExitCode)
{
    process_output output;
    ASSERT_TRUE(run_capture({"echo", "hello"}, output));
    EXPECT_EQ(output.stdout_text, "hello\n");
    EXPECT_EQ(output.exit_code, 0);

    ASSERT_TRUE(run_capture({"false"}, output));
    EXPECT_NE(output.exit_code, 0);
}

TEST(Process, MissingBinaryExitsWith127)
{
    process_output output;
    ASSERT_TRUE(run_capture({"/nonexistent/xaudio-binary"}, output));
    EXPECT_EQ(output.exit_code, 127);
    EXPECT_FALSE(run_capture({}, output));
}

TEST(Process, ChildIsStoppedAndReaped)
{
    ChildProcess child;
    ASSERT_TRUE(child.start({"sleep", "30"}));
    EXPECT_GT(child.pid(), 0);
    EXPECT_TRUE(child.is_running());
    EXPECT_FALSE(child.start({"sleep", "30"}));

    child.stop(50);
    EXPECT_EQ(child.pid(), -1);
    EXPECT_FALSE(child.is_running());
}

TEST(Process, ExitedChildIsNotRunning)
{
    ChildProcess child;
    ASSERT_TRUE(child.start({"true"}));
    for (int i = 0; i < 200 && child.is_running(); ++i)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_FALSE(child.is_running());
}
