#include <gtest/gtest.h>
#include "droidbridge/process_runner.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>

#include <signal.h>
#include <unistd.h>

using namespace droidbridge;

// Each case runs a host in a death-test child: a worker thread is blocked on
// a real "sleep 30", the host calls std::exit(), and the parent checks that
// the sleep process did not survive it.

namespace {

std::filesystem::path pid_file(const std::string& name) {
    return std::filesystem::temp_directory_path() /
           ("droidbridge_exit_hook_" + name + ".pid");
}

ProcessRunner& static_runner() {
    static ProcessRunner runner("sleep");
    return runner;
}

[[noreturn]] void exit_while_running(ProcessRunner& runner, const std::filesystem::path& file) {
    std::thread([&runner] { runner.execute("30"); }).detach();

    while (runner.active_processes() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    {
        std::ofstream out(file);
        out << runner.pool()->pids().front() << "\n";
    }
    std::exit(0);
}

int read_pid(const std::filesystem::path& file) {
    std::ifstream in(file);
    int pid = 0;
    in >> pid;
    return pid;
}

// A killed child may linger as a zombie until its new parent reaps it
bool is_gone(int pid) {
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    std::string content;
    if (!stat || !std::getline(stat, content)) {
        return ::kill(pid, 0) != 0;
    }
    size_t close = content.rfind(')');
    if (close == std::string::npos || close + 2 >= content.size()) {
        return true;
    }
    char state = content[close + 2];
    return state == 'Z' || state == 'X';
}

bool wait_until_gone(int pid, std::chrono::milliseconds limit) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (is_gone(pid)) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return is_gone(pid);
}

void expect_child_killed(const std::filesystem::path& file) {
    int pid = read_pid(file);
    std::filesystem::remove(file);
    ASSERT_GT(pid, 0);

    bool gone = wait_until_gone(pid, std::chrono::seconds(3));
    if (!gone) {
        ::kill(pid, SIGKILL);
    }
    EXPECT_TRUE(gone) << "process " << pid << " outlived its host";
}

} // namespace

TEST(ExitHookDeathTest, KillsChildrenOfLocalRunner) {
    auto file = pid_file("local");
    EXPECT_EXIT(
        {
            ProcessRunner runner("sleep");
            exit_while_running(runner, file);
        },
        ::testing::ExitedWithCode(0), "killed because parent process is shutting down");
    expect_child_killed(file);
}

TEST(ExitHookDeathTest, KillsChildrenOfStaticRunner) {
    auto file = pid_file("static");
    EXPECT_EXIT(exit_while_running(static_runner(), file),
                ::testing::ExitedWithCode(0), "killed because parent process is shutting down");
    expect_child_killed(file);
}
