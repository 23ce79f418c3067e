#include "appdesk/system.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace appdesk {

namespace {

std::string join_argv(const std::vector<std::string>& argv) {
    std::string joined;
    for (const auto& arg : argv) {
        if (!joined.empty()) joined += ' ';
        joined += arg;
    }
    return joined;
}

Result<void> run_checked(const std::vector<std::string>& argv) {
    auto result = run_command(argv);
    if (!result.ok) {
        return Result<void>::err(Error(ErrorCode::COMMAND_FAILED,
            join_argv(argv) + ": " + result.error));
    }
    if (result.exit_code != 0) {
        return Result<void>::err(Error(ErrorCode::COMMAND_FAILED,
            join_argv(argv) + " exited with status " + std::to_string(result.exit_code)));
    }
    return Result<void>::ok();
}

} // namespace

ExecResult run_command(const std::vector<std::string>& argv, bool discard_output) {
    ExecResult result;

    if (argv.empty()) {
        result.error = "empty command";
        return result;
    }

    std::vector<char*> c_argv;
    for (const auto& s : argv) {
        c_argv.push_back(const_cast<char*>(s.c_str()));
    }
    c_argv.push_back(nullptr);

    spdlog::debug("Running: {}", join_argv(argv));

    pid_t pid = fork();

    if (pid == -1) {
        result.error = "fork failed: " + std::string(strerror(errno));
        return result;
    }

    if (pid == 0) {
        // Child process
        if (discard_output) {
            int devnull = open("/dev/null", O_WRONLY);
            if (devnull >= 0) {
                dup2(devnull, STDOUT_FILENO);
                dup2(devnull, STDERR_FILENO);
                close(devnull);
            }
        }

        execvp(c_argv[0], c_argv.data());

        // If execvp returns, it failed
        _exit(127);
    }

    int status;
    if (waitpid(pid, &status, 0) == -1) {
        result.error = "waitpid failed: " + std::string(strerror(errno));
        return result;
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        result.ok = true;
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
        result.ok = true;
    } else {
        result.error = "process terminated abnormally";
    }

    return result;
}

bool AptPackageManager::is_installed(const std::string& package) {
    auto result = run_command({"dpkg", "-s", package}, true);
    return result.ok && result.exit_code == 0;
}

Result<void> AptPackageManager::install(const std::string& package) {
    auto updated = run_checked({"sudo", "apt-get", "update", "-qq"});
    if (updated.isErr()) {
        return updated;
    }
    return run_checked({"sudo", "apt-get", "install", "-y", package});
}

Result<void> DesktopDatabase::refresh(const std::string& descriptor_dir) {
    return run_checked({"update-desktop-database", descriptor_dir});
}

} // namespace appdesk
