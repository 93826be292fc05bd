/*
 *	avrforge - The "avrforge" program.
 *	Copyright (C) 2026 The avrforge developers
 *
 *	This program is free software; you can redistribute it and/or modify
 *	it under the terms of the GNU General Public License Version 2
 *	as published by the Free Software Foundation.
 *
 *	This program is distributed in the hope that it will be useful,
 *	but WITHOUT ANY WARRANTY; without even the implied warranty of
 *	MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *	GNU General Public License for more details.
 *
 *	You should have received a copy of the GNU General Public License
 *	along with this program; if not, write to the Free Software
 *	Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA 02111, USA.
 *
 * This file forks and waits for the external toolchain programs.
 */

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "avrforge.h"
#include "process.h"

std::string commandLine(const std::vector<std::string> &argv) {
    std::string line;

    for (const auto &arg : argv) {
        if (!line.empty())
            line += ' ';
        if (arg.empty() || arg.find_first_of(" \t\"'") != std::string::npos)
            line += "\"" + arg + "\"";
        else
            line += arg;
    }
    return line;
}

// Only async-signal-safe calls from here on; we are in the forked child.
[[noreturn]] static void childFail(const char *what, const char *name) {
    const char *err = strerror(errno);
    (void)!write(STDERR_FILENO, what, strlen(what));
    (void)!write(STDERR_FILENO, name, strlen(name));
    (void)!write(STDERR_FILENO, ": ", 2);
    (void)!write(STDERR_FILENO, err, strlen(err));
    (void)!write(STDERR_FILENO, "\n", 1);
    _exit(EXIT_EXEC_FAILED);
}

static void drainPipe(int fd, std::string &out) {
    char buf[4096];

    for (;;) {
        const ssize_t rv = read(fd, buf, sizeof(buf));
        if (rv > 0)
            out.append(buf, rv);
        else if (rv == 0)
            break;
        else if (errno != EINTR) {
            const int saved = errno;
            close(fd);
            throw build_exception(std::string("reading tool output failed: ") + strerror(saved));
        }
    }
    close(fd);
}

int runProcess(const std::vector<std::string> &argv, const ProcessOptions &opts) {
    if (argv.empty())
        throw build_exception("runProcess: empty command");

    std::vector<char *> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto &arg : argv)
        cargv.push_back(const_cast<char *>(arg.c_str()));
    cargv.push_back(nullptr);

    debugOut("exec: %s\n", commandLine(argv).c_str());
    if (opts.cwd != nullptr)
        debugOut("  in directory %s\n", opts.cwd);
    if (opts.stdoutFile != nullptr)
        debugOut("  stdout to %s\n", opts.stdoutFile);

    int pype[2] = {-1, -1};
    if (opts.captureStdout != nullptr && pipe(pype) < 0)
        throw build_exception(std::string("cannot create pipe: ") + strerror(errno));

    statusFlush();

    const pid_t child = fork();
    if (child < 0) {
        const int saved = errno;
        if (pype[0] >= 0) {
            close(pype[0]);
            close(pype[1]);
        }
        throw build_exception(std::string("Failed to fork: ") + strerror(saved));
    }

    if (child == 0) {
        if (opts.cwd != nullptr && chdir(opts.cwd) < 0)
            childFail("cannot change to directory ", opts.cwd);

        if (opts.captureStdout != nullptr) {
            close(pype[0]);
            if (dup2(pype[1], STDOUT_FILENO) < 0)
                childFail("cannot redirect stdout of ", cargv[0]);
            close(pype[1]);
        } else if (opts.stdoutFile != nullptr) {
            const int fd = open(opts.stdoutFile, O_WRONLY | O_CREAT | O_TRUNC, 0666);
            if (fd < 0)
                childFail("cannot create ", opts.stdoutFile);
            if (dup2(fd, STDOUT_FILENO) < 0)
                childFail("cannot redirect stdout of ", cargv[0]);
            close(fd);
        }

        execvp(cargv[0], cargv.data());
        childFail("cannot execute ", cargv[0]);
    }

    if (opts.captureStdout != nullptr) {
        close(pype[1]);
        opts.captureStdout->clear();
        try {
            drainPipe(pype[0], *opts.captureStdout);
        } catch (build_exception &) {
            int ignored;
            kill(child, SIGTERM);
            while (waitpid(child, &ignored, 0) < 0 && errno == EINTR)
                ;
            throw;
        }
    }

    int wstatus;
    while (waitpid(child, &wstatus, 0) < 0) {
        if (errno != EINTR)
            throw build_exception(std::string("waitpid() failed: ") + strerror(errno));
    }

    if (WIFEXITED(wstatus)) {
        debugOut("%s exited with status %d\n", cargv[0], WEXITSTATUS(wstatus));
        return WEXITSTATUS(wstatus);
    }
    if (WIFSIGNALED(wstatus)) {
        debugOut("%s killed by signal %d\n", cargv[0], WTERMSIG(wstatus));
        return EXIT_SIGNAL_BASE + WTERMSIG(wstatus);
    }
    return EXIT_BUILD_ERROR;
}
