/*
 * Copyright (C) 2025 Emeric Poupon
 *
 * This file is part of Jukebox.
 *
 * Jukebox is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Jukebox is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Jukebox.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "ChildProcess.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <mutex>
#include <system_error>
#include <thread>

#include <boost/asio/buffer.hpp>
#include <boost/asio/read.hpp>

#include "core/ILogger.hpp"

namespace jukebox::core
{
    namespace
    {
        class SystemException : public ChildProcessException
        {
        public:
            SystemException(std::error_code err, const std::string& errMsg)
                : ChildProcessException{ errMsg + ": " + err.message() }
            {
            }

            SystemException(boost::system::error_code ec, const std::string& errMsg)
                : ChildProcessException{ errMsg + ": " + ec.message() }
            {
            }
        };

        constexpr std::chrono::milliseconds waitPollInterval{ 10 };
    } // namespace

    ChildProcess::ChildProcess(const std::filesystem::path& path, const Args& args, OutputMode outputMode)
    {
        // make sure only one thread is executing this part of code
        static std::mutex mutex;
        const std::scoped_lock lock{ mutex };

        int pipefd[2]{ -1, -1 };
        if (outputMode == OutputMode::Capture)
        {
            // Use 'pipe' instead of 'pipe2', more portable
            if (pipe(pipefd) == -1)
                throw SystemException{ std::error_code{ errno, std::generic_category() }, "pipe failed!" };

            // Only set O_NONBLOCK on read end - usually programs don't expect stdout to be non-blocking
            if (fcntl(pipefd[0], F_SETFL, O_NONBLOCK) == -1)
                throw SystemException{ std::error_code{ errno, std::generic_category() }, "fcntl failed to set O_NONBLOCK!" };
        }

        const int res{ fork() };
        if (res == -1)
            throw SystemException{ std::error_code{ errno, std::generic_category() }, "fork failed!" };

        if (res == 0) // CHILD
        {
            // Never close stdin/out/err, most programs expect these to exist;
            // rather connect them to /dev/null if unwanted
            const int nullFd{ open("/dev/null", O_RDWR) };
            if (nullFd != -1)
            {
                dup2(nullFd, STDIN_FILENO);
                dup2(nullFd, STDERR_FILENO);
                if (outputMode == OutputMode::Discard)
                    dup2(nullFd, STDOUT_FILENO);
                close(nullFd);
            }

            if (outputMode == OutputMode::Capture)
            {
                if (dup2(pipefd[1], STDOUT_FILENO) == -1)
                    _exit(-1);
                close(pipefd[0]);
                close(pipefd[1]);
            }

            // the child must not stay in our process group, terminal signals are handled by the parent
            setsid();

            std::vector<const char*> execArgs;
            execArgs.push_back(path.c_str());
            std::transform(std::cbegin(args), std::cend(args), std::back_inserter(execArgs), [](const std::string& arg) { return arg.c_str(); });
            execArgs.push_back(nullptr);

            execvp(path.c_str(), const_cast<char* const*>(execArgs.data()));
            _exit(-1);
        }
        else // PARENT
        {
            if (outputMode == OutputMode::Capture)
            {
                close(pipefd[1]);

                boost::system::error_code assignError;
                _childStdout.assign(pipefd[0], assignError);
                if (assignError)
                    throw SystemException{ assignError, "assigning read end of pipe to asio stream failed!" };
            }
            _childPID = res;

            JUKEBOX_LOG(CHILDPROCESS, DEBUG, "Spawned '" << path.string() << "', pid = " << _childPID);
        }
    }

    ChildProcess::~ChildProcess()
    {
        if (_childStdout.is_open())
        {
            boost::system::error_code closeError;
            _childStdout.close(closeError);
            if (closeError)
                JUKEBOX_LOG(CHILDPROCESS, ERROR, "Close failed: " << closeError.message());
        }

        if (!_waited)
        {
            kill();
            try
            {
                wait(true);
            }
            catch (const ChildProcessException& e)
            {
                JUKEBOX_LOG(CHILDPROCESS, ERROR, "Cannot reap child process " << _childPID << ": " << e.what());
            }
        }
    }

    bool ChildProcess::isRunning()
    {
        if (_waited)
            return false;

        return !wait(false);
    }

    void ChildProcess::terminate()
    {
        JUKEBOX_LOG(CHILDPROCESS, DEBUG, "Terminating child process " << _childPID << "...");
        sendSignal(SIGTERM);
    }

    void ChildProcess::kill()
    {
        JUKEBOX_LOG(CHILDPROCESS, DEBUG, "Killing child process " << _childPID << "...");
        sendSignal(SIGKILL);
    }

    void ChildProcess::sendSignal(int signal)
    {
        if (_waited)
            return;

        // process may already have finished
        if (::kill(_childPID, signal) == -1)
        {
            const int err{ errno };
            JUKEBOX_LOG(CHILDPROCESS, DEBUG, "Signal " << signal << " failed: " << (std::error_code{ err, std::generic_category() }.message()));
        }
    }

    bool ChildProcess::waitExit(std::chrono::milliseconds timeout)
    {
        const auto deadline{ std::chrono::steady_clock::now() + timeout };
        while (isRunning())
        {
            if (std::chrono::steady_clock::now() >= deadline)
                return false;

            std::this_thread::sleep_for(waitPollInterval);
        }

        return true;
    }

    bool ChildProcess::wait(bool block)
    {
        int wstatus{};
        const pid_t pid{ waitpid(_childPID, &wstatus, block ? 0 : WNOHANG) };

        if (pid == -1)
            throw SystemException{ std::error_code{ errno, std::generic_category() }, "waitpid failed!" };
        if (pid == 0)
            return false;

        if (WIFEXITED(wstatus))
        {
            _exitCode = WEXITSTATUS(wstatus);
            JUKEBOX_LOG(CHILDPROCESS, DEBUG, "Child process " << _childPID << " exited, code = " << *_exitCode);
        }
        else if (WIFSIGNALED(wstatus))
        {
            JUKEBOX_LOG(CHILDPROCESS, DEBUG, "Child process " << _childPID << " killed by signal " << WTERMSIG(wstatus));
        }

        _waited = true;
        return true;
    }

    std::string ChildProcess::readOutput(std::chrono::milliseconds timeout)
    {
        if (!_childStdout.is_open())
            throw ChildProcessException{ "Child process output is not captured" };

        std::string output;
        bool completed{};

        boost::asio::async_read(_childStdout, boost::asio::dynamic_buffer(output),
            [&](const boost::system::error_code& ec, std::size_t bytesTransferred) {
                completed = true;
                JUKEBOX_LOG_IF(CHILDPROCESS, DEBUG, (ec && ec != boost::asio::error::eof), "Read output failed: " << ec.message());
                JUKEBOX_LOG(CHILDPROCESS, DEBUG, "Read " << bytesTransferred << " bytes from child process " << _childPID);
            });

        _ioContext.restart();
        _ioContext.run_for(timeout);
        if (!completed)
        {
            JUKEBOX_LOG(CHILDPROCESS, DEBUG, "Timeout while reading output of child process " << _childPID);

            boost::system::error_code ec;
            _childStdout.cancel(ec);
            _ioContext.restart();
            _ioContext.run(); // flush the aborted handler
        }

        return output;
    }
} // namespace jukebox::core
