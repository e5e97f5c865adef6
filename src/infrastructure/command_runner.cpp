/**
 * External command execution
 * Every interaction with hostapd, dnsmasq, iptables, nmcli, ip and sysctl goes through here
 */

#include "infrastructure/command_runner.hpp"
#include "core/logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace captureap
{
    namespace infrastructure
    {

        std::string format_command(const std::vector<std::string> &argv)
        {
            std::ostringstream cmd;
            for (size_t i = 0; i < argv.size(); ++i)
            {
                if (i > 0)
                    cmd << " ";
                cmd << argv[i];
            }
            return cmd.str();
        }

        ProcessCommandRunner::ProcessCommandRunner()
            : logger_(core::get_logger("CommandRunner"))
        {
        }

        CommandResult ProcessCommandRunner::run(const std::vector<std::string> &argv, OutputMode mode)
        {
            CommandResult result;
            if (argv.empty())
            {
                return result;
            }

            logger_->debug("Running command", core::LogContext().add("command", format_command(argv)));

            int pipe_fds[2] = {-1, -1};
            if (mode == OutputMode::Capture && pipe(pipe_fds) != 0)
            {
                logger_->error("Failed to create pipe", core::LogContext().add("error", std::strerror(errno)));
                return result;
            }

            pid_t pid = fork();
            if (pid == 0)
            {
                // Child process
                if (mode == OutputMode::Capture)
                {
                    close(pipe_fds[0]);
                    dup2(pipe_fds[1], STDOUT_FILENO);
                    dup2(pipe_fds[1], STDERR_FILENO);
                    close(pipe_fds[1]);
                }
                else
                {
                    int null_fd = open("/dev/null", O_WRONLY);
                    if (null_fd >= 0)
                    {
                        dup2(null_fd, STDOUT_FILENO);
                        close(null_fd);
                    }
                }

                std::vector<char *> args;
                for (const auto &arg : argv)
                {
                    args.push_back(const_cast<char *>(arg.c_str()));
                }
                args.push_back(nullptr);

                execvp(args[0], args.data());
                _exit(127);
            }
            else if (pid < 0)
            {
                logger_->error("Failed to fork", core::LogContext()
                                                     .add("command", argv[0])
                                                     .add("error", std::strerror(errno)));
                if (mode == OutputMode::Capture)
                {
                    close(pipe_fds[0]);
                    close(pipe_fds[1]);
                }
                return result;
            }

            // Parent process
            if (mode == OutputMode::Capture)
            {
                close(pipe_fds[1]);

                char buffer[256];
                while (true)
                {
                    ssize_t count = read(pipe_fds[0], buffer, sizeof(buffer));
                    if (count > 0)
                    {
                        result.output.append(buffer, static_cast<size_t>(count));
                    }
                    else if (count < 0 && errno == EINTR)
                    {
                        continue;
                    }
                    else
                    {
                        break;
                    }
                }
                close(pipe_fds[0]);
            }

            int status = 0;
            while (waitpid(pid, &status, 0) < 0)
            {
                if (errno != EINTR)
                {
                    logger_->error("waitpid failed", core::LogContext()
                                                         .add("command", argv[0])
                                                         .add("error", std::strerror(errno)));
                    return result;
                }
            }

            if (WIFEXITED(status))
            {
                result.exit_status = WEXITSTATUS(status);
            }
            else if (WIFSIGNALED(status))
            {
                result.exit_status = 128 + WTERMSIG(status);
            }

            logger_->debug("Command finished", core::LogContext()
                                                   .add("command", argv[0])
                                                   .add("exit_status", result.exit_status));
            return result;
        }

    } // namespace infrastructure
} // namespace captureap
