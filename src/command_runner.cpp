#include "rtprov/command_runner.hpp"
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>
#include <iostream>

namespace rtprov {

    int SystemCommandRunner::run(const std::vector<std::string>& argv) {
        if (argv.empty()) {
            return -1;
        }

        // Build the NULL-terminated argument array before forking
        std::vector<char*> c_argv;
        c_argv.reserve(argv.size() + 1);
        for (const auto& arg : argv) {
            c_argv.push_back(const_cast<char*>(arg.c_str()));
        }
        c_argv.push_back(nullptr);

        // Flush so buffered progress lines are not duplicated in the child
        std::cout.flush();
        std::cerr.flush();

        pid_t pid = fork();

        if (pid < 0) {
            std::cerr << "Failed to fork for " << argv[0] << ": "
                      << strerror(errno) << std::endl;
            return -1;
        }

        if (pid == 0) {
            // Child process
            execvp(c_argv[0], c_argv.data());

            // If we get here, exec failed
            _exit(EXEC_FAILED_STATUS);
        }

        // Parent process
        int status = 0;
        pid_t result;
        do {
            result = waitpid(pid, &status, 0);
        } while (result < 0 && errno == EINTR);

        if (result < 0) {
            std::cerr << "Failed to wait for " << argv[0] << ": "
                      << strerror(errno) << std::endl;
            return -1;
        }

        if (WIFEXITED(status)) {
            return WEXITSTATUS(status);
        }
        if (WIFSIGNALED(status)) {
            return 128 + WTERMSIG(status);
        }
        return -1;
    }

} // namespace rtprov
