#include "common/utils.hpp"
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <thread>

extern char **environ;

namespace sandbox {
using namespace std;

static const struct timespec killdelay = {0, 100000000L};  // 0.1s

/**
 * @brief 构造子进程的环境变量表
 * fork 之后子进程中不能调用 setenv（非异步信号安全），因此必须在 fork 之前准备好
 */
static vector<string> build_environment(const map<string, string> &env) {
    vector<string> result;
    for (char **e = environ; e && *e; ++e) {
        string entry(*e);
        string key = entry.substr(0, entry.find('='));
        if (!env.count(key)) result.push_back(move(entry));
    }
    for (auto &[key, value] : env)
        result.push_back(key + "=" + value);
    return result;
}

/**
 * @brief 终止整个进程组，先尝试 SIGTERM，再 SIGKILL
 */
static void kill_process_group(pid_t pid) {
    if (kill(-pid, SIGTERM) != 0 && errno != ESRCH)
        PLOG(WARNING) << "Unable to send SIGTERM to process group " << pid;
    nanosleep(&killdelay, nullptr);
    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
        PLOG(WARNING) << "Unable to send SIGKILL to process group " << pid;
}

process_result exec_program_capture(const map<string, string> &env, const vector<string> &argv, chrono::milliseconds timeout, size_t output_limit) {
    if (argv.empty()) throw invalid_argument("exec_program_capture: empty argv");

    vector<string> envs = build_environment(env);
    vector<char *> c_argv, c_envp;
    for (auto &arg : argv) c_argv.push_back(const_cast<char *>(arg.c_str()));
    c_argv.push_back(nullptr);
    for (auto &e : envs) c_envp.push_back(const_cast<char *>(e.c_str()));
    c_envp.push_back(nullptr);

    int out_pipe[2], err_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) != 0)
        throw system_error(errno, system_category(), "creating stdout pipe");
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        int saved = errno;
        close(out_pipe[0]), close(out_pipe[1]);
        throw system_error(saved, system_category(), "creating stderr pipe");
    }

    pid_t pid = fork();
    switch (pid) {
        case -1: {  // fork 失败
            int saved = errno;
            close(out_pipe[0]), close(out_pipe[1]);
            close(err_pipe[0]), close(err_pipe[1]);
            throw system_error(saved, system_category(), "fork");
        }
        case 0: {  // 子进程
            // 独立的进程组，以便超时时能够终止整个进程树
            setpgid(0, 0);
            // 避免子进程被终止，要求父进程处理中断信号
            signal(SIGINT, SIG_IGN);
            int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0) dup2(devnull, STDIN_FILENO);
            dup2(out_pipe[1], STDOUT_FILENO);
            dup2(err_pipe[1], STDERR_FILENO);
            execvpe(c_argv[0], c_argv.data(), c_envp.data());
            _exit(127);
        }
        default:
            break;
    }

    // 父进程同样设置一次，避免子进程尚未调用 setpgid 时就需要 kill(-pid)
    setpgid(pid, pid);
    close(out_pipe[1]);
    close(err_pipe[1]);

    process_result result;
    auto deadline = chrono::steady_clock::now() + timeout;
    struct pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
    string *targets[2] = {&result.out, &result.err};
    int open_streams = 2;
    char buf[4096];

    while (open_streams > 0) {
        auto remaining = chrono::duration_cast<chrono::milliseconds>(deadline - chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timed_out = true;
            break;
        }
        int r = poll(fds, 2, (int)remaining.count());
        if (r < 0) {
            if (errno == EINTR) continue;
            PLOG(ERROR) << "poll on child pipes failed";
            result.timed_out = true;
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t n = read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                size_t keep = min((size_t)n, output_limit - min(output_limit, targets[i]->size()));
                targets[i]->append(buf, keep);
            } else if (n == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;
                --open_streams;
            }
        }
    }

    int status = 0;
    if (!result.timed_out) {
        // 输出流已经关闭，但进程可能仍在运行，继续等待到截止时间为止
        while (true) {
            pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) break;
            if (waited < 0 && errno != EINTR) break;
            if (chrono::steady_clock::now() >= deadline) {
                result.timed_out = true;
                break;
            }
            this_thread::sleep_for(chrono::milliseconds(10));
        }
    }

    if (result.timed_out) {
        kill_process_group(pid);
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
            ;
    }

    for (auto &fd : fds)
        if (fd.fd >= 0) close(fd.fd);

    if (WIFEXITED(status) && !result.timed_out) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
    }
    return result;
}

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

double elapsed_time::seconds() const {
    return duration<chrono::duration<double>>().count();
}

}  // namespace sandbox
