#include "audio/ffmpeg.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <signal.h>
#include <string>
#include <sys/wait.h>
#include <unistd.h>

namespace audio {

std::expected<void, std::string> ffmpeg_to_wav(const std::string& ffmpeg,
                                               const std::string& input_path,
                                               const std::string& output_path,
                                               uint32_t sample_rate) {
    std::string rate = std::to_string(sample_rate);

    pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // The service blocks SIGINT/SIGTERM for its signalfd; exec keeps the
        // mask, so clear it or the child could not be interrupted.
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);

        // ffmpeg's own errors stay on stderr; progress output is discarded
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
            ::close(devnull);
        }
        ::execlp(ffmpeg.c_str(), ffmpeg.c_str(),
                 "-nostdin", "-hide_banner", "-loglevel", "error", "-y",
                 "-i", input_path.c_str(),
                 "-ar", rate.c_str(), "-ac", "1", "-c:a", "pcm_s16le", "-f", "wav",
                 output_path.c_str(), nullptr);
        ::_exit(127);
    }

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(std::string("waitpid() failed: ") + std::strerror(errno));
    }

    if (WIFSIGNALED(status)) {
        return std::unexpected("ffmpeg killed by signal " + std::to_string(WTERMSIG(status)));
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) == 127) {
        return std::unexpected("could not execute " + ffmpeg);
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        return std::unexpected("ffmpeg failed with code " + std::to_string(WEXITSTATUS(status)));
    }

    return {};
}

} // namespace audio
