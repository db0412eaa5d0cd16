#include "Speech.hpp"
#include <cstdio>
#include <sys/wait.h>
#include <spdlog/spdlog.h>

bool speak(const std::string& command, const std::string& text) {
    if (command.empty()) return true;

    FILE* pipe = popen(command.c_str(), "w");
    if (!pipe) {
        spdlog::warn("Failed to start TTS command '{}'", command);
        return false;
    }

    std::size_t written = std::fwrite(text.data(), 1, text.size(), pipe);
    int status = pclose(pipe);

    if (written != text.size()) {
        spdlog::warn("TTS command '{}' accepted {} of {} bytes", command, written, text.size());
        return false;
    }
    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        spdlog::warn("TTS command '{}' failed (status {})", command, status);
        return false;
    }
    return true;
}
