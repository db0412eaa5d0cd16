#pragma once
#include <string>

// Pipes text to an external text-to-speech command run through the shell
// and waits for it to exit. Returns false if the command could not be
// started or exited non-zero. An empty command does nothing and succeeds.
bool speak(const std::string& command, const std::string& text);
