#pragma once
#include <string>

// Test-only environment helpers.
// Tests set OBJSH_* variables through the Windows-style _putenv("NAME=VALUE");
// on POSIX test_env.cpp supplies it on top of setenv/unsetenv.

#ifndef _WIN32
extern "C" int _putenv(const char* assignment);
#endif

// Sets NAME=VALUE for the lifetime of the object, then clears it again.
class ScopedEnv {
public:
    ScopedEnv(const std::string& name, const std::string& value);
    ~ScopedEnv();
    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;
private:
    std::string name_;
};
