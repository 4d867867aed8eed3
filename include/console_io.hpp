#pragma once
#include <string>
#include <cstdio>
#include <iostream>

#if defined(_WIN32)
  #include <windows.h>
  #include <io.h>
#else
  #include <termios.h>
  #include <unistd.h>
#endif

inline std::string prompt_line(const std::string& message) {
    std::cout << message << std::flush;
    std::string s;
    std::getline(std::cin, s);
    return s;
}

// Echo is restored when the guard leaves scope, even if getline throws.
class EchoOffGuard {
public:
    EchoOffGuard() {
#if defined(_WIN32)
        m_active = _isatty(_fileno(stdin)) != 0;
        if (!m_active) return;
        m_handle = GetStdHandle(STD_INPUT_HANDLE);
        GetConsoleMode(m_handle, &m_oldMode);
        SetConsoleMode(m_handle, m_oldMode & ~ENABLE_ECHO_INPUT);
#else
        // piped input (scripts, tests) has no terminal to silence
        m_active = isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &m_old) == 0;
        if (!m_active) return;
        termios quiet = m_old;
        quiet.c_lflag &= ~ECHO;
        tcsetattr(STDIN_FILENO, TCSANOW, &quiet);
#endif
    }
    ~EchoOffGuard() {
        if (!m_active) return;
#if defined(_WIN32)
        SetConsoleMode(m_handle, m_oldMode);
#else
        tcsetattr(STDIN_FILENO, TCSANOW, &m_old);
#endif
    }
    EchoOffGuard(const EchoOffGuard&) = delete;
    EchoOffGuard& operator=(const EchoOffGuard&) = delete;

private:
    bool m_active = false;
#if defined(_WIN32)
    HANDLE m_handle = nullptr;
    DWORD  m_oldMode = 0;
#else
    termios m_old{};
#endif
};

inline std::string prompt_hidden(const std::string& message) {
    std::cout << message << std::flush;
    std::string out;
    {
        EchoOffGuard guard;
        std::getline(std::cin, out);
    }
    std::cout << "\n";
    return out;
}
