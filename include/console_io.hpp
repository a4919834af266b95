#pragma once
#include <string>
#include <iostream>

#if defined(_WIN32)
  #include <windows.h>
#else
  #include <termios.h>
  #include <unistd.h>
#endif

// Turns terminal echo off for its lifetime (no-op when stdin is not a tty).
class EchoOff {
public:
    EchoOff() {
#if defined(_WIN32)
        m_handle = GetStdHandle(STD_INPUT_HANDLE);
        m_active = GetConsoleMode(m_handle, &m_oldMode) != 0;
        if (m_active) SetConsoleMode(m_handle, m_oldMode & ~ENABLE_ECHO_INPUT);
#else
        m_active = isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &m_old) == 0;
        if (m_active) {
            termios quiet = m_old;
            quiet.c_lflag &= ~ECHO;
            tcsetattr(STDIN_FILENO, TCSANOW, &quiet);
        }
#endif
    }
    ~EchoOff() {
        if (!m_active) return;
#if defined(_WIN32)
        SetConsoleMode(m_handle, m_oldMode);
#else
        tcsetattr(STDIN_FILENO, TCSANOW, &m_old);
#endif
    }
    EchoOff(const EchoOff&) = delete;
    EchoOff& operator=(const EchoOff&) = delete;

private:
    bool m_active = false;
#if defined(_WIN32)
    HANDLE m_handle = nullptr;
    DWORD m_oldMode = 0;
#else
    termios m_old{};
#endif
};

inline std::string prompt_line(const std::string& message) {
    std::cout << message << std::flush;
    std::string s;
    std::getline(std::cin, s);
    return s;
}

inline std::string prompt_passphrase(const std::string& message) {
    std::cout << message << std::flush;
    std::string out;
    {
        EchoOff guard;
        std::getline(std::cin, out);
    }
    std::cout << "\n";
    return out;
}
