#pragma once
#include <iostream>
#include <string>

#if defined(_WIN32)
  #include <windows.h>
#else
  #include <termios.h>
  #include <unistd.h>
#endif

inline std::string prompt_line(const std::string& message) {
    std::cout << message << std::flush;
    std::string line;
    std::getline(std::cin, line);
    return line;
}

// Reads one line with terminal echo off; echo is restored even if getline throws.
inline std::string prompt_hidden(const std::string& message) {
    std::cout << message << std::flush;
    std::string out;

#if defined(_WIN32)
    struct EchoGuard {
        HANDLE h; DWORD saved;
        ~EchoGuard() { SetConsoleMode(h, saved); }
    };
    HANDLE hStdin = GetStdHandle(STD_INPUT_HANDLE);
    DWORD mode = 0;
    GetConsoleMode(hStdin, &mode);
    EchoGuard guard{ hStdin, mode };
    SetConsoleMode(hStdin, mode & ~ENABLE_ECHO_INPUT);
    std::getline(std::cin, out);
#else
    struct EchoGuard {
        termios saved; bool active;
        ~EchoGuard() { if (active) tcsetattr(STDIN_FILENO, TCSANOW, &saved); }
    };
    EchoGuard guard{ {}, false };
    if (isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &guard.saved) == 0) {
        termios quiet = guard.saved;
        quiet.c_lflag &= ~ECHO;
        guard.active = tcsetattr(STDIN_FILENO, TCSANOW, &quiet) == 0;
    }
    std::getline(std::cin, out);
#endif

    std::cout << "\n";
    return out;
}
