/// @file process_runner.cpp
/// @brief posix_spawn / CreateProcess based child process runner.

#include "gsa/foundation/process_runner.hpp"

#include <cerrno>
#include <cstring>
#include <system_error>
#include <utility>

#if defined(_WIN32)
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
    #include <windows.h>
#else
    #include <spawn.h>
    #include <sys/types.h>
    #include <sys/wait.h>
    #include <unistd.h>

extern char** environ;  // NOLINT(readability-redundant-declaration)
#endif

namespace gsa::foundation {

namespace {

std::string describeCommand(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) {
            out += ' ';
        }
        out += arg;
    }
    return out;
}

#if defined(_WIN32)

std::string narrow(const std::wstring& s) {
    if (s.empty()) {
        return {};
    }
    int len = WideCharToMultiByte(CP_UTF8, 0, s.data(), static_cast<int>(s.size()), nullptr, 0,
                                  nullptr, nullptr);
    std::string out(static_cast<std::size_t>(len), '\0');
    WideCharToMultiByte(CP_UTF8, 0, s.data(), static_cast<int>(s.size()), out.data(), len,
                        nullptr, nullptr);
    return out;
}

std::wstring widen(const std::string& s) {
    if (s.empty()) {
        return {};
    }
    int len = MultiByteToWideChar(CP_UTF8, 0, s.data(), static_cast<int>(s.size()), nullptr, 0);
    std::wstring out(static_cast<std::size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, s.data(), static_cast<int>(s.size()), out.data(), len);
    return out;
}

/// Quote one argument following the CommandLineToArgvW rules.
std::wstring quoteArg(const std::wstring& arg) {
    if (!arg.empty() && arg.find_first_of(L" \t\"") == std::wstring::npos) {
        return arg;
    }
    std::wstring out = L"\"";
    std::size_t backslashes = 0;
    for (wchar_t c : arg) {
        if (c == L'\\') {
            ++backslashes;
        } else if (c == L'"') {
            out.append(backslashes * 2 + 1, L'\\');
            out += c;
            backslashes = 0;
        } else {
            out.append(backslashes, L'\\');
            out += c;
            backslashes = 0;
        }
    }
    out.append(backslashes * 2, L'\\');
    out += L'"';
    return out;
}

#endif

} // anonymous namespace

#if defined(_WIN32)

namespace {

/// @p description is the UTF-8 command line used in error messages.
AgentResult<int> runCommandLine(std::wstring cmdline, const std::string& description) {
    STARTUPINFOW si{};
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi{};
    if (!CreateProcessW(nullptr, cmdline.data(), nullptr, nullptr, FALSE, 0,
                        nullptr, nullptr, &si, &pi)) {
        return AgentResult<int>::err(AgentError(
            ErrorCode::ProcessSpawnFailed,
            "failed to start '" + description + "': error " +
                std::to_string(GetLastError())));
    }

    WaitForSingleObject(pi.hProcess, INFINITE);
    DWORD exitCode = 0;
    BOOL gotCode = GetExitCodeProcess(pi.hProcess, &exitCode);
    CloseHandle(pi.hThread);
    CloseHandle(pi.hProcess);

    if (!gotCode) {
        return AgentResult<int>::err(AgentError(
            ErrorCode::ProcessWaitFailed,
            "failed to read exit code of '" + description + "'"));
    }
    return AgentResult<int>::ok(static_cast<int>(exitCode));
}

} // anonymous namespace

AgentResult<int> runProcess(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return AgentResult<int>::err(
            AgentError(ErrorCode::InvalidArgument, "empty command line"));
    }

    std::wstring cmdline;
    for (const auto& arg : argv) {
        if (!cmdline.empty()) {
            cmdline += L' ';
        }
        cmdline += quoteArg(widen(arg));
    }
    return runCommandLine(std::move(cmdline), describeCommand(argv));
}

AgentResult<int> runProcess(const std::filesystem::path& program,
                            const std::vector<std::string>& args) {
    if (program.empty()) {
        return AgentResult<int>::err(
            AgentError(ErrorCode::InvalidArgument, "empty program path"));
    }

    std::wstring cmdline = quoteArg(program.native());
    std::vector<std::string> described{narrow(program.native())};
    for (const auto& arg : args) {
        cmdline += L' ';
        cmdline += quoteArg(widen(arg));
        described.push_back(arg);
    }
    return runCommandLine(std::move(cmdline), describeCommand(described));
}

AgentResult<std::filesystem::path> currentExecutablePath() {
    std::wstring buf(MAX_PATH, L'\0');
    for (;;) {
        DWORD len = GetModuleFileNameW(nullptr, buf.data(), static_cast<DWORD>(buf.size()));
        if (len == 0) {
            return AgentResult<std::filesystem::path>::err(AgentError(
                ErrorCode::ExecutablePathUnavailable,
                "GetModuleFileNameW failed: error " + std::to_string(GetLastError())));
        }
        if (len < buf.size()) {
            buf.resize(len);
            return AgentResult<std::filesystem::path>::ok(std::filesystem::path(buf));
        }
        buf.resize(buf.size() * 2);
    }
}

#else

AgentResult<int> runProcess(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return AgentResult<int>::err(
            AgentError(ErrorCode::InvalidArgument, "empty command line"));
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cargv.push_back(const_cast<char*>(arg.c_str()));  // NOLINT(cppcoreguidelines-pro-type-const-cast)
    }
    cargv.push_back(nullptr);

    pid_t pid = 0;
    int rc = posix_spawnp(&pid, cargv[0], nullptr, nullptr, cargv.data(), environ);
    if (rc != 0) {
        return AgentResult<int>::err(AgentError(
            ErrorCode::ProcessSpawnFailed,
            "failed to start '" + describeCommand(argv) + "': " + std::strerror(rc)));
    }

    int status = 0;
    for (;;) {
        if (waitpid(pid, &status, 0) >= 0) {
            break;
        }
        if (errno != EINTR) {
            return AgentResult<int>::err(AgentError(
                ErrorCode::ProcessWaitFailed,
                "waitpid failed for '" + describeCommand(argv) + "': " +
                    std::strerror(errno)));
        }
    }

    if (WIFEXITED(status)) {
        return AgentResult<int>::ok(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return AgentResult<int>::err(AgentError(
            ErrorCode::ProcessSignaled,
            "'" + describeCommand(argv) + "' terminated by signal " +
                std::to_string(WTERMSIG(status)),
            WTERMSIG(status)));
    }
    return AgentResult<int>::err(AgentError(
        ErrorCode::ProcessWaitFailed,
        "'" + describeCommand(argv) + "' ended in an unexpected state"));
}

AgentResult<int> runProcess(const std::filesystem::path& program,
                            const std::vector<std::string>& args) {
    if (program.empty()) {
        return AgentResult<int>::err(
            AgentError(ErrorCode::InvalidArgument, "empty program path"));
    }

    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(program.native());
    argv.insert(argv.end(), args.begin(), args.end());
    return runProcess(argv);
}

AgentResult<std::filesystem::path> currentExecutablePath() {
    std::error_code ec;
    auto path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return AgentResult<std::filesystem::path>::err(AgentError(
            ErrorCode::ExecutablePathUnavailable,
            "cannot resolve /proc/self/exe: " + ec.message()));
    }
    return AgentResult<std::filesystem::path>::ok(path);
}

#endif

} // namespace gsa::foundation
