// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "nvcheckup/collector.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <thread>

#ifdef _WIN32
#include <cstdlib>
#else
#include <cerrno>
#include <fcntl.h>
#include <signal.h>
#include <sys/select.h>
#include <sys/utsname.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace nvcheckup {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

std::vector<std::string> splitFields(const std::string& line, const std::string& sep) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        size_t pos = line.find(sep, start);
        if (pos == std::string::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, pos - start));
        start = pos + sep.size();
    }
    return fields;
}

/// Whole-string integer parse; anything else (e.g. "[N/A]") yields fallback.
int64_t parseIntOr(const std::string& text, int64_t fallback) {
    std::string s = trim(text);
    int64_t value = 0;
    const char* first = s.data();
    const char* last = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (s.empty() || ec != std::errc() || ptr != last) {
        return fallback;
    }
    return value;
}

#if !defined(_WIN32) && !defined(__APPLE__)
std::string readFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) return "";
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}
#endif

std::string orUnknown(const std::string& value) {
    std::string t = trim(value);
    return t.empty() ? "unknown" : t;
}

} // namespace

// ---- runCommand ----

#ifdef _WIN32

// _popen offers no way to bound the child's runtime; the timeout is not
// enforced on Windows.
CommandResult runCommand(const std::string& program,
                         const std::vector<std::string>& args,
                         int /*timeoutSec*/,
                         bool debug) {
    std::string cmdLine = program;
    for (const auto& arg : args) {
        cmdLine += " \"" + arg + "\"";
    }
    cmdLine += " 2>NUL";

    if (debug) {
        std::cerr << "[EXEC] " << cmdLine << std::endl;
    }

    CommandResult result;
    FILE* pipe = _popen(cmdLine.c_str(), "r");
    if (!pipe) {
        return result;
    }

    std::array<char, 4096> buffer;
    std::string output;
    while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr) {
        output += buffer.data();
    }

    result.exitCode = _pclose(pipe);
    // cmd.exe reports an unknown program as exit code 9009.
    result.launched = result.exitCode != 9009;
    result.stdoutText = trim(output);
    return result;
}

#else // POSIX

namespace {

void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

struct ChildProcess {
    pid_t pid = -1;
    int stdoutFd = -1;
    int stderrFd = -1;
    bool running = false;

    ~ChildProcess() {
        closeFd(stdoutFd);
        closeFd(stderrFd);
        if (running) terminate();
    }

    /// Fork and exec. Returns 0 on success, or the errno of the failed
    /// pipe/fork/exec. Exec failures are reported back through a
    /// close-on-exec pipe so a missing program is not mistaken for exit 127.
    int launch(const std::string& program, const std::vector<std::string>& args) {
        std::vector<char*> argv;
        argv.push_back(const_cast<char*>(program.c_str()));
        for (const auto& arg : args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        int outPipe[2], errPipe[2], execPipe[2];
        if (pipe(outPipe) != 0) return errno;
        if (pipe(errPipe) != 0) {
            int err = errno;
            close(outPipe[0]); close(outPipe[1]);
            return err;
        }
        if (pipe(execPipe) != 0) {
            int err = errno;
            close(outPipe[0]); close(outPipe[1]);
            close(errPipe[0]); close(errPipe[1]);
            return err;
        }
        fcntl(execPipe[1], F_SETFD, FD_CLOEXEC);

        pid = fork();
        if (pid < 0) {
            int err = errno;
            close(outPipe[0]); close(outPipe[1]);
            close(errPipe[0]); close(errPipe[1]);
            close(execPipe[0]); close(execPipe[1]);
            return err;
        }

        if (pid == 0) {
            // Child
            int devNull = open("/dev/null", O_RDONLY);
            if (devNull >= 0) {
                dup2(devNull, STDIN_FILENO);
                close(devNull);
            }
            dup2(outPipe[1], STDOUT_FILENO);
            dup2(errPipe[1], STDERR_FILENO);
            close(outPipe[0]); close(outPipe[1]);
            close(errPipe[0]); close(errPipe[1]);
            close(execPipe[0]);

            execvp(program.c_str(), argv.data());
            int err = errno;
            ssize_t written = write(execPipe[1], &err, sizeof(err));
            (void)written;
            _exit(127);
        }

        // Parent
        close(outPipe[1]);
        close(errPipe[1]);
        close(execPipe[1]);
        stdoutFd = outPipe[0];
        stderrFd = errPipe[0];
        running = true;

        int execErr = 0;
        ssize_t n;
        do {
            n = read(execPipe[0], &execErr, sizeof(execErr));
        } while (n < 0 && errno == EINTR);
        close(execPipe[0]);

        if (n == static_cast<ssize_t>(sizeof(execErr))) {
            wait();
            return execErr;
        }
        return 0;
    }

    /// Read stdout and stderr until both close.
    /// @return false if the deadline passed first or select() failed.
    bool drain(std::string& out, std::string& err, std::chrono::seconds timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;

        while (stdoutFd >= 0 || stderrFd >= 0) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) return false;
            auto remaining = std::chrono::duration_cast<std::chrono::microseconds>(
                deadline - now).count();

            fd_set readfds;
            FD_ZERO(&readfds);
            int maxFd = -1;
            if (stdoutFd >= 0) { FD_SET(stdoutFd, &readfds); maxFd = std::max(maxFd, stdoutFd); }
            if (stderrFd >= 0) { FD_SET(stderrFd, &readfds); maxFd = std::max(maxFd, stderrFd); }

            struct timeval tv;
            tv.tv_sec  = remaining / 1000000;
            tv.tv_usec = remaining % 1000000;

            int ret = select(maxFd + 1, &readfds, nullptr, nullptr, &tv);
            if (ret < 0) {
                if (errno == EINTR) continue;
                return false; // unexpected select error; caller terminates the child
            }
            if (ret == 0) return false;

            readChunk(stdoutFd, readfds, out);
            readChunk(stderrFd, readfds, err);
        }
        return true;
    }

    /// Reap the child. Returns its exit status (128 + signal if killed).
    int wait() {
        int status = 0;
        pid_t r;
        do {
            r = waitpid(pid, &status, 0);
        } while (r < 0 && errno == EINTR);
        running = false;
        if (r < 0) return -1;
        if (WIFEXITED(status)) return WEXITSTATUS(status);
        if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
        return -1;
    }

    void terminate() {
        kill(pid, SIGTERM);
        int status;
        // Wait up to 1 second
        for (int i = 0; i < 10; ++i) {
            if (waitpid(pid, &status, WNOHANG) != 0) {
                running = false;
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        kill(pid, SIGKILL);
        waitpid(pid, &status, 0);
        running = false;
    }

private:
    static void readChunk(int& fd, const fd_set& readfds, std::string& sink) {
        if (fd < 0 || !FD_ISSET(fd, &readfds)) return;
        std::array<char, 4096> buffer;
        ssize_t n = read(fd, buffer.data(), buffer.size());
        if (n > 0) {
            sink.append(buffer.data(), static_cast<size_t>(n));
        } else if (n == 0 || errno != EINTR) {
            closeFd(fd);
        }
    }
};

} // namespace

CommandResult runCommand(const std::string& program,
                         const std::vector<std::string>& args,
                         int timeoutSec,
                         bool debug) {
    if (debug) {
        std::string cmdLine = program;
        for (const auto& arg : args) cmdLine += " " + arg;
        std::cerr << "[EXEC] " << cmdLine << std::endl;
    }

    CommandResult result;
    ChildProcess child;
    int launchErr = child.launch(program, args);
    if (launchErr != 0) {
        if (debug) {
            std::cerr << "[EXEC] Failed to start " << program << ": "
                      << std::strerror(launchErr) << std::endl;
        }
        return result;
    }
    result.launched = true;

    std::string out;
    std::string err;
    if (!child.drain(out, err, std::chrono::seconds(timeoutSec))) {
        child.terminate();
        result.timedOut = true;
        if (debug) {
            std::cerr << "[EXEC] " << program << " timed out after "
                      << timeoutSec << "s" << std::endl;
        }
    } else {
        result.exitCode = child.wait();
    }

    result.stdoutText = trim(out);
    result.stderrText = trim(err);

    if (debug && !result.timedOut) {
        std::cerr << "[EXEC] " << program << " exited with " << result.exitCode << std::endl;
    }
    return result;
}

#endif

// ---- Parsers ----

std::vector<GpuInfo> parseGpuQueryOutput(const std::string& output) {
    std::vector<GpuInfo> gpus;
    for (const auto& line : splitLines(output)) {
        std::vector<std::string> fields = splitFields(line, ", ");
        if (fields.size() < 5) continue;

        GpuInfo gpu;
        gpu.index = static_cast<int>(parseIntOr(fields[0], 0));
        gpu.name = trim(fields[1]);
        gpu.vendor = "NVIDIA";
        gpu.driverVersion = trim(fields[2]);
        gpu.vramTotalMb = parseIntOr(fields[3], 0);
        gpu.temperatureC = static_cast<int>(parseIntOr(fields[4], 0));
        gpu.isNvidia = true;
        gpus.push_back(std::move(gpu));
    }
    return gpus;
}

std::string parseCudaVersion(const std::string& banner) {
    static const std::string kMarker = "CUDA Version:";
    size_t pos = banner.find(kMarker);
    if (pos == std::string::npos) return "";

    size_t i = pos + kMarker.size();
    while (i < banner.size() && banner[i] == ' ') ++i;

    std::string version;
    while (i < banner.size() &&
           (std::isdigit(static_cast<unsigned char>(banner[i])) || banner[i] == '.')) {
        version += banner[i++];
    }
    return version;
}

std::string parseCpuModel(const std::string& cpuinfo) {
    for (const auto& line : splitLines(cpuinfo)) {
        if (line.rfind("model name", 0) != 0) continue;
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        return trim(line.substr(colon + 1));
    }
    return "";
}

int64_t parseMemTotalMb(const std::string& meminfo) {
    for (const auto& line : splitLines(meminfo)) {
        if (line.rfind("MemTotal:", 0) != 0) continue;
        std::string rest = trim(line.substr(9));
        size_t space = rest.find(' ');
        int64_t kb = parseIntOr(rest.substr(0, space), 0);
        return kb / 1024;
    }
    return 0;
}

// ---- Collection ----

SystemInfo collectSystemInfo(const CollectorOptions& options) {
    SystemInfo info;
    info.osName = currentPlatform();

#ifdef _WIN32
    auto ver = runCommand("cmd", {"/c", "ver"}, options.timeoutSec, options.debug);
    info.osVersion = orUnknown(ver.ok() ? ver.stdoutText : "");

    const char* arch = std::getenv("PROCESSOR_ARCHITECTURE");
    info.architecture = orUnknown(arch ? arch : "");

    auto cpu = runCommand("powershell",
        {"-NoProfile", "-Command", "(Get-CimInstance Win32_Processor).Name"},
        options.timeoutSec, options.debug);
    info.cpuModel = orUnknown(cpu.ok() ? cpu.stdoutText : "");

    auto host = runCommand("hostname", {}, options.timeoutSec, options.debug);
    info.hostname = orUnknown(host.ok() ? host.stdoutText : "");

    auto mem = runCommand("powershell",
        {"-NoProfile", "-Command", "(Get-CimInstance Win32_ComputerSystem).TotalPhysicalMemory"},
        options.timeoutSec, options.debug);
    if (mem.ok()) {
        info.ramTotalMb = parseIntOr(mem.stdoutText, 0) / (1024 * 1024);
    }
#else
    struct utsname uts;
    if (uname(&uts) == 0) {
        info.osVersion = orUnknown(uts.release);
        info.architecture = orUnknown(uts.machine);
        info.hostname = orUnknown(uts.nodename);
    } else {
        info.osVersion = info.architecture = info.hostname = "unknown";
    }

#if defined(__APPLE__)
    auto cpu = runCommand("sysctl", {"-n", "machdep.cpu.brand_string"},
                          options.timeoutSec, options.debug);
    info.cpuModel = orUnknown(cpu.ok() ? cpu.stdoutText : "");
    auto mem = runCommand("sysctl", {"-n", "hw.memsize"}, options.timeoutSec, options.debug);
    if (mem.ok()) {
        info.ramTotalMb = parseIntOr(mem.stdoutText, 0) / (1024 * 1024);
    }
#else
    info.cpuModel = orUnknown(parseCpuModel(readFile("/proc/cpuinfo")));
    info.ramTotalMb = parseMemTotalMb(readFile("/proc/meminfo"));
#endif
#endif

    return info;
}

GpuCollection collectGpuInfo(const CollectorOptions& options) {
    GpuCollection collection;

    auto query = runCommand("nvidia-smi",
        {"--query-gpu=index,name,driver_version,memory.total,temperature.gpu",
         "--format=csv,noheader,nounits"},
        options.timeoutSec, options.debug);
    if (query.ok()) {
        collection.gpus = parseGpuQueryOutput(query.stdoutText);
    }

    for (const auto& gpu : collection.gpus) {
        if (!gpu.driverVersion.empty()) {
            collection.driver.version = gpu.driverVersion;
            break;
        }
    }

    // The plain nvidia-smi banner carries "CUDA Version: 12.x".
    auto banner = runCommand("nvidia-smi", {}, options.timeoutSec, options.debug);
    if (banner.ok()) {
        collection.driver.cudaVersion = parseCudaVersion(banner.stdoutText);
    }

    return collection;
}

FactSnapshot collectFacts(const CollectorOptions& options) {
    FactSnapshot facts;
    facts.system = collectSystemInfo(options);
    GpuCollection gpu = collectGpuInfo(options);
    facts.gpus = std::move(gpu.gpus);
    facts.driver = std::move(gpu.driver);
    return facts;
}

} // namespace nvcheckup
