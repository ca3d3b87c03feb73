/*  This file is part of PKDGRAV3 (http://www.pkdgrav.org/).
 *  Copyright (c) 2001-2018 Joachim Stadel & Douglas Potter
 *
 *  PKDGRAV3 is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 3 of the License, or
 *  (at your option) any later version.
 *
 *  PKDGRAV3 is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with PKDGRAV3.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "mdlbase.h"
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <mutex>
#include <string>
#include <unistd.h>
#include "fmt/format.h"
#ifdef USE_BT
#include <execinfo.h>
#include <boost/core/demangle.hpp>
#endif

namespace {
std::mutex backtrace_mutex;

#ifdef USE_BT
// backtrace_symbols() gives "module(mangled+offset) [address]"
std::string demangle_frame(const char *frame) {
    std::string s(frame);
    auto open = s.find('(');
    if (open == std::string::npos) return s;
    auto plus = s.find('+',open);
    if (plus == std::string::npos || plus == open+1) return s;
    auto name = s.substr(open+1,plus-open-1);
    return s.substr(0,open+1) + boost::core::demangle(name.c_str()) + s.substr(plus);
}
#endif

void on_terminate() {
    {
        std::lock_guard<std::mutex> lock(backtrace_mutex);
        if (auto eptr = std::current_exception()) {
            try {
                std::rethrow_exception(eptr);
            }
            catch (const std::exception &e) {
                fmt::print(stderr,"terminate: uncaught exception: {}\n",e.what());
            }
            catch (...) {
                fmt::print(stderr,"terminate: uncaught exception of unknown type\n");
            }
        }
    }
    mdl::show_backtrace(1);
    std::_Exit(EXIT_FAILURE);
}

// SA_RESETHAND restores the default action, so returning re-raises the signal
void on_signal(int signo, siginfo_t *si, void *) {
    fflush(stdout);
    fsync(fileno(stdout));
    fmt::print(stderr,"signal {} ({}) at {}\n",signo,strsignal(signo),si->si_addr);
    mdl::show_backtrace(1);
}
} // namespace

void mdl::register_backtrace() {
    std::set_terminate(on_terminate);

    struct sigaction sa;
    sa.sa_flags = SA_SIGINFO | SA_RESETHAND;
    sigemptyset(&sa.sa_mask);
    sa.sa_sigaction = on_signal;
    for (auto signo : {SIGBUS, SIGILL, SIGSEGV, SIGFPE}) {
        if (sigaction(signo, &sa, nullptr) == -1)
            fmt::print(stderr,"unable to install a handler for signal {}\n",signo);
    }
}

void mdl::show_backtrace(int skip) {
#ifdef USE_BT
    std::lock_guard<std::mutex> lock(backtrace_mutex);
    void *stack[64];
    int n = ::backtrace(stack, sizeof stack / sizeof *stack);
    auto frames = backtrace_symbols(stack, n);
    if (frames == nullptr) return;
    fmt::print(stderr,"backtrace ({} frames):\n",n-skip-1);
    for (int i=skip+1; i < n; ++i)
        fmt::print(stderr,"{:3}: {}\n",i-skip-1,demangle_frame(frames[i]));
    free(frames);
#endif
    fflush(stderr);
}
