#include "cli/interrupt.hpp"

#include <atomic>
#include <signal.h>

namespace filewarden {
namespace interrupt {

namespace {
std::atomic<bool> g_interrupted{false};

void handle_sigint(int)
{
    g_interrupted.store(true, std::memory_order_relaxed);
}
} // namespace

bool install_handler()
{
    struct sigaction action {};
    action.sa_handler = handle_sigint;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    return sigaction(SIGINT, &action, nullptr) == 0;
}

bool requested()
{
    return g_interrupted.load(std::memory_order_relaxed);
}

void set()
{
    g_interrupted.store(true, std::memory_order_relaxed);
}

void clear()
{
    g_interrupted.store(false, std::memory_order_relaxed);
}

} // namespace interrupt
} // namespace filewarden
